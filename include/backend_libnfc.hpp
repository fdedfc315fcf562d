#pragma once

#include "card_backend.hpp"
#include "card_cache.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

/// Runtime options for LibnfcBackend
struct LibnfcConfig {
    std::string connstring;   // empty = first device libnfc finds
    int max_targets = 8;      // targets listed per sense()
};

/// libnfc-based backend for NFC Forum Type 2 tags (NTAG21x, Ultralight) on
/// PN53x, ACR122U and other libnfc-supported readers.
///
/// Tag layout from page 4: 2-byte big-endian payload length, then the
/// encoded card, zero padded to a whole page.
class LibnfcBackend : public CardBackend {
public:
    explicit LibnfcBackend(LibnfcConfig config = LibnfcConfig());
    ~LibnfcBackend() override;

    /// Open the NFC device in initiator mode (sense() does this on demand)
    void open();

    /// Close NFC connection
    void close();

    bool is_open() const { return nfc_device_ != nullptr; }
    bool has_context() const { return nfc_context_ != nullptr; }

    const Card& read(uint16_t card_id) override;
    Card& read_mutable(uint16_t card_id) override;
    void release(uint16_t card_id) override;
    void write(const Card& card, const std::vector<uint8_t>& data) override;
    void sense() override;
    std::vector<uint16_t> present() const override;

    static constexpr int PAGE_SIZE = 4;
    static constexpr int FIRST_USER_PAGE = 4;
    /// NTAG213 user area (pages 4..39), the smallest common Type 2 tag
    static constexpr int USER_PAGES = 36;
    static constexpr size_t MAX_PAYLOAD = USER_PAGES * PAGE_SIZE - 2;

private:
    // Tag I/O on the currently selected target
    bool select_target(const std::vector<uint8_t>& uid);
    std::array<uint8_t, 16> read_pages(uint8_t page);
    void write_page(uint8_t page, const uint8_t* data);
    std::vector<uint8_t> read_payload();

    LibnfcConfig config_;
    void* nfc_context_ = nullptr;   // nfc_context*
    void* nfc_device_ = nullptr;    // nfc_device*

    CardCache cache_;
};

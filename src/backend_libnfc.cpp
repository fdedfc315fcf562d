#include "backend_libnfc.hpp"

#include <nfc/nfc.h>
#include <nfc/nfc-types.h>

#include <algorithm>
#include <iostream>
#include <sstream>
#include <utility>

// Type 2 tag commands
static const uint8_t T2T_READ  = 0x30;
static const uint8_t T2T_WRITE = 0xA2;

static const int TRANSCEIVE_TIMEOUT_MS = 5000;

namespace {

/// Deselects the current target when it goes out of scope
struct SelectedTarget {
    nfc_device* device;
    ~SelectedTarget() { nfc_initiator_deselect_target(device); }
};

std::string describe_uid(const std::vector<uint8_t>& uid) {
    return "UID " + hex_string(uid);
}

}

LibnfcBackend::LibnfcBackend(LibnfcConfig config)
    : config_(std::move(config)) {}

LibnfcBackend::~LibnfcBackend() {
    close();
}

void LibnfcBackend::open() {
    if (nfc_device_) return;

    nfc_context* context = nullptr;
    nfc_init(&context);
    if (!context) {
        throw KernelError::read("Failed to initialize libnfc", KERNEL_DEVICE_UNAVAILABLE);
    }
    nfc_context_ = context;

    const char* connstring = config_.connstring.empty() ? nullptr : config_.connstring.c_str();
    nfc_device* device = nfc_open(context, connstring);
    if (!device) {
        close();
        throw KernelError::read(
            "Failed to open NFC device. libnfc-supported reader required "
            "(e.g. PN532, ACR122U)", KERNEL_DEVICE_UNAVAILABLE);
    }
    nfc_device_ = device;

    if (nfc_initiator_init(device) < 0) {
        std::string reason = nfc_strerror(device);
        close();
        throw KernelError::read("Failed to initialize NFC initiator mode: " + reason,
                                KERNEL_DEVICE_UNAVAILABLE);
    }
    nfc_device_set_property_bool(device, NP_EASY_FRAMING, true);

    std::cout << "NFC reader opened: " << nfc_device_get_name(device) << std::endl;
}

void LibnfcBackend::close() {
    if (nfc_device_) {
        nfc_close(static_cast<nfc_device*>(nfc_device_));
        nfc_device_ = nullptr;
    }
    if (nfc_context_) {
        nfc_exit(static_cast<nfc_context*>(nfc_context_));
        nfc_context_ = nullptr;
    }
}

//--- Tag I/O ---

bool LibnfcBackend::select_target(const std::vector<uint8_t>& uid) {
    nfc_modulation nm;
    nm.nmt = NMT_ISO14443A;
    nm.nbr = NBR_106;

    nfc_target target;
    int res = nfc_initiator_select_passive_target(static_cast<nfc_device*>(nfc_device_), nm,
                                                  uid.data(), uid.size(), &target);
    return res > 0;
}

std::array<uint8_t, 16> LibnfcBackend::read_pages(uint8_t page) {
    nfc_device* device = static_cast<nfc_device*>(nfc_device_);

    const uint8_t tx[] = {T2T_READ, page};
    std::array<uint8_t, 16> rx{};
    int rx_len = nfc_initiator_transceive_bytes(device, tx, sizeof(tx),
                                                rx.data(), rx.size(), TRANSCEIVE_TIMEOUT_MS);
    if (rx_len < (int)rx.size()) {
        std::ostringstream oss;
        oss << "READ of page " << (int)page << " failed: "
            << (rx_len < 0 ? nfc_strerror(device) : "short response");
        throw KernelError::read(oss.str(), KERNEL_TRANSCEIVE_FAILED);
    }
    return rx;
}

void LibnfcBackend::write_page(uint8_t page, const uint8_t* data) {
    nfc_device* device = static_cast<nfc_device*>(nfc_device_);

    uint8_t tx[2 + PAGE_SIZE] = {T2T_WRITE, page};
    std::copy(data, data + PAGE_SIZE, tx + 2);

    uint8_t rx[4];
    int res = nfc_initiator_transceive_bytes(device, tx, sizeof(tx), rx, sizeof(rx),
                                             TRANSCEIVE_TIMEOUT_MS);
    if (res < 0) {
        std::ostringstream oss;
        oss << "WRITE of page " << (int)page << " failed: " << nfc_strerror(device);
        throw KernelError::write(oss.str(), KERNEL_TRANSCEIVE_FAILED);
    }
}

std::vector<uint8_t> LibnfcBackend::read_payload() {
    // One READ returns four pages
    auto chunk = read_pages(FIRST_USER_PAGE);
    size_t length = (chunk[0] << 8) | chunk[1];
    check_payload_size(length, MAX_PAYLOAD, KernelError::Kind::Read);

    std::vector<uint8_t> raw(chunk.begin(), chunk.end());
    uint8_t page = FIRST_USER_PAGE + 4;
    while (raw.size() < length + 2) {
        chunk = read_pages(page);
        raw.insert(raw.end(), chunk.begin(), chunk.end());
        page += 4;
    }
    return std::vector<uint8_t>(raw.begin() + 2, raw.begin() + 2 + length);
}

//--- Cache and leases ---

const Card& LibnfcBackend::read(uint16_t card_id) {
    return cache_.read(card_id);
}

Card& LibnfcBackend::read_mutable(uint16_t card_id) {
    return cache_.read_mutable(card_id);
}

void LibnfcBackend::release(uint16_t card_id) {
    cache_.release(card_id);
}

void LibnfcBackend::write(const Card& card, const std::vector<uint8_t>& data) {
    cache_.ensure_not_leased(card.id(), KernelError::Kind::Write);
    check_payload_size(data.size(), MAX_PAYLOAD, KernelError::Kind::Write);
    const std::vector<uint8_t> uid = cache_.lookup(card.id(), KernelError::Kind::Write).uid;
    if (!nfc_device_) {
        throw KernelError::write("NFC device is not open", KERNEL_DEVICE_UNAVAILABLE);
    }

    nfc_device* device = static_cast<nfc_device*>(nfc_device_);
    if (!select_target(uid)) {
        throw KernelError::write("Card " + std::to_string(card.id()) + " left the field",
                                 KERNEL_CARD_ABSENT);
    }
    SelectedTarget selected{device};

    // Length prefix + payload, padded to whole pages
    std::vector<uint8_t> image;
    image.push_back(static_cast<uint8_t>(data.size() >> 8));
    image.push_back(static_cast<uint8_t>(data.size() & 0xFF));
    image.insert(image.end(), data.begin(), data.end());
    while (image.size() % PAGE_SIZE != 0) image.push_back(0x00);

    for (size_t offset = 0; offset < image.size(); offset += PAGE_SIZE) {
        write_page(static_cast<uint8_t>(FIRST_USER_PAGE + offset / PAGE_SIZE), image.data() + offset);
    }

    // Refresh the cache from what the tag now holds
    std::vector<uint8_t> stored;
    try {
        stored = read_payload();
    } catch (const KernelError& e) {
        throw KernelError::write(std::string("Verification read failed: ") + e.message(), e.code());
    }
    cache_.erase(card.id());
    try {
        cache_.store(Card::decode(stored), uid);
    } catch (const ConversionError& e) {
        std::cerr << "Tag " << describe_uid(uid) << " no longer holds a card: " << e.message() << std::endl;
    }
}

void LibnfcBackend::sense() {
    if (!nfc_device_) {
        try {
            open();
        } catch (const KernelError& e) {
            std::cerr << "Card sense skipped: " << e.what() << std::endl;
            return;
        }
    }
    nfc_device* device = static_cast<nfc_device*>(nfc_device_);

    nfc_modulation nm;
    nm.nmt = NMT_ISO14443A;
    nm.nbr = NBR_106;

    std::vector<nfc_target> targets(config_.max_targets > 0 ? config_.max_targets : 1);
    int found = nfc_initiator_list_passive_targets(device, nm, targets.data(), targets.size());
    if (found < 0) {
        std::cerr << "Target listing failed: " << nfc_strerror(device) << std::endl;
        return;
    }

    cache_.prune();

    for (int i = 0; i < found; i++) {
        const nfc_iso14443a_info& info = targets[i].nti.nai;
        std::vector<uint8_t> uid(info.abtUid, info.abtUid + info.szUidLen);

        // SAK 0x00: Ultralight / NTAG family
        if (info.btSak != 0x00) {
            std::cout << "Skipping tag " << describe_uid(uid) << ": not a Type 2 tag" << std::endl;
            continue;
        }
        if (!select_target(uid)) {
            std::cerr << "Tag " << describe_uid(uid) << " left the field" << std::endl;
            continue;
        }
        SelectedTarget selected{device};

        try {
            cache_.store(Card::decode(read_payload()), uid);
        } catch (const KernelError& e) {
            std::cerr << "Tag " << describe_uid(uid) << ": " << e.what() << std::endl;
        } catch (const ConversionError& e) {
            std::cerr << "Tag " << describe_uid(uid) << " has no card payload: " << e.message()
                      << " [" << hex_string(e.bytes()) << "]" << std::endl;
        }
    }
}

std::vector<uint16_t> LibnfcBackend::present() const {
    return cache_.present();
}

// Factory function for libnfc backend
#ifdef CARD_BACKEND_LIBNFC
std::unique_ptr<CardBackend> create_card_backend() {
    return std::make_unique<LibnfcBackend>();
}
#endif

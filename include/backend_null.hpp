#pragma once

#include "card_backend.hpp"

/// Reference backend for tests and machines without a reader.
/// Every card operation fails with KERNEL_NOT_IMPLEMENTED; sense() finds nothing.
class NullBackend : public CardBackend {
public:
    const Card& read(uint16_t card_id) override;
    Card& read_mutable(uint16_t card_id) override;
    void release(uint16_t card_id) override;
    void write(const Card& card, const std::vector<uint8_t>& data) override;
    void sense() override;
    std::vector<uint16_t> present() const override;
};

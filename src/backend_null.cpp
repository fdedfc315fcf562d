#include "backend_null.hpp"

#include <string>

const Card& NullBackend::read(uint16_t card_id) {
    throw KernelError::read("NullBackend cannot read card " + std::to_string(card_id) +
                            ": no hardware attached", KERNEL_NOT_IMPLEMENTED);
}

Card& NullBackend::read_mutable(uint16_t card_id) {
    throw KernelError::read("NullBackend cannot read card " + std::to_string(card_id) +
                            " for mutation: no hardware attached", KERNEL_NOT_IMPLEMENTED);
}

void NullBackend::release(uint16_t) {}

void NullBackend::write(const Card& card, const std::vector<uint8_t>& data) {
    throw KernelError::write("NullBackend cannot write " + std::to_string(data.size()) +
                             " bytes to card " + std::to_string(card.id()) +
                             ": no hardware attached", KERNEL_NOT_IMPLEMENTED);
}

void NullBackend::sense() {}

std::vector<uint16_t> NullBackend::present() const {
    return {};
}

// Factory function for builds without a reader
#ifdef CARD_BACKEND_NONE
std::unique_ptr<CardBackend> create_card_backend() {
    return std::make_unique<NullBackend>();
}
#endif

#include "card_backend.hpp"

CardLease::CardLease(CardBackend& backend, uint16_t card_id)
    : backend_(backend), card_id_(card_id), card_(&backend.read_mutable(card_id)) {}

CardLease::~CardLease() {
    backend_.release(card_id_);
}

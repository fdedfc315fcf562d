#include "card_cache.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <utility>

CardCache::Entry& CardCache::lookup(uint16_t card_id, KernelError::Kind kind) {
    auto it = entries_.find(card_id);
    if (it == entries_.end()) {
        throw KernelError(kind, "Card " + std::to_string(card_id) + " is not in range",
                          KERNEL_CARD_ABSENT);
    }
    return it->second;
}

void CardCache::ensure_not_leased(uint16_t card_id, KernelError::Kind kind) const {
    if (is_leased(card_id)) {
        throw KernelError(kind, "Card " + std::to_string(card_id) + " is leased for mutation",
                          KERNEL_CARD_BUSY);
    }
}

const Card& CardCache::read(uint16_t card_id) {
    ensure_not_leased(card_id, KernelError::Kind::Read);
    return lookup(card_id, KernelError::Kind::Read).card;
}

Card& CardCache::read_mutable(uint16_t card_id) {
    ensure_not_leased(card_id, KernelError::Kind::Read);
    Entry& entry = lookup(card_id, KernelError::Kind::Read);
    leased_.insert(card_id);
    return entry.card;
}

void CardCache::release(uint16_t card_id) {
    if (!leased_.erase(card_id)) return;

    // The holder may have replaced the card with one under another id
    auto it = entries_.find(card_id);
    if (it == entries_.end() || it->second.card.id() == card_id) return;

    Entry entry = std::move(it->second);
    entries_.erase(it);
    const uint16_t new_id = entry.card.id();
    auto existing = entries_.find(new_id);
    if (existing != entries_.end()) {
        std::cerr << "Card id " << new_id << " already cached for UID " << hex_string(existing->second.uid)
                  << ", replacing it with UID " << hex_string(entry.uid) << std::endl;
    }
    entries_[new_id] = std::move(entry);
}

bool CardCache::store(const Card& card, std::vector<uint8_t> uid) {
    if (is_leased(card.id())) {
        std::cout << "Card " << card.id() << " is leased, keeping its current state" << std::endl;
        return false;
    }
    auto it = entries_.find(card.id());
    if (it != entries_.end()) {
        std::cerr << "Card id " << card.id() << " present on several tags, using UID "
                  << hex_string(uid) << std::endl;
    }
    entries_[card.id()] = Entry{card, std::move(uid)};
    return true;
}

void CardCache::erase(uint16_t card_id) {
    entries_.erase(card_id);
}

void CardCache::prune() {
    // Leased entries are referenced by their holders and must stay put
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (is_leased(it->first)) {
            ++it;
        } else {
            it = entries_.erase(it);
        }
    }
}

std::vector<uint16_t> CardCache::present() const {
    std::vector<uint16_t> ids;
    for (const auto& entry : entries_) {
        ids.push_back(entry.first);
    }
    return ids;
}

void check_payload_size(size_t size, size_t max_size, KernelError::Kind kind) {
    if (size > max_size) {
        std::ostringstream oss;
        oss << "Payload of " << size << " bytes exceeds tag user area (" << max_size << " bytes)";
        throw KernelError(kind, oss.str(), KERNEL_PAYLOAD_TOO_LARGE);
    }
}

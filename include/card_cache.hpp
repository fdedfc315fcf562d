#pragma once

#include "card.hpp"
#include "errors.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <vector>

/// Cards found by a backend's last sense(), keyed by id, with the
/// read_mutable lease bookkeeping shared by hardware backends.
/// References handed out stay valid until the entry is pruned or erased.
class CardCache {
public:
    struct Entry {
        Card card;
        std::vector<uint8_t> uid;   // tag the card was read from
    };

    /// Throws KERNEL_CARD_ABSENT if the id is not cached
    Entry& lookup(uint16_t card_id, KernelError::Kind kind);

    /// Throws KERNEL_CARD_BUSY while the id is leased
    void ensure_not_leased(uint16_t card_id, KernelError::Kind kind) const;

    const Card& read(uint16_t card_id);
    Card& read_mutable(uint16_t card_id);

    /// Ends a lease; re-keys the entry if the holder changed the card id
    void release(uint16_t card_id);

    /// Cache a sensed card. Returns false (and keeps the current state) if
    /// the id is leased.
    bool store(const Card& card, std::vector<uint8_t> uid);

    void erase(uint16_t card_id);

    /// Drop every entry that is not leased, ahead of a new sense
    void prune();

    bool is_leased(uint16_t card_id) const { return leased_.count(card_id) != 0; }
    bool contains(uint16_t card_id) const { return entries_.count(card_id) != 0; }
    size_t size() const { return entries_.size(); }

    /// Cached ids, ascending
    std::vector<uint16_t> present() const;

private:
    std::map<uint16_t, Entry> entries_;
    std::set<uint16_t> leased_;
};

/// Throws KERNEL_PAYLOAD_TOO_LARGE when size exceeds max_size
void check_payload_size(size_t size, size_t max_size, KernelError::Kind kind);

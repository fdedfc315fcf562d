#pragma once

#include "card.hpp"
#include "card_backend.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <vector>

/// In-memory store of cards keyed by id, bound to one hardware backend.
/// The registry never talks to the backend itself; callers bridge
/// sense/read on the backend to put/get here.
class CardRegistry {
public:
    /// Empty registry on top of NullBackend
    CardRegistry();
    explicit CardRegistry(std::unique_ptr<CardBackend> backend);

    /// Insert or replace the entry for card.id() (last write wins)
    void put(const Card& card);

    /// nullptr if absent. Valid until the entry is replaced or unbound.
    const Card* get(uint16_t card_id) const;

    /// Remove and return the entry, if present
    std::optional<Card> unbind(uint16_t card_id);

    bool contains(uint16_t card_id) const;

    /// Snapshot of every card, sorted by id
    std::vector<Card> cards() const;

    size_t size() const { return cards_.size(); }
    bool empty() const { return cards_.empty(); }

    CardBackend& backend() { return *backend_; }
    const CardBackend& backend() const { return *backend_; }

private:
    std::map<uint16_t, Card> cards_;
    std::unique_ptr<CardBackend> backend_;
};

std::ostream& operator<<(std::ostream& os, const CardRegistry& registry);

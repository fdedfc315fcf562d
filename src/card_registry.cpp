#include "card_registry.hpp"
#include "backend_null.hpp"

#include <stdexcept>

CardRegistry::CardRegistry()
    : backend_(std::make_unique<NullBackend>()) {}

CardRegistry::CardRegistry(std::unique_ptr<CardBackend> backend)
    : backend_(std::move(backend)) {
    if (!backend_) {
        throw std::invalid_argument("CardRegistry requires a backend");
    }
}

void CardRegistry::put(const Card& card) {
    cards_.insert_or_assign(card.id(), card);
}

const Card* CardRegistry::get(uint16_t card_id) const {
    auto it = cards_.find(card_id);
    if (it == cards_.end()) return nullptr;
    return &it->second;
}

std::optional<Card> CardRegistry::unbind(uint16_t card_id) {
    auto it = cards_.find(card_id);
    if (it == cards_.end()) return std::nullopt;
    Card card = it->second;
    cards_.erase(it);
    return card;
}

bool CardRegistry::contains(uint16_t card_id) const {
    return cards_.count(card_id) != 0;
}

std::vector<Card> CardRegistry::cards() const {
    std::vector<Card> out;
    out.reserve(cards_.size());
    for (const auto& entry : cards_) {
        out.push_back(entry.second);
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, const CardRegistry& registry) {
    return os << "CardRegistry { cards: " << registry.size() << " }";
}

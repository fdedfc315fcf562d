#pragma once

#include "card_backend.hpp"
#include "card_cache.hpp"

#include <map>
#include <utility>
#include <vector>

namespace ut {

    /// In-memory stand-in for a reader: the "field" is a map of tag payloads.
    /// Cache and lease handling is the same CardCache the libnfc backend uses.
    class FakeBackend : public CardBackend {
    public:
        static constexpr size_t MAX_PAYLOAD = 142;

        /// Place a tag holding the given payload in the field
        void place(uint8_t slot, std::vector<uint8_t> payload) {
            field_[slot] = std::move(payload);
        }

        /// Take the tag out of the field
        void remove(uint8_t slot) {
            field_.erase(slot);
        }

        const Card& read(uint16_t card_id) override {
            return cache_.read(card_id);
        }

        Card& read_mutable(uint16_t card_id) override {
            return cache_.read_mutable(card_id);
        }

        void release(uint16_t card_id) override {
            cache_.release(card_id);
            releases++;
        }

        void write(const Card& card, const std::vector<uint8_t>& data) override {
            cache_.ensure_not_leased(card.id(), KernelError::Kind::Write);
            check_payload_size(data.size(), MAX_PAYLOAD, KernelError::Kind::Write);
            cache_.lookup(card.id(), KernelError::Kind::Write);
            written.emplace_back(card.id(), data);
        }

        void sense() override {
            cache_.prune();
            for (const auto& entry : field_) {
                try {
                    cache_.store(Card::decode(entry.second), {entry.first});
                } catch (const ConversionError&) {
                    rejected++;
                }
            }
        }

        std::vector<uint16_t> present() const override {
            return cache_.present();
        }

        bool is_leased(uint16_t card_id) const { return cache_.is_leased(card_id); }

        std::vector<std::pair<uint16_t, std::vector<uint8_t>>> written;
        int releases = 0;
        int rejected = 0;

    private:
        std::map<uint8_t, std::vector<uint8_t>> field_;
        CardCache cache_;
    };

}// namespace ut

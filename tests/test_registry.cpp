#include <catch2/catch.hpp>
#include "backend_null.hpp"
#include "card_registry.hpp"
#include "fake_backend.hpp"

#include <memory>
#include <random>
#include <sstream>

namespace ut {

    TEST_CASE("0040 Registry basics") {
        CardRegistry registry;
        CHECK(registry.empty());
        CHECK(registry.size() == 0);
        CHECK(registry.get(0) == nullptr);
        CHECK_FALSE(registry.contains(0));
        CHECK_FALSE(registry.unbind(0));

        SECTION("Default backend is the null backend") {
            CHECK(dynamic_cast<NullBackend*>(&registry.backend()) != nullptr);
            CHECK_THROWS_AS(registry.backend().read(0), KernelError);
        }

        SECTION("Put, get, unbind") {
            registry.put(Card(3, Permissions::ADMIN));
            REQUIRE(registry.get(3) != nullptr);
            CHECK(*registry.get(3) == Card(3, Permissions::ADMIN));
            CHECK(registry.contains(3));
            CHECK(registry.size() == 1);

            auto removed = registry.unbind(3);
            REQUIRE(removed);
            CHECK(*removed == Card(3, Permissions::ADMIN));
            CHECK_FALSE(registry.contains(3));
            CHECK(registry.empty());
            CHECK_FALSE(registry.unbind(3));
        }

        SECTION("Last write wins") {
            registry.put(Card(5, Permissions::REGULAR));
            registry.put(Card(5, Permissions::IT_SUPPORT | Permissions::OPEN_DOORS));
            REQUIRE(registry.get(5) != nullptr);
            CHECK(*registry.get(5) == Card(5, Permissions::IT_SUPPORT | Permissions::OPEN_DOORS));
            CHECK(registry.size() == 1);
        }

        SECTION("Cards sorted by id") {
            for (uint16_t id : {9, 2, 65535, 0, 4}) {
                registry.put(Card(id, Permissions::REGULAR));
            }
            const auto cards = registry.cards();
            REQUIRE(cards.size() == 5);
            CHECK(cards[0].id() == 0);
            CHECK(cards[1].id() == 2);
            CHECK(cards[2].id() == 4);
            CHECK(cards[3].id() == 9);
            CHECK(cards[4].id() == 65535);
        }

        SECTION("Printing") {
            registry.put(Card());
            std::ostringstream oss;
            oss << registry;
            CHECK(oss.str() == "CardRegistry { cards: 1 }");
        }
    }

    TEST_CASE("0041 Registry keys match card ids") {
        CardRegistry registry;
        std::mt19937 rng{0xCA4D};
        std::uniform_int_distribution<int> id_dist{0, 31};
        std::uniform_int_distribution<int> bits_dist{0, 0x3f};
        std::bernoulli_distribution put_dist{0.6};

        for (int step = 0; step < 500; step++) {
            const auto id = static_cast<uint16_t>(id_dist(rng));
            if (put_dist(rng)) {
                registry.put(Card(id, Permissions::from_bits_truncate(static_cast<uint8_t>(bits_dist(rng)))));
            } else {
                registry.unbind(id);
            }
        }

        const auto cards = registry.cards();
        CHECK(cards.size() == registry.size());
        for (size_t i = 0; i < cards.size(); i++) {
            const Card* stored = registry.get(cards[i].id());
            REQUIRE(stored != nullptr);
            CHECK(stored->id() == cards[i].id());
            if (i > 0) {
                CHECK(cards[i - 1].id() < cards[i].id());
            }
        }
    }

    TEST_CASE("0042 Registry round trip scenario") {
        CardRegistry registry;
        registry.put(Card(0, Permissions::REGULAR));

        const Card* fetched = registry.get(0);
        REQUIRE(fetched != nullptr);
        const auto bytes = fetched->encode();
        const Card decoded = Card::decode(bytes);

        CHECK(decoded == Card(0, Permissions::REGULAR));
        CHECK(registry.cards().size() == 1);
    }

    TEST_CASE("0043 Registry on a custom backend") {
        auto owned = std::make_unique<FakeBackend>();
        FakeBackend& backend = *owned;
        backend.place(0, Card(1, Permissions::REGULAR).encode());
        backend.place(1, Card(2, Permissions::SUPER_ADMIN).encode());
        backend.place(2, {'{', '}'});

        CardRegistry registry{std::move(owned)};
        CHECK(&registry.backend() == &backend);
        CHECK(registry.empty());

        // Poll, decode, put
        registry.backend().sense();
        for (uint16_t id : registry.backend().present()) {
            registry.put(registry.backend().read(id));
        }

        CHECK(registry.size() == 2);
        CHECK(backend.rejected == 1);
        REQUIRE(registry.get(2) != nullptr);
        CHECK(registry.get(2)->is(Permissions::SUPER_ADMIN));

        SECTION("Push a card back to the hardware") {
            const Card promoted{1, Permissions::REGULAR | Permissions::ADMIN};
            registry.put(promoted);
            registry.backend().write(*registry.get(1), registry.get(1)->encode());
            REQUIRE(backend.written.size() == 1);
            CHECK(backend.written[0].first == 1);
            CHECK(Card::decode(backend.written[0].second) == promoted);
        }

        SECTION("Null backend pointer is rejected") {
            CHECK_THROWS_AS(CardRegistry(std::unique_ptr<CardBackend>()), std::invalid_argument);
        }
    }

}// namespace ut

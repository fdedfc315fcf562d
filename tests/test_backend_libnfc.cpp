#include <catch2/catch.hpp>
#include "backend_libnfc.hpp"

namespace ut {

    TEST_CASE("0035 Libnfc backend without a reader") {
        LibnfcBackend backend{LibnfcConfig{"cardreg-missing:device", 1}};

        SECTION("Failed open releases the libnfc context") {
            for (int attempt = 0; attempt < 3; attempt++) {
                try {
                    backend.open();
                    FAIL("open must throw without a reader");
                } catch (const KernelError& e) {
                    CHECK(e.kind() == KernelError::Kind::Read);
                    CHECK(e.code() == KERNEL_DEVICE_UNAVAILABLE);
                }
                CHECK_FALSE(backend.is_open());
                CHECK_FALSE(backend.has_context());
            }
        }

        SECTION("Sense is skipped and the cache stays empty") {
            backend.sense();
            CHECK_FALSE(backend.has_context());
            CHECK(backend.present().empty());
            try {
                backend.read(1);
                FAIL("read must throw");
            } catch (const KernelError& e) {
                CHECK(e.code() == KERNEL_CARD_ABSENT);
            }
            try {
                backend.write(Card(1, Permissions::REGULAR), Card(1, Permissions::REGULAR).encode());
                FAIL("write must throw");
            } catch (const KernelError& e) {
                CHECK(e.kind() == KernelError::Kind::Write);
                CHECK(e.code() == KERNEL_CARD_ABSENT);
            }
        }
    }

}// namespace ut

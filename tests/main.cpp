#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

int main(int argc, char* argv[]) {
    Catch::Session session;
    session.configData().name = "cardreg";
    session.configData().runOrder = Catch::RunTests::InLexicographicalOrder;

    int rc = session.applyCommandLine(argc, argv);
    if (rc != 0) {
        return rc;
    }
    return session.run();
}

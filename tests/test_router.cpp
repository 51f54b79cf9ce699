/*
 * kanboard C++ - Instance router tests
 */
#include <catch2/catch.hpp>
#include <kanboard/board/router.hpp>
#include <kanboard/core/config.hpp>
#include <kanboard/core/logger.hpp>

using namespace kanboard;

TEST_CASE("Empty instances resolve to the default board", "[router]") {
    InstanceRouter router;
    CHECK(router.default_board() == "default");
    CHECK(router.resolve("") == "default");
    CHECK(router.resolve("   ") == "default");

    router.set_default("main board");
    CHECK(router.resolve("") == "main_board");
}

TEST_CASE("Instance names are sanitized", "[router]") {
    InstanceRouter router;
    CHECK(router.resolve("my-project_2") == "my-project_2");
    CHECK(router.resolve("acme/widgets") == "acme_widgets");
    CHECK(router.resolve("../etc/passwd") == "___etc_passwd");
}

TEST_CASE("Aliases come from configuration", "[router]") {
    Logger::instance().set_level(LogLevel::ERROR);
    Config config;
    REQUIRE(config.load_string(
        "{\"router\": {\"default\": \"home\"},"
        " \"instances\": {\"session-42\": \"sprint\", \"broken\": 7}}"));

    InstanceRouter router;
    router.configure(config);

    CHECK(router.default_board() == "home");
    CHECK(router.resolve("session-42") == "sprint");
    CHECK(router.resolve("broken") == "broken");
    CHECK(router.resolve("other") == "other");
}

TEST_CASE("Store keys are namespaced", "[router]") {
    CHECK(InstanceRouter::store_key("alpha") == "board:alpha");
}

#include <catch2/catch_test_macros.hpp>

#include "tunebox/player/input/ButtonDebouncer.hpp"

using namespace tunebox;

TEST_CASE("ButtonDebouncer accepts the first edge", "[debounce]") {
    ButtonDebouncer debouncer(4);
    REQUIRE(debouncer.getWindowMs() == 250);
    REQUIRE(debouncer.accept(0, 1000));
}

TEST_CASE("ButtonDebouncer suppresses edges inside the window", "[debounce]") {
    ButtonDebouncer debouncer(4, 250);

    REQUIRE(debouncer.accept(1, 1000));
    REQUIRE_FALSE(debouncer.accept(1, 1010));
    REQUIRE_FALSE(debouncer.accept(1, 1249));

    SECTION("Window is measured from the last accepted edge") {
        REQUIRE(debouncer.accept(1, 1250));
        REQUIRE_FALSE(debouncer.accept(1, 1400));
        REQUIRE(debouncer.accept(1, 1500));
    }
}

TEST_CASE("ButtonDebouncer slots are independent", "[debounce]") {
    ButtonDebouncer debouncer(2, 250);

    REQUIRE(debouncer.accept(0, 1000));
    REQUIRE(debouncer.accept(1, 1001));
    REQUIRE_FALSE(debouncer.accept(0, 1002));
}

TEST_CASE("ButtonDebouncer rejects unknown slots", "[debounce]") {
    ButtonDebouncer debouncer(2);
    REQUIRE_FALSE(debouncer.accept(-1, 0));
    REQUIRE_FALSE(debouncer.accept(2, 0));
}

TEST_CASE("ButtonDebouncer with no slots accepts nothing", "[debounce]") {
    ButtonDebouncer empty(0);
    REQUIRE_FALSE(empty.accept(0, 1000));

    ButtonDebouncer negative(-3);
    REQUIRE_FALSE(negative.accept(0, 1000));
    negative.reset();
}

TEST_CASE("ButtonDebouncer starts with every slot unused", "[debounce]") {
    ButtonDebouncer debouncer(8, 250);
    for (int slot = 0; slot < 8; ++slot)
        REQUIRE(debouncer.accept(slot, 0));
}

TEST_CASE("ButtonDebouncer reset forgets previous edges", "[debounce]") {
    ButtonDebouncer debouncer(1, 250);
    REQUIRE(debouncer.accept(0, 1000));
    debouncer.reset();
    REQUIRE(debouncer.accept(0, 1001));
}

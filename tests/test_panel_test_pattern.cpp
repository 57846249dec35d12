#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "TestDoubles.hpp"
#include "tunebox/player/app/PanelTestPattern.hpp"

using namespace tunebox;

TEST_CASE("Test pattern walks the hue wheel", "[test_pattern]") {
    test::FakeDisplayPanel panel(32, 32);
    PanelTestPattern pattern(panel);
    REQUIRE(panel.open());

    REQUIRE(pattern.pushNextFrame());
    REQUIRE(panel.getPushCount() == 1);
    REQUIRE(panel.lastFrame.getPixelAt(0, 0) == juce::Colour::fromHSV(0.0f, 1.0f, 1.0f, 1.0f));
    REQUIRE(pattern.getHue() == Catch::Approx(PanelTestPattern::HUE_STEP));

    for (int i = 0; i < 150; ++i)
        pattern.pushNextFrame();

    REQUIRE(pattern.getHue() >= 0.0f);
    REQUIRE(pattern.getHue() < 1.0f);
}

TEST_CASE("Test pattern needs a display", "[test_pattern]") {
    test::FakeDisplayPanel panel;
    panel.openResult = false;
    PanelTestPattern pattern(panel);

    REQUIRE_FALSE(pattern.start());
}

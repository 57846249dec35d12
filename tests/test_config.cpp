#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "tunebox/player/core/Config.hpp"
#include "tunebox/player/core/Log.hpp"

using namespace tunebox;

namespace {

struct ConfigFixture {
    ConfigFixture() {
        Config::getInstance().resetToDefaults();
    }
    ~ConfigFixture() {
        Config::getInstance().resetToDefaults();
    }
};

/** Collects log lines while installed as the current juce::Logger. */
class CapturingLogger : public juce::Logger {
  public:
    CapturingLogger() {
        juce::Logger::setCurrentLogger(this);
    }
    ~CapturingLogger() override {
        juce::Logger::setCurrentLogger(nullptr);
    }

    juce::StringArray lines;

  protected:
    void logMessage(const juce::String& message) override {
        lines.add(message);
    }
};

void loadText(const juce::String& text) {
    juce::TemporaryFile temp(".cfg");
    temp.getFile().replaceWithText(text);
    Config::getInstance().loadFromFile(temp.getFile().getFullPathName().toStdString());
}

}  // namespace

TEST_CASE("Config defaults", "[config]") {
    ConfigFixture fixture;
    auto& config = Config::getInstance();

    REQUIRE(config.getLibraryPath() == "audio_library");
    REQUIRE(config.getAudioExtensions() == "mp3;wav;m4a;aac;flac;ogg");
    REQUIRE(config.getShuffleStartTrack());
    REQUIRE(config.getDefaultVolume() == 50);
    REQUIRE(config.getVolumeStep() == 5);
    REQUIRE(config.getTickIntervalMs() == 1000);
    REQUIRE(config.getDebounceMs() == 250);
    REQUIRE(config.getGpioChip() == "/dev/gpiochip0");
    REQUIRE(config.getButtonPlayPauseLine() == 5);
    REQUIRE(config.getButtonNextLine() == 6);
    REQUIRE(config.getButtonVolumeDownLine() == 16);
    REQUIRE(config.getButtonVolumeUpLine() == 24);
    REQUIRE(config.getFramebufferDevice() == "/dev/fb1");
    REQUIRE(config.getDisplayWidth() == 240);
    REQUIRE(config.getDisplayHeight() == 240);
    REQUIRE(config.getDisplayRotation() == 90);
    REQUIRE(config.getArtworkDimming() == Catch::Approx(0.3));
    REQUIRE(config.getLogLevel() == "info");
    REQUIRE(config.getLogFile().empty());
}

TEST_CASE("Config loads key=value files", "[config]") {
    ConfigFixture fixture;
    auto& config = Config::getInstance();

    juce::TemporaryFile temp(".cfg");
    temp.getFile().replaceWithText("# TuneBox settings\n"
                                   "libraryPath = /media/music\n"
                                   "audioExtensions=flac;mp3\n"
                                   "shuffleStartTrack=0\n"
                                   "defaultVolume=150\n"
                                   "volumeStep=10\n"
                                   "buttonNext=13\n"
                                   "displayRotation=270\n"
                                   "artworkDimming=0.5\n"
                                   "logLevel=debug\n"
                                   "unknownKey=1\n"
                                   "tickIntervalMs=soon\n"
                                   "not a setting\n");

    config.loadFromFile(temp.getFile().getFullPathName().toStdString());

    REQUIRE(config.getLibraryPath() == "/media/music");
    REQUIRE(config.getAudioExtensions() == "flac;mp3");
    REQUIRE_FALSE(config.getShuffleStartTrack());
    REQUIRE(config.getDefaultVolume() == 100);
    REQUIRE(config.getVolumeStep() == 10);
    REQUIRE(config.getButtonNextLine() == 13);
    REQUIRE(config.getDisplayRotation() == 270);
    REQUIRE(config.getArtworkDimming() == Catch::Approx(0.5));
    REQUIRE(config.getLogLevel() == "debug");
    REQUIRE(config.getTickIntervalMs() == 1000);
}

TEST_CASE("Config round-trips through a file", "[config]") {
    ConfigFixture fixture;
    auto& config = Config::getInstance();

    config.setLibraryPath("songs");
    config.setDebounceMs(120);
    config.setFramebufferDevice("/dev/fb0");

    juce::TemporaryFile temp(".cfg");
    auto path = temp.getFile().getFullPathName().toStdString();
    config.saveToFile(path);

    config.resetToDefaults();
    REQUIRE(config.getLibraryPath() == "audio_library");

    config.loadFromFile(path);
    REQUIRE(config.getLibraryPath() == "songs");
    REQUIRE(config.getDebounceMs() == 120);
    REQUIRE(config.getFramebufferDevice() == "/dev/fb0");
}

TEST_CASE("Config missing file keeps defaults", "[config]") {
    ConfigFixture fixture;
    auto& config = Config::getInstance();

    config.loadFromFile("/nonexistent/tunebox.cfg");
    REQUIRE(config.getDefaultVolume() == 50);
}

TEST_CASE("Config clamps out-of-range numbers before converting", "[config]") {
    ConfigFixture fixture;
    auto& config = Config::getInstance();

    loadText("defaultVolume=1e12\n"
             "volumeStep=-1e300\n"
             "tickIntervalMs=inf\n"
             "debounceMs=-inf\n"
             "displayRotation=1e12\n");

    REQUIRE(config.getDefaultVolume() == 100);
    REQUIRE(config.getVolumeStep() == 1);
    REQUIRE(config.getTickIntervalMs() == 3600000);
    REQUIRE(config.getDebounceMs() == 0);
    REQUIRE(config.getDisplayRotation() == 3600);
}

TEST_CASE("Config rejects unusable display sizes and line offsets", "[config]") {
    ConfigFixture fixture;
    auto& config = Config::getInstance();

    loadText("displayWidth=0\n"
             "displayHeight=1e12\n"
             "buttonNext=-3\n"
             "buttonVolumeUp=nan\n"
             "buttonPlayPause=1e12\n"
             "defaultVolume=nan\n"
             "artworkDimming=nan\n");

    REQUIRE(config.getDisplayWidth() == 240);
    REQUIRE(config.getDisplayHeight() == 240);
    REQUIRE(config.getButtonNextLine() == 6);
    REQUIRE(config.getButtonVolumeUpLine() == 24);
    REQUIRE(config.getButtonPlayPauseLine() == 5);
    REQUIRE(config.getDefaultVolume() == 50);
    REQUIRE(config.getArtworkDimming() == Catch::Approx(0.3));

    loadText("displayWidth=320\ndisplayHeight=480\nbuttonNext=27\n");
    REQUIRE(config.getDisplayWidth() == 320);
    REQUIRE(config.getDisplayHeight() == 480);
    REQUIRE(config.getButtonNextLine() == 27);
}

TEST_CASE("Config ignores unknown keys without warnings", "[config]") {
    ConfigFixture fixture;
    CapturingLogger logger;

    loadText("colourScheme=dark\nfutureOption=\n");

    for (const auto& line : logger.lines)
        REQUIRE_FALSE(line.contains("WARNING"));

    loadText("volumeStep=lots\n");
    REQUIRE(logger.lines.joinIntoString("\n").contains("volumeStep=lots"));
}

#pragma once

#include <string>

namespace tunebox {

/**
 * Configuration class for all player settings.
 * Values come from a key=value file; anything not in the file keeps its default.
 */
class Config {
  public:
    static constexpr int MAX_LINE_OFFSET = 1023;
    static constexpr int MAX_DISPLAY_SIZE = 4096;

    static Config& getInstance();

    // Library Configuration
    std::string getLibraryPath() const {
        return libraryPath;
    }
    void setLibraryPath(const std::string& path) {
        libraryPath = path;
    }

    std::string getAudioExtensions() const {
        return audioExtensions;
    }
    void setAudioExtensions(const std::string& extensions) {
        audioExtensions = extensions;
    }

    bool getShuffleStartTrack() const {
        return shuffleStartTrack;
    }
    void setShuffleStartTrack(bool shuffle) {
        shuffleStartTrack = shuffle;
    }

    // Playback Configuration
    int getDefaultVolume() const {
        return defaultVolume;
    }
    void setDefaultVolume(int volume) {
        defaultVolume = volume;
    }

    int getVolumeStep() const {
        return volumeStep;
    }
    void setVolumeStep(int step) {
        volumeStep = step;
    }

    int getTickIntervalMs() const {
        return tickIntervalMs;
    }
    void setTickIntervalMs(int ms) {
        tickIntervalMs = ms;
    }

    // Button Configuration
    int getDebounceMs() const {
        return debounceMs;
    }
    void setDebounceMs(int ms) {
        debounceMs = ms;
    }

    std::string getGpioChip() const {
        return gpioChip;
    }
    void setGpioChip(const std::string& chip) {
        gpioChip = chip;
    }

    int getButtonPlayPauseLine() const {
        return buttonPlayPauseLine;
    }
    void setButtonPlayPauseLine(int line) {
        buttonPlayPauseLine = line;
    }

    int getButtonNextLine() const {
        return buttonNextLine;
    }
    void setButtonNextLine(int line) {
        buttonNextLine = line;
    }

    int getButtonVolumeDownLine() const {
        return buttonVolumeDownLine;
    }
    void setButtonVolumeDownLine(int line) {
        buttonVolumeDownLine = line;
    }

    int getButtonVolumeUpLine() const {
        return buttonVolumeUpLine;
    }
    void setButtonVolumeUpLine(int line) {
        buttonVolumeUpLine = line;
    }

    // Display Configuration
    std::string getFramebufferDevice() const {
        return framebufferDevice;
    }
    void setFramebufferDevice(const std::string& device) {
        framebufferDevice = device;
    }

    int getDisplayWidth() const {
        return displayWidth;
    }
    void setDisplayWidth(int width) {
        displayWidth = width;
    }

    int getDisplayHeight() const {
        return displayHeight;
    }
    void setDisplayHeight(int height) {
        displayHeight = height;
    }

    int getDisplayRotation() const {
        return displayRotation;
    }
    void setDisplayRotation(int degrees) {
        displayRotation = degrees;
    }

    double getArtworkDimming() const {
        return artworkDimming;
    }
    void setArtworkDimming(double dimming) {
        artworkDimming = dimming;
    }

    // Logging Configuration
    std::string getLogLevel() const {
        return logLevel;
    }
    void setLogLevel(const std::string& level) {
        logLevel = level;
    }

    std::string getLogFile() const {
        return logFile;
    }
    void setLogFile(const std::string& path) {
        logFile = path;
    }

    void saveToFile(const std::string& filename);
    void loadFromFile(const std::string& filename);

    /** Restore every value to its default (tests reuse the singleton). */
    void resetToDefaults();

  private:
    Config() = default;

    // Helper to parse a single config line
    void parseConfigLine(const std::string& key, const std::string& value);

    // Library settings
    std::string libraryPath = "audio_library";
    std::string audioExtensions = "mp3;wav;m4a;aac;flac;ogg";
    bool shuffleStartTrack = true;  // Start on a random track

    // Playback settings
    int defaultVolume = 50;
    int volumeStep = 5;
    int tickIntervalMs = 1000;  // Idle queue wait before a refresh tick

    // Button settings (BCM line offsets of the A/B/X/Y buttons)
    int debounceMs = 250;
    std::string gpioChip = "/dev/gpiochip0";
    int buttonPlayPauseLine = 5;
    int buttonNextLine = 6;
    int buttonVolumeDownLine = 16;
    int buttonVolumeUpLine = 24;

    // Display settings
    std::string framebufferDevice = "/dev/fb1";
    int displayWidth = 240;
    int displayHeight = 240;
    int displayRotation = 90;
    double artworkDimming = 0.3;

    // Logging settings
    std::string logLevel = "info";
    std::string logFile;  // Empty: console only
};

}  // namespace tunebox

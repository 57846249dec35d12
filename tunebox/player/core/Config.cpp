#include "Config.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>

#include "Log.hpp"

namespace tunebox {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::resetToDefaults() {
    *this = Config();
}

void Config::saveToFile(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        log::error("Failed to open config file for writing: " + juce::String(filename));
        return;
    }

    file << "libraryPath=" << libraryPath << std::endl;
    file << "audioExtensions=" << audioExtensions << std::endl;
    file << "shuffleStartTrack=" << (shuffleStartTrack ? 1 : 0) << std::endl;
    file << "defaultVolume=" << defaultVolume << std::endl;
    file << "volumeStep=" << volumeStep << std::endl;
    file << "tickIntervalMs=" << tickIntervalMs << std::endl;
    file << "debounceMs=" << debounceMs << std::endl;
    file << "gpioChip=" << gpioChip << std::endl;
    file << "buttonPlayPause=" << buttonPlayPauseLine << std::endl;
    file << "buttonNext=" << buttonNextLine << std::endl;
    file << "buttonVolumeDown=" << buttonVolumeDownLine << std::endl;
    file << "buttonVolumeUp=" << buttonVolumeUpLine << std::endl;
    file << "framebufferDevice=" << framebufferDevice << std::endl;
    file << "displayWidth=" << displayWidth << std::endl;
    file << "displayHeight=" << displayHeight << std::endl;
    file << "displayRotation=" << displayRotation << std::endl;
    file << "artworkDimming=" << artworkDimming << std::endl;
    file << "logLevel=" << logLevel << std::endl;
    file << "logFile=" << logFile << std::endl;

    file.close();
    log::info("Config saved to: " + juce::String(filename));
}

void Config::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        log::info("Config file not found, using defaults: " + juce::String(filename));
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#')
            continue;

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = juce::String(line.substr(0, equalPos)).trim().toStdString();
        std::string value = juce::String(line.substr(equalPos + 1)).trim().toStdString();

        parseConfigLine(key, value);
    }

    file.close();
    log::info("Config loaded from: " + juce::String(filename));
}

void Config::parseConfigLine(const std::string& key, const std::string& value) {
    try {
        // Handle string values
        if (key == "libraryPath") {
            libraryPath = value;
            return;
        }
        if (key == "audioExtensions") {
            audioExtensions = value;
            return;
        }
        if (key == "gpioChip") {
            gpioChip = value;
            return;
        }
        if (key == "framebufferDevice") {
            framebufferDevice = value;
            return;
        }
        if (key == "logLevel") {
            logLevel = value;
            return;
        }
        if (key == "logFile") {
            logFile = value;
            return;
        }

        // Numeric values, clamped before narrowing to int
        auto number = [&value]() {
            double parsed = std::stod(value);
            if (std::isnan(parsed))
                throw std::invalid_argument("not a number");
            return parsed;
        };
        auto integer = [&number](int minValue, int maxValue) {
            return static_cast<int>(juce::jlimit(static_cast<double>(minValue),
                                                 static_cast<double>(maxValue), number()));
        };
        auto lineOffset = [&number]() {
            double parsed = number();
            if (parsed < 0 || parsed > MAX_LINE_OFFSET)
                throw std::out_of_range("line offset out of range");
            return static_cast<int>(parsed);
        };
        auto panelSize = [&number]() {
            double parsed = number();
            if (parsed < 1 || parsed > MAX_DISPLAY_SIZE)
                throw std::out_of_range("display size out of range");
            return static_cast<int>(parsed);
        };

        if (key == "shuffleStartTrack") {
            shuffleStartTrack = (number() != 0);
        } else if (key == "defaultVolume") {
            defaultVolume = integer(0, 100);
        } else if (key == "volumeStep") {
            volumeStep = integer(1, 100);
        } else if (key == "tickIntervalMs") {
            tickIntervalMs = integer(10, 3600000);
        } else if (key == "debounceMs") {
            debounceMs = integer(0, 60000);
        } else if (key == "buttonPlayPause") {
            buttonPlayPauseLine = lineOffset();
        } else if (key == "buttonNext") {
            buttonNextLine = lineOffset();
        } else if (key == "buttonVolumeDown") {
            buttonVolumeDownLine = lineOffset();
        } else if (key == "buttonVolumeUp") {
            buttonVolumeUpLine = lineOffset();
        } else if (key == "displayWidth") {
            displayWidth = panelSize();
        } else if (key == "displayHeight") {
            displayHeight = panelSize();
        } else if (key == "displayRotation") {
            displayRotation = integer(-3600, 3600);
        } else if (key == "artworkDimming") {
            artworkDimming = juce::jlimit(0.0, 1.0, number());
        }
        // Unknown keys are ignored without parsing their value
    } catch (const std::exception& e) {
        log::warning("Error parsing config value: " + juce::String(key) + "=" +
                     juce::String(value) + " (" + e.what() + ")");
    }
}

}  // namespace tunebox

#include "InputEventSource.hpp"

#include "../core/Config.hpp"
#include "../core/Log.hpp"

namespace tunebox {

std::vector<ButtonMapping> InputEventSource::defaultMappings() {
    auto& config = Config::getInstance();
    return {{config.getButtonPlayPauseLine(), ButtonLabel::PlayPause},
            {config.getButtonNextLine(), ButtonLabel::Next},
            {config.getButtonVolumeDownLine(), ButtonLabel::VolumeDown},
            {config.getButtonVolumeUpLine(), ButtonLabel::VolumeUp}};
}

InputEventSource::InputEventSource(EventQueue& queue, InputLineDriver& driver,
                                   std::vector<ButtonMapping> mappings, int debounceMs)
    : queue_(queue),
      driver_(driver),
      mappings_(std::move(mappings)),
      debouncer_(static_cast<int>(mappings_.size()), debounceMs) {}

InputEventSource::~InputEventSource() {
    stop();
}

bool InputEventSource::start() {
    std::vector<int> lines;
    for (const auto& mapping : mappings_)
        lines.push_back(mapping.lineOffset);

    driver_.onFallingEdge = [this](int line, juce::int64 timestampMs) {
        handleEdge(line, timestampMs);
    };

    if (!driver_.open(lines)) {
        driver_.onFallingEdge = nullptr;
        log::error("Failed to initialize input lines");
        return false;
    }

    debouncer_.reset();
    return true;
}

void InputEventSource::stop() {
    if (driver_.isOpen())
        driver_.close();
    driver_.onFallingEdge = nullptr;
}

bool InputEventSource::handleEdge(int lineOffset, juce::int64 timestampMs) {
    int slot = findSlot(lineOffset);
    if (slot < 0)
        return false;

    if (!debouncer_.accept(slot, timestampMs))
        return false;

    auto label = mappings_[static_cast<size_t>(slot)].label;
    DBG("Button " << toString(label) << " pressed (line " << lineOffset << ")");

    if (!queue_.push(ButtonPressedEvent{label})) {
        log::debug("Event queue full, dropped " + toString(label) + " press");
        return false;
    }
    return true;
}

int InputEventSource::findSlot(int lineOffset) const {
    for (size_t i = 0; i < mappings_.size(); ++i) {
        if (mappings_[i].lineOffset == lineOffset)
            return static_cast<int>(i);
    }
    return -1;
}

}  // namespace tunebox

#include "TrackCatalog.hpp"

#include <algorithm>

#include "Log.hpp"

namespace tunebox {

TrackCatalog::TrackCatalog(std::vector<TrackInfo> tracks) : tracks_(std::move(tracks)) {}

bool TrackCatalog::loadFromDirectory(const juce::File& directory,
                                     const juce::StringArray& extensions) {
    tracks_.clear();

    if (!directory.isDirectory()) {
        log::error("Library directory not found: " + directory.getFullPathName());
        return false;
    }

    auto children = directory.findChildFiles(juce::File::findFiles, false, "*");

    for (const auto& extension : extensions) {
        std::vector<juce::File> group;
        for (const auto& file : children) {
            if (file.getFileExtension().equalsIgnoreCase("." + extension))
                group.push_back(file);
        }

        std::sort(group.begin(), group.end(), [](const juce::File& a, const juce::File& b) {
            return a.getFileName() < b.getFileName();
        });

        for (const auto& file : group)
            tracks_.push_back({file, file.getFileName()});
    }

    if (tracks_.empty()) {
        log::error("No audio files found in " + directory.getFullPathName() + " (looked for " +
                   extensions.joinIntoString(", ") + ")");
        return false;
    }

    log::info("Loaded " + juce::String(size()) + " audio files");
    return true;
}

const TrackInfo* TrackCatalog::getTrack(int index) const {
    if (index < 0 || index >= size())
        return nullptr;
    return &tracks_[static_cast<size_t>(index)];
}

int TrackCatalog::chooseStartIndex(bool shuffle, juce::Random& random) const {
    if (!shuffle || tracks_.size() < 2)
        return 0;
    return random.nextInt(size());
}

juce::StringArray TrackCatalog::parseExtensionList(const juce::String& text) {
    juce::StringArray tokens;
    tokens.addTokens(text, ";,", "");
    tokens.trim();
    tokens.removeEmptyStrings();

    juce::StringArray extensions;
    for (auto token : tokens) {
        token = token.trimCharactersAtStart(".*").toLowerCase();
        if (token.isNotEmpty())
            extensions.addIfNotAlreadyThere(token);
    }
    return extensions;
}

}  // namespace tunebox

#pragma once

#include <juce_core/juce_core.h>

#include <vector>

namespace tunebox {

/**
 * @brief One playable file from the library directory
 */
struct TrackInfo {
    juce::File file;
    juce::String displayName;  // File name including extension
};

/**
 * @brief Ordered, read-only list of the tracks found at startup
 *
 * Files are grouped by extension in the order the extensions are given and
 * sorted by name inside each group, so "mp3;wav" lists every mp3 before the
 * first wav. Extension matching is case-insensitive.
 */
class TrackCatalog {
  public:
    TrackCatalog() = default;

    /**
     * @brief Scan a directory once and fill the catalog
     * @param directory   Library directory (not searched recursively)
     * @param extensions  Extensions without dot, e.g. {"mp3", "wav"}
     * @return false if the directory is missing or contains no matching files
     */
    bool loadFromDirectory(const juce::File& directory, const juce::StringArray& extensions);

    /** Build a catalog from an explicit list (tests, or callers that already scanned). */
    explicit TrackCatalog(std::vector<TrackInfo> tracks);

    int size() const {
        return static_cast<int>(tracks_.size());
    }
    bool isEmpty() const {
        return tracks_.empty();
    }

    const TrackInfo& operator[](int index) const {
        return tracks_[static_cast<size_t>(index)];
    }
    const TrackInfo* getTrack(int index) const;

    const std::vector<TrackInfo>& getTracks() const {
        return tracks_;
    }

    /**
     * @brief Index the player starts on: 0, or a random valid index when shuffling
     */
    int chooseStartIndex(bool shuffle, juce::Random& random) const;

    /** Parse "mp3;wav;m4a" (also accepts ',' and leading dots). */
    static juce::StringArray parseExtensionList(const juce::String& text);

  private:
    std::vector<TrackInfo> tracks_;
};

}  // namespace tunebox

#pragma once

#include <juce_graphics/juce_graphics.h>

namespace tunebox {

/**
 * @brief Finds cover art for a track and turns it into a dimmed background
 *
 * Looks, in order, at:
 * - ID3v2 APIC/PIC frames (mp3 and anything else carrying an ID3v2 header)
 * - FLAC PICTURE metadata blocks
 * - the iTunes "covr" item of MP4/M4A files (moov/udta/meta/ilst)
 * - cover.jpg / cover.png / folder.jpg / folder.png next to the track
 *
 * A front-cover picture wins over other picture types. Every failure path
 * just yields an invalid image; the renderer then uses a plain background.
 */
class ArtworkLoader {
  public:
    /**
     * @brief Load, fit and dim the artwork for a track
     * @param trackFile   Audio file
     * @param width       Frame width
     * @param height      Frame height
     * @param brightness  Multiplier applied to the artwork (0.3 keeps text readable)
     * @return Frame-sized image, or an invalid image if no artwork was found
     */
    static juce::Image loadBackground(const juce::File& trackFile, int width, int height,
                                      float brightness);

    /** Encoded picture bytes embedded in the file (empty if none). */
    static juce::MemoryBlock extractEmbeddedPicture(const juce::File& trackFile);

    /** Picture from an ID3v2 tag at the start of the stream (empty if none). */
    static juce::MemoryBlock readId3Picture(juce::InputStream& stream);

    /** Picture from the metadata blocks of a FLAC stream (empty if none). */
    static juce::MemoryBlock readFlacPicture(juce::InputStream& stream);

    /** Cover from the moov/udta/meta/ilst/covr atom path of an MP4 stream (empty if none). */
    static juce::MemoryBlock readMp4Cover(juce::InputStream& stream);

    /** Image file sitting next to the track, or a non-existent File. */
    static juce::File findSidecarImage(const juce::File& trackFile);

    /** Fit an image into width x height (centred, aspect kept) on black and dim it. */
    static juce::Image makeBackground(const juce::Image& artwork, int width, int height,
                                      float brightness);

  private:
    static juce::MemoryBlock parseId3Frames(const juce::MemoryBlock& tag, int majorVersion);
    static juce::MemoryBlock parseApicFrame(const juce::uint8* data, size_t size,
                                            bool legacyPicFrame, int& pictureType);
};

}  // namespace tunebox

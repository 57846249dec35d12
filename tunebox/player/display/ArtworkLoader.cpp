#include "ArtworkLoader.hpp"

#include <cstring>

#include "../core/Log.hpp"

namespace tunebox {

namespace {

constexpr int kFrontCoverPictureType = 3;
constexpr int kFlacPictureBlockType = 6;

juce::uint32 readBigEndian32(const juce::uint8* p) {
    return (juce::uint32(p[0]) << 24) | (juce::uint32(p[1]) << 16) | (juce::uint32(p[2]) << 8) |
           juce::uint32(p[3]);
}

// ID3v2 sizes store 7 bits per byte
juce::uint32 readSyncSafe32(const juce::uint8* p) {
    return (juce::uint32(p[0] & 0x7f) << 21) | (juce::uint32(p[1] & 0x7f) << 14) |
           (juce::uint32(p[2] & 0x7f) << 7) | juce::uint32(p[3] & 0x7f);
}

// Undo tag-level unsynchronisation: every 0xFF 0x00 pair becomes 0xFF
juce::MemoryBlock removeUnsynchronisation(const juce::MemoryBlock& tag) {
    juce::MemoryOutputStream out(tag.getSize());
    auto* data = static_cast<const juce::uint8*>(tag.getData());
    for (size_t i = 0; i < tag.getSize(); ++i) {
        out.writeByte(static_cast<char>(data[i]));
        if (data[i] == 0xff && i + 1 < tag.getSize() && data[i + 1] == 0x00)
            ++i;
    }
    return out.getMemoryBlock();
}

/**
 * Walk sibling MP4 atoms from the stream's position up to end and stop at the
 * first one named type, leaving the stream at its payload.
 */
bool seekToMp4Atom(juce::InputStream& stream, juce::int64 end, const char* type,
                   juce::int64& payloadEnd) {
    while (stream.getPosition() + 8 <= end) {
        auto atomStart = stream.getPosition();

        juce::uint8 header[8];
        if (stream.read(header, 8) != 8)
            return false;

        juce::int64 size = readBigEndian32(header);
        juce::int64 headerSize = 8;
        if (size == 1) {
            // 64-bit size follows the type
            juce::uint8 large[8];
            if (stream.read(large, 8) != 8)
                return false;
            size = (juce::int64(readBigEndian32(large)) << 32) | readBigEndian32(large + 4);
            headerSize = 16;
        } else if (size == 0) {
            // Runs to the end of the enclosing atom
            size = end - atomStart;
        }

        if (size < headerSize || size > end - atomStart)
            return false;

        if (std::memcmp(header + 4, type, 4) == 0) {
            payloadEnd = atomStart + size;
            return true;
        }

        if (!stream.setPosition(atomStart + size))
            return false;
    }
    return false;
}

bool isBetterPicture(const juce::MemoryBlock& best, int bestType, int candidateType) {
    return best.isEmpty() ||
           (candidateType == kFrontCoverPictureType && bestType != kFrontCoverPictureType);
}

}  // namespace

juce::MemoryBlock ArtworkLoader::parseApicFrame(const juce::uint8* data, size_t size,
                                                bool legacyPicFrame, int& pictureType) {
    if (size < 4)
        return {};

    size_t pos = 0;
    auto encoding = data[pos++];

    if (legacyPicFrame) {
        pos += 3;  // Three-letter image format ("JPG", "PNG")
    } else {
        while (pos < size && data[pos] != 0)
            ++pos;  // MIME type
        ++pos;
    }
    if (pos >= size)
        return {};

    pictureType = data[pos++];

    // Description, terminated according to its text encoding
    if (encoding == 1 || encoding == 2) {
        while (pos + 1 < size && !(data[pos] == 0 && data[pos + 1] == 0))
            pos += 2;
        pos += 2;
    } else {
        while (pos < size && data[pos] != 0)
            ++pos;
        ++pos;
    }
    if (pos >= size)
        return {};

    return juce::MemoryBlock(data + pos, size - pos);
}

juce::MemoryBlock ArtworkLoader::parseId3Frames(const juce::MemoryBlock& tag, int majorVersion) {
    auto* data = static_cast<const juce::uint8*>(tag.getData());
    const size_t size = tag.getSize();
    const size_t headerSize = (majorVersion == 2) ? 6 : 10;

    juce::MemoryBlock best;
    int bestType = -1;
    size_t pos = 0;

    while (pos + headerSize <= size) {
        if (data[pos] == 0)
            break;  // Padding

        juce::String frameId;
        size_t frameSize = 0;
        if (majorVersion == 2) {
            frameId = juce::String(reinterpret_cast<const char*>(data + pos), 3);
            frameSize = (size_t(data[pos + 3]) << 16) | (size_t(data[pos + 4]) << 8) |
                        size_t(data[pos + 5]);
        } else {
            frameId = juce::String(reinterpret_cast<const char*>(data + pos), 4);
            frameSize = (majorVersion == 4) ? readSyncSafe32(data + pos + 4)
                                            : readBigEndian32(data + pos + 4);
        }
        pos += headerSize;

        if (frameSize > size - pos)
            break;  // Truncated tag

        if (frameId == "APIC" || frameId == "PIC") {
            int pictureType = -1;
            auto picture = parseApicFrame(data + pos, frameSize, frameId == "PIC", pictureType);
            if (!picture.isEmpty() && isBetterPicture(best, bestType, pictureType)) {
                best = picture;
                bestType = pictureType;
            }
            if (bestType == kFrontCoverPictureType)
                break;
        }

        pos += frameSize;
    }

    return best;
}

juce::MemoryBlock ArtworkLoader::readId3Picture(juce::InputStream& stream) {
    juce::uint8 header[10];
    if (stream.read(header, sizeof(header)) != static_cast<int>(sizeof(header)))
        return {};
    if (std::memcmp(header, "ID3", 3) != 0)
        return {};

    int majorVersion = header[3];
    if (majorVersion < 2 || majorVersion > 4)
        return {};

    auto flags = header[5];
    auto tagSize = static_cast<size_t>(readSyncSafe32(header + 6));

    juce::MemoryBlock tag;
    if (stream.readIntoMemoryBlock(tag, static_cast<juce::ssize_t>(tagSize)) != tagSize)
        return {};

    if ((flags & 0x80) != 0)
        tag = removeUnsynchronisation(tag);

    if ((flags & 0x40) != 0 && majorVersion >= 3) {
        if (tag.getSize() < 4)
            return {};
        auto* ext = static_cast<const juce::uint8*>(tag.getData());
        // v2.3 stores the size without its own 4 bytes, v2.4 includes them
        size_t extendedSize =
            (majorVersion == 3) ? readBigEndian32(ext) + 4u : readSyncSafe32(ext);
        if (extendedSize >= tag.getSize())
            return {};
        tag.removeSection(0, extendedSize);
    }

    return parseId3Frames(tag, majorVersion);
}

juce::MemoryBlock ArtworkLoader::readFlacPicture(juce::InputStream& stream) {
    char magic[4];
    if (stream.read(magic, 4) != 4 || std::memcmp(magic, "fLaC", 4) != 0)
        return {};

    juce::MemoryBlock best;
    int bestType = -1;

    for (;;) {
        juce::uint8 blockHeader[4];
        if (stream.read(blockHeader, 4) != 4)
            break;

        bool isLast = (blockHeader[0] & 0x80) != 0;
        int blockType = blockHeader[0] & 0x7f;
        size_t blockSize = (size_t(blockHeader[1]) << 16) | (size_t(blockHeader[2]) << 8) |
                           size_t(blockHeader[3]);

        if (blockType != kFlacPictureBlockType) {
            stream.skipNextBytes(static_cast<juce::int64>(blockSize));
        } else {
            juce::MemoryBlock block;
            if (stream.readIntoMemoryBlock(block, static_cast<juce::ssize_t>(blockSize)) !=
                blockSize)
                break;

            auto* data = static_cast<const juce::uint8*>(block.getData());
            size_t pos = 0;
            auto need = [&](size_t bytes) { return pos + bytes <= blockSize; };

            if (!need(8))
                break;
            int pictureType = static_cast<int>(readBigEndian32(data));
            pos = 4;
            pos += 4 + readBigEndian32(data + pos);  // MIME type
            if (!need(4))
                break;
            pos += 4 + readBigEndian32(data + pos);  // Description
            if (!need(20))
                break;
            pos += 16;  // Width, height, depth, palette size
            size_t dataLength = readBigEndian32(data + pos);
            pos += 4;
            if (!need(dataLength))
                break;

            if (isBetterPicture(best, bestType, pictureType)) {
                best = juce::MemoryBlock(data + pos, dataLength);
                bestType = pictureType;
            }
        }

        if (isLast || bestType == kFrontCoverPictureType)
            break;
    }

    return best;
}

juce::MemoryBlock ArtworkLoader::readMp4Cover(juce::InputStream& stream) {
    auto end = stream.getTotalLength();
    if (end <= 0)
        return {};

    for (auto* type : {"moov", "udta", "meta", "ilst", "covr", "data"}) {
        if (!seekToMp4Atom(stream, end, type, end))
            return {};

        // meta is a full atom: version and flags precede its children
        if (std::memcmp(type, "meta", 4) == 0 &&
            !stream.setPosition(stream.getPosition() + 4))
            return {};
    }

    // data payload: 4-byte type indicator, 4-byte locale, then the image
    auto imageSize = end - stream.getPosition() - 8;
    if (imageSize <= 0 || !stream.setPosition(stream.getPosition() + 8))
        return {};

    juce::MemoryBlock picture;
    if (stream.readIntoMemoryBlock(picture, static_cast<juce::ssize_t>(imageSize)) !=
        static_cast<size_t>(imageSize))
        return {};
    return picture;
}

juce::MemoryBlock ArtworkLoader::extractEmbeddedPicture(const juce::File& trackFile) {
    juce::FileInputStream in(trackFile);
    if (!in.openedOk())
        return {};

    auto picture = readId3Picture(in);
    if (!picture.isEmpty())
        return picture;

    in.setPosition(0);
    picture = readFlacPicture(in);
    if (!picture.isEmpty())
        return picture;

    in.setPosition(0);
    return readMp4Cover(in);
}

juce::File ArtworkLoader::findSidecarImage(const juce::File& trackFile) {
    auto directory = trackFile.getParentDirectory();
    for (auto name : {"cover.jpg", "cover.png", "folder.jpg", "folder.png"}) {
        auto candidate = directory.getChildFile(name);
        if (candidate.existsAsFile())
            return candidate;
    }
    return {};
}

juce::Image ArtworkLoader::makeBackground(const juce::Image& artwork, int width, int height,
                                          float brightness) {
    juce::Image frame(juce::Image::RGB, width, height, true);
    juce::Graphics g(frame);
    g.fillAll(juce::Colours::black);
    g.drawImageWithin(artwork, 0, 0, width, height, juce::RectanglePlacement::centred);
    g.fillAll(juce::Colours::black.withAlpha(1.0f - juce::jlimit(0.0f, 1.0f, brightness)));
    return frame;
}

juce::Image ArtworkLoader::loadBackground(const juce::File& trackFile, int width, int height,
                                          float brightness) {
    juce::Image artwork;

    auto embedded = extractEmbeddedPicture(trackFile);
    if (!embedded.isEmpty())
        artwork = juce::ImageFileFormat::loadFrom(embedded.getData(), embedded.getSize());

    if (!artwork.isValid()) {
        auto sidecar = findSidecarImage(trackFile);
        if (sidecar.existsAsFile())
            artwork = juce::ImageFileFormat::loadFrom(sidecar);
    }

    if (!artwork.isValid()) {
        log::debug("No artwork for " + trackFile.getFileName());
        return {};
    }

    return makeBackground(artwork, width, height, brightness);
}

}  // namespace tunebox

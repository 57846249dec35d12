#include <catch2/catch_test_macros.hpp>

#include <initializer_list>

#include "tunebox/player/display/ArtworkLoader.hpp"

using namespace tunebox;

namespace {

juce::MemoryBlock encodePng(juce::Colour colour, int size = 8) {
    juce::Image image(juce::Image::RGB, size, size, false);
    image.clear(image.getBounds(), colour);

    juce::MemoryOutputStream out;
    juce::PNGImageFormat png;
    REQUIRE(png.writeImageToStream(image, out));
    return out.getMemoryBlock();
}

void writeBigEndian32(juce::MemoryOutputStream& out, juce::uint32 value) {
    out.writeIntBigEndian(static_cast<int>(value));
}

void writeSyncSafe32(juce::MemoryOutputStream& out, juce::uint32 value) {
    out.writeByte(static_cast<char>((value >> 21) & 0x7f));
    out.writeByte(static_cast<char>((value >> 14) & 0x7f));
    out.writeByte(static_cast<char>((value >> 7) & 0x7f));
    out.writeByte(static_cast<char>(value & 0x7f));
}

juce::MemoryBlock apicFrameBody(const juce::MemoryBlock& picture, int pictureType) {
    juce::MemoryOutputStream body;
    body.writeByte(0);  // ISO-8859-1
    body.write("image/png", 9);
    body.writeByte(0);
    body.writeByte(static_cast<char>(pictureType));
    body.write("cover", 5);
    body.writeByte(0);
    body.write(picture.getData(), picture.getSize());
    return body.getMemoryBlock();
}

/** ID3v2.3 tag holding one APIC frame per picture, followed by fake audio bytes. */
juce::MemoryBlock id3WithPictures(const std::vector<std::pair<juce::MemoryBlock, int>>& pictures) {
    juce::MemoryOutputStream frames;
    for (const auto& [picture, type] : pictures) {
        auto body = apicFrameBody(picture, type);
        frames.write("APIC", 4);
        writeBigEndian32(frames, static_cast<juce::uint32>(body.getSize()));
        frames.writeShort(0);  // Flags
        frames.write(body.getData(), body.getSize());
    }
    for (int i = 0; i < 16; ++i)
        frames.writeByte(0);  // Padding

    juce::MemoryOutputStream file;
    file.write("ID3", 3);
    file.writeByte(3);
    file.writeByte(0);
    file.writeByte(0);
    writeSyncSafe32(file, static_cast<juce::uint32>(frames.getDataSize()));
    file.write(frames.getData(), frames.getDataSize());
    file.write("\xff\xfb\x90\x00", 4);
    return file.getMemoryBlock();
}

juce::MemoryBlock flacWithPicture(const juce::MemoryBlock& picture) {
    juce::MemoryOutputStream block;
    writeBigEndian32(block, 3);  // Front cover
    writeBigEndian32(block, 9);
    block.write("image/png", 9);
    writeBigEndian32(block, 0);  // Empty description
    for (int i = 0; i < 4; ++i)
        writeBigEndian32(block, 0);  // Width, height, depth, colours
    writeBigEndian32(block, static_cast<juce::uint32>(picture.getSize()));
    block.write(picture.getData(), picture.getSize());

    juce::MemoryOutputStream file;
    file.write("fLaC", 4);

    // STREAMINFO (type 0), 34 bytes of zeros
    file.writeByte(0);
    file.writeByte(0);
    file.writeByte(0);
    file.writeByte(34);
    for (int i = 0; i < 34; ++i)
        file.writeByte(0);

    // PICTURE (type 6), last block
    auto size = static_cast<juce::uint32>(block.getDataSize());
    file.writeByte(static_cast<char>(0x80 | 6));
    file.writeByte(static_cast<char>((size >> 16) & 0xff));
    file.writeByte(static_cast<char>((size >> 8) & 0xff));
    file.writeByte(static_cast<char>(size & 0xff));
    file.write(block.getData(), block.getDataSize());
    return file.getMemoryBlock();
}

juce::MemoryBlock mp4Atom(const char* type, const juce::MemoryBlock& payload) {
    juce::MemoryOutputStream out;
    writeBigEndian32(out, static_cast<juce::uint32>(payload.getSize() + 8));
    out.write(type, 4);
    out.write(payload.getData(), payload.getSize());
    return out.getMemoryBlock();
}

juce::MemoryBlock concat(std::initializer_list<juce::MemoryBlock> blocks) {
    juce::MemoryBlock result;
    for (const auto& block : blocks)
        result.append(block.getData(), block.getSize());
    return result;
}

/** Minimal M4A layout: ftyp, then moov/udta/meta/ilst/covr/data around the picture. */
juce::MemoryBlock m4aWithCover(const juce::MemoryBlock& picture) {
    juce::MemoryOutputStream data;
    writeBigEndian32(data, 14);  // Well-known type: PNG
    writeBigEndian32(data, 0);   // Locale
    data.write(picture.getData(), picture.getSize());

    juce::MemoryOutputStream metaBody;
    writeBigEndian32(metaBody, 0);  // Version and flags
    auto hdlr = mp4Atom("hdlr", juce::MemoryBlock(25, true));
    auto ilst = mp4Atom("ilst",
                        concat({mp4Atom("\xa9nam", juce::MemoryBlock("x", 1)),
                                mp4Atom("covr", mp4Atom("data", data.getMemoryBlock()))}));
    metaBody.write(hdlr.getData(), hdlr.getSize());
    metaBody.write(ilst.getData(), ilst.getSize());

    auto moov = mp4Atom("moov", concat({mp4Atom("mvhd", juce::MemoryBlock(100, true)),
                                        mp4Atom("udta", mp4Atom("meta",
                                                                metaBody.getMemoryBlock()))}));
    return concat({mp4Atom("ftyp", juce::MemoryBlock("M4A \0\0\0\0", 8)), moov,
                   mp4Atom("mdat", juce::MemoryBlock(64, true))});
}

juce::Colour decodedColour(const juce::MemoryBlock& data) {
    auto image = juce::ImageFileFormat::loadFrom(data.getData(), data.getSize());
    REQUIRE(image.isValid());
    return image.getPixelAt(0, 0);
}

struct TempDir {
    juce::TemporaryFile temp;
    juce::File dir;

    TempDir() : dir(temp.getFile()) {
        dir.createDirectory();
    }
    ~TempDir() {
        dir.deleteRecursively();
    }
};

}  // namespace

TEST_CASE("Artwork from an ID3v2 APIC frame", "[artwork]") {
    auto png = encodePng(juce::Colours::blue);
    auto tagged = id3WithPictures({{png, 3}});

    juce::MemoryInputStream in(tagged, false);
    auto picture = ArtworkLoader::readId3Picture(in);

    REQUIRE(picture == png);
}

TEST_CASE("Front cover wins over other ID3 pictures", "[artwork]") {
    auto back = encodePng(juce::Colours::red);
    auto front = encodePng(juce::Colours::green);
    auto tagged = id3WithPictures({{back, 4}, {front, 3}});

    juce::MemoryInputStream in(tagged, false);
    auto picture = ArtworkLoader::readId3Picture(in);

    REQUIRE(decodedColour(picture) == juce::Colours::green);
}

TEST_CASE("Artwork from a FLAC PICTURE block", "[artwork]") {
    auto png = encodePng(juce::Colours::yellow);
    auto flac = flacWithPicture(png);

    juce::MemoryInputStream in(flac, false);
    REQUIRE(ArtworkLoader::readFlacPicture(in) == png);
}

TEST_CASE("Artwork from the covr item of an MP4 file", "[artwork]") {
    auto png = encodePng(juce::Colours::cyan);
    auto m4a = m4aWithCover(png);

    juce::MemoryInputStream in(m4a, false);
    REQUIRE(ArtworkLoader::readMp4Cover(in) == png);

    SECTION("No covr item") {
        auto bare = concat({mp4Atom("ftyp", juce::MemoryBlock("M4A \0\0\0\0", 8)),
                            mp4Atom("moov", mp4Atom("mvhd", juce::MemoryBlock(100, true)))});
        juce::MemoryInputStream bareIn(bare, false);
        REQUIRE(ArtworkLoader::readMp4Cover(bareIn).isEmpty());
    }

    SECTION("Atom size past the end of the file") {
        auto truncated = m4a;
        truncated.setSize(m4a.getSize() - 80);
        juce::MemoryInputStream truncatedIn(truncated, false);
        REQUIRE(ArtworkLoader::readMp4Cover(truncatedIn).isEmpty());
    }
}

TEST_CASE("Streams without pictures give nothing", "[artwork]") {
    SECTION("Not a tag") {
        juce::MemoryBlock data("RIFF....WAVEfmt ", 16);
        juce::MemoryInputStream in(data, false);
        REQUIRE(ArtworkLoader::readId3Picture(in).isEmpty());
    }

    SECTION("Truncated tag") {
        auto tagged = id3WithPictures({{encodePng(juce::Colours::blue), 3}});
        tagged.setSize(20);
        juce::MemoryInputStream in(tagged, false);
        REQUIRE(ArtworkLoader::readId3Picture(in).isEmpty());
    }

    SECTION("Empty stream") {
        juce::MemoryInputStream in(nullptr, 0, false);
        REQUIRE(ArtworkLoader::readFlacPicture(in).isEmpty());
    }
}

TEST_CASE("Embedded artwork is read from track files", "[artwork]") {
    TempDir temp;
    auto png = encodePng(juce::Colours::blue);

    auto mp3 = temp.dir.getChildFile("song.mp3");
    REQUIRE(mp3.replaceWithData(id3WithPictures({{png, 3}}).getData(),
                                id3WithPictures({{png, 3}}).getSize()));
    REQUIRE(ArtworkLoader::extractEmbeddedPicture(mp3) == png);

    auto flacBytes = flacWithPicture(png);
    auto flac = temp.dir.getChildFile("song.flac");
    REQUIRE(flac.replaceWithData(flacBytes.getData(), flacBytes.getSize()));
    REQUIRE(ArtworkLoader::extractEmbeddedPicture(flac) == png);

    auto m4aBytes = m4aWithCover(png);
    auto m4a = temp.dir.getChildFile("song.m4a");
    REQUIRE(m4a.replaceWithData(m4aBytes.getData(), m4aBytes.getSize()));
    REQUIRE(ArtworkLoader::extractEmbeddedPicture(m4a) == png);

    REQUIRE(ArtworkLoader::extractEmbeddedPicture(temp.dir.getChildFile("missing.mp3"))
                .isEmpty());
}

TEST_CASE("Sidecar cover image is used when nothing is embedded", "[artwork]") {
    TempDir temp;
    auto track = temp.dir.getChildFile("plain.wav");
    REQUIRE(track.replaceWithText("not really audio"));

    REQUIRE_FALSE(ArtworkLoader::findSidecarImage(track).exists());
    REQUIRE_FALSE(ArtworkLoader::loadBackground(track, 240, 240, 0.3f).isValid());

    auto png = encodePng(juce::Colours::white);
    auto cover = temp.dir.getChildFile("folder.png");
    REQUIRE(cover.replaceWithData(png.getData(), png.getSize()));

    REQUIRE(ArtworkLoader::findSidecarImage(track) == cover);

    auto background = ArtworkLoader::loadBackground(track, 240, 240, 0.3f);
    REQUIRE(background.isValid());
    REQUIRE(background.getWidth() == 240);
    REQUIRE(background.getHeight() == 240);
}

TEST_CASE("Backgrounds are fitted, centred and dimmed", "[artwork]") {
    // Wide image: letterboxed top and bottom
    juce::Image wide(juce::Image::RGB, 200, 100, false);
    wide.clear(wide.getBounds(), juce::Colours::white);

    auto background = ArtworkLoader::makeBackground(wide, 240, 240, 0.3f);

    auto centre = background.getPixelAt(120, 120);
    REQUIRE(centre.getRed() >= 70);
    REQUIRE(centre.getRed() <= 84);
    REQUIRE(centre.getRed() == centre.getGreen());

    REQUIRE(background.getPixelAt(120, 5) == juce::Colours::black);
    REQUIRE(background.getPixelAt(120, 234) == juce::Colours::black);
}

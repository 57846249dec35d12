#include "FramebufferPanel.hpp"

#include <fcntl.h>
#include <linux/fb.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "../core/Log.hpp"

namespace tunebox {

FramebufferPanel::FramebufferPanel(std::string devicePath, int width, int height,
                                   int rotationDegrees)
    : devicePath_(std::move(devicePath)),
      width_(width),
      height_(height),
      rotation_(((rotationDegrees % 360) + 360) % 360) {}

FramebufferPanel::~FramebufferPanel() {
    close();
}

bool FramebufferPanel::open() {
    close();

    fd_ = ::open(devicePath_.c_str(), O_RDWR | O_CLOEXEC);
    if (fd_ < 0) {
        log::error("Failed to open framebuffer " + juce::String(devicePath_) + ": " +
                   std::strerror(errno));
        return false;
    }

    fb_var_screeninfo varInfo;
    fb_fix_screeninfo fixInfo;
    if (::ioctl(fd_, FBIOGET_VSCREENINFO, &varInfo) < 0 ||
        ::ioctl(fd_, FBIOGET_FSCREENINFO, &fixInfo) < 0) {
        log::error("Failed to query framebuffer " + juce::String(devicePath_) + ": " +
                   std::strerror(errno));
        close();
        return false;
    }

    bitsPerPixel_ = static_cast<int>(varInfo.bits_per_pixel);
    if (bitsPerPixel_ != 16 && bitsPerPixel_ != 32) {
        log::error("Unsupported framebuffer depth: " + juce::String(bitsPerPixel_) + " bpp");
        close();
        return false;
    }

    deviceWidth_ = static_cast<int>(varInfo.xres);
    deviceHeight_ = static_cast<int>(varInfo.yres);
    lineLength_ = static_cast<int>(fixInfo.line_length);
    mappedSize_ = static_cast<size_t>(lineLength_) * static_cast<size_t>(deviceHeight_);

    void* mapped = ::mmap(nullptr, mappedSize_, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
    if (mapped == MAP_FAILED) {
        log::error("Failed to map framebuffer " + juce::String(devicePath_) + ": " +
                   std::strerror(errno));
        close();
        return false;
    }
    mapped_ = static_cast<std::uint8_t*>(mapped);

    log::info("Display " + juce::String(devicePath_) + ": " + juce::String(deviceWidth_) + "x" +
              juce::String(deviceHeight_) + " @ " + juce::String(bitsPerPixel_) +
              " bpp, rotation " + juce::String(rotation_));
    return true;
}

void FramebufferPanel::close() {
    if (mapped_ != nullptr) {
        ::munmap(mapped_, mappedSize_);
        mapped_ = nullptr;
        mappedSize_ = 0;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::uint16_t FramebufferPanel::toRgb565(juce::Colour colour) {
    auto r = static_cast<std::uint16_t>(colour.getRed() >> 3);
    auto g = static_cast<std::uint16_t>(colour.getGreen() >> 2);
    auto b = static_cast<std::uint16_t>(colour.getBlue() >> 3);
    return static_cast<std::uint16_t>((r << 11) | (g << 5) | b);
}

juce::Point<int> FramebufferPanel::sourcePixelFor(int deviceX, int deviceY, int width,
                                                  int height, int rotationDegrees) {
    switch (rotationDegrees) {
        case 90:
            return {deviceY, height - 1 - deviceX};
        case 180:
            return {width - 1 - deviceX, height - 1 - deviceY};
        case 270:
            return {width - 1 - deviceY, deviceX};
        default:
            return {deviceX, deviceY};
    }
}

bool FramebufferPanel::push(const juce::Image& frame) {
    if (mapped_ == nullptr || !frame.isValid())
        return false;

    bool quarterTurn = (rotation_ == 90 || rotation_ == 270);
    int rotatedWidth = quarterTurn ? height_ : width_;
    int rotatedHeight = quarterTurn ? width_ : height_;
    int outWidth = juce::jmin(deviceWidth_, rotatedWidth);
    int outHeight = juce::jmin(deviceHeight_, rotatedHeight);

    const juce::Image::BitmapData pixels(frame, juce::Image::BitmapData::readOnly);
    int bytesPerPixel = bitsPerPixel_ / 8;

    for (int y = 0; y < outHeight; ++y) {
        auto* row = mapped_ + static_cast<size_t>(y) * static_cast<size_t>(lineLength_);

        for (int x = 0; x < outWidth; ++x) {
            auto source = sourcePixelFor(x, y, width_, height_, rotation_);
            auto colour = (source.x < frame.getWidth() && source.y < frame.getHeight())
                              ? pixels.getPixelColour(source.x, source.y)
                              : juce::Colours::black;

            auto* out = row + static_cast<size_t>(x * bytesPerPixel);
            if (bytesPerPixel == 2) {
                auto packed = toRgb565(colour);
                std::memcpy(out, &packed, sizeof(packed));
            } else {
                std::uint32_t packed = 0xff000000u | (std::uint32_t(colour.getRed()) << 16) |
                                       (std::uint32_t(colour.getGreen()) << 8) |
                                       std::uint32_t(colour.getBlue());
                std::memcpy(out, &packed, sizeof(packed));
            }
        }
    }

    return true;
}

}  // namespace tunebox

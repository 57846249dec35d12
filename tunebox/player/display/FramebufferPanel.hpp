#pragma once

#include <juce_graphics/juce_graphics.h>

#include <cstdint>
#include <string>

#include "DisplayPanel.hpp"

namespace tunebox {

/**
 * @brief DisplayPanel writing to a Linux framebuffer device
 *
 * Small SPI panels (ST7789 and friends) show up as /dev/fbN through the fbtft
 * drivers. The device is memory-mapped once in open(); push() converts the
 * frame to the device's pixel format (RGB565 or 32-bit XRGB) and applies the
 * fixed rotation while copying.
 */
class FramebufferPanel : public DisplayPanel {
  public:
    FramebufferPanel(std::string devicePath, int width, int height, int rotationDegrees);
    ~FramebufferPanel() override;

    bool open() override;
    void close() override;
    bool isOpen() const override {
        return mapped_ != nullptr;
    }

    int getWidth() const override {
        return width_;
    }
    int getHeight() const override {
        return height_;
    }

    bool push(const juce::Image& frame) override;

    /** Pack an RGB colour into RGB565. */
    static std::uint16_t toRgb565(juce::Colour colour);

    /**
     * @brief Map a device pixel back to the logical frame pixel shown there
     *
     * The logical frame is rotated clockwise by rotationDegrees onto the
     * device. Rotations other than 0/90/180/270 are treated as 0.
     */
    static juce::Point<int> sourcePixelFor(int deviceX, int deviceY, int width, int height,
                                           int rotationDegrees);

  private:
    std::string devicePath_;
    int width_;
    int height_;
    int rotation_;

    int fd_ = -1;
    std::uint8_t* mapped_ = nullptr;
    size_t mappedSize_ = 0;
    int deviceWidth_ = 0;
    int deviceHeight_ = 0;
    int bitsPerPixel_ = 0;
    int lineLength_ = 0;

    JUCE_DECLARE_NON_COPYABLE(FramebufferPanel)
};

}  // namespace tunebox

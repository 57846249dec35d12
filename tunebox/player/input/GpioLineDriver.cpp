#include "GpioLineDriver.hpp"

#include <fcntl.h>
#include <linux/gpio.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "../core/Log.hpp"

namespace tunebox {

namespace {
constexpr const char* kConsumerName = "tunebox";
constexpr int kPollTimeoutMs = 100;  // How often a watcher checks for shutdown
constexpr size_t kEventsPerRead = 16;
}  // namespace

/**
 * Owns one requested line fd and the thread that waits on it.
 */
class GpioLineDriver::LineWatcher : private juce::Thread {
  public:
    LineWatcher(GpioLineDriver& owner, int lineOffset, int lineFd)
        : juce::Thread("GPIO line " + juce::String(lineOffset)),
          owner_(owner),
          lineOffset_(lineOffset),
          lineFd_(lineFd) {}

    ~LineWatcher() override {
        stop();
        ::close(lineFd_);
    }

    void start() {
        startThread();
    }

    void stop() {
        signalThreadShouldExit();
        // Watcher wakes at least every kPollTimeoutMs, so this returns promptly
        waitForThreadToExit(-1);
    }

  private:
    void run() override {
        gpio_v2_line_event events[kEventsPerRead];

        while (!threadShouldExit()) {
            pollfd pfd{lineFd_, POLLIN, 0};
            int ready = ::poll(&pfd, 1, kPollTimeoutMs);
            if (ready < 0) {
                if (errno == EINTR)
                    continue;
                log::error("GPIO poll failed on line " + juce::String(lineOffset_) + ": " +
                           std::strerror(errno));
                return;
            }
            if (ready == 0 || (pfd.revents & POLLIN) == 0)
                continue;

            auto bytes = ::read(lineFd_, events, sizeof(events));
            if (bytes < 0) {
                if (errno == EINTR || errno == EAGAIN)
                    continue;
                log::error("GPIO read failed on line " + juce::String(lineOffset_) + ": " +
                           std::strerror(errno));
                return;
            }

            auto count = static_cast<size_t>(bytes) / sizeof(gpio_v2_line_event);
            for (size_t i = 0; i < count; ++i) {
                if (events[i].id != GPIO_V2_LINE_EVENT_FALLING_EDGE)
                    continue;

                auto timestampMs = static_cast<juce::int64>(events[i].timestamp_ns / 1000000ULL);
                if (owner_.onFallingEdge)
                    owner_.onFallingEdge(lineOffset_, timestampMs);
            }
        }
    }

    GpioLineDriver& owner_;
    const int lineOffset_;
    const int lineFd_;
};

GpioLineDriver::GpioLineDriver(std::string chipPath) : chipPath_(std::move(chipPath)) {}

GpioLineDriver::~GpioLineDriver() {
    close();
}

std::unique_ptr<GpioLineDriver::LineWatcher> GpioLineDriver::requestLine(int chipFd,
                                                                         int lineOffset) {
    gpio_v2_line_request request;
    std::memset(&request, 0, sizeof(request));

    request.offsets[0] = static_cast<__u32>(lineOffset);
    request.num_lines = 1;
    std::strncpy(request.consumer, kConsumerName, sizeof(request.consumer) - 1);
    request.config.flags = GPIO_V2_LINE_FLAG_INPUT | GPIO_V2_LINE_FLAG_EDGE_FALLING |
                           GPIO_V2_LINE_FLAG_BIAS_PULL_UP;

    if (::ioctl(chipFd, GPIO_V2_GET_LINE_IOCTL, &request) < 0) {
        log::error("Failed to request GPIO line " + juce::String(lineOffset) + " on " +
                   juce::String(chipPath_) + ": " + std::strerror(errno));
        return nullptr;
    }

    return std::make_unique<LineWatcher>(*this, lineOffset, request.fd);
}

bool GpioLineDriver::open(const std::vector<int>& lineOffsets) {
    close();

    int chipFd = ::open(chipPath_.c_str(), O_RDONLY | O_CLOEXEC);
    if (chipFd < 0) {
        log::error("Failed to open GPIO chip " + juce::String(chipPath_) + ": " +
                   std::strerror(errno));
        return false;
    }

    std::vector<std::unique_ptr<LineWatcher>> requested;
    for (int offset : lineOffsets) {
        auto watcher = requestLine(chipFd, offset);
        if (!watcher) {
            // Dropping 'requested' releases the lines we already got
            ::close(chipFd);
            return false;
        }
        requested.push_back(std::move(watcher));
    }

    // Line fds stay valid without the chip fd
    ::close(chipFd);

    watchers_ = std::move(requested);
    for (auto& watcher : watchers_)
        watcher->start();

    log::info("Configured " + juce::String(static_cast<int>(watchers_.size())) +
              " GPIO input lines on " + juce::String(chipPath_));
    return true;
}

void GpioLineDriver::close() {
    if (watchers_.empty())
        return;

    watchers_.clear();
    log::info("GPIO input lines released");
}

}  // namespace tunebox

#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>
#include <juce_gui_basics/juce_gui_basics.h>

#include <csignal>
#include <memory>

#include "app/PanelTestPattern.hpp"
#include "app/PlayerRuntime.hpp"
#include "core/Config.hpp"
#include "core/Log.hpp"
#include "display/FramebufferPanel.hpp"
#include "engine/TracktionMediaEngine.hpp"
#include "input/GpioLineDriver.hpp"

using namespace juce;

namespace {

volatile std::sig_atomic_t quitSignalled = 0;

extern "C" void handleQuitSignal(int) {
    quitSignalled = 1;
}

// Signal handlers cannot touch JUCE; the message thread polls the flag instead
class QuitSignalWatcher : private Timer {
  public:
    QuitSignalWatcher() {
        std::signal(SIGINT, handleQuitSignal);
        std::signal(SIGTERM, handleQuitSignal);
        startTimer(100);
    }

    ~QuitSignalWatcher() override {
        stopTimer();
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
    }

  private:
    void timerCallback() override {
        if (quitSignalled != 0) {
            stopTimer();
            tunebox::log::info("Shutdown requested");
            JUCEApplication::quit();
        }
    }
};

std::unique_ptr<tunebox::DisplayPanel> createPanel(const tunebox::Config& config) {
    return std::make_unique<tunebox::FramebufferPanel>(
        config.getFramebufferDevice(), config.getDisplayWidth(), config.getDisplayHeight(),
        config.getDisplayRotation());
}

}  // namespace

class TuneBoxApplication : public JUCEApplication {
  private:
    std::unique_ptr<tunebox::ConsoleLogger> logger_;
    std::unique_ptr<QuitSignalWatcher> signalWatcher_;
    std::unique_ptr<tunebox::PlayerRuntime> runtime_;
    std::unique_ptr<tunebox::DisplayPanel> testPatternPanel_;
    std::unique_ptr<tunebox::PanelTestPattern> testPattern_;

    void fail(const String& message) {
        tunebox::log::error(message);
        setApplicationReturnValue(1);
        quit();
    }

  public:
    TuneBoxApplication() = default;

    const String getApplicationName() override {
        return "TuneBox";
    }
    const String getApplicationVersion() override {
        return "1.0.0";
    }
    bool moreThanOneInstanceAllowed() override {
        return false;
    }

    void initialise(const String& commandLine) override {
        ArgumentList args("tunebox", commandLine);
        auto& config = tunebox::Config::getInstance();

        // 1. Configuration
        File configFile;
        if (args.containsOption("-c|--config")) {
            configFile = File::getCurrentWorkingDirectory().getChildFile(
                args.getValueForOption("-c|--config"));
            if (configFile.existsAsFile())
                config.loadFromFile(configFile.getFullPathName().toStdString());
        }
        if (args.containsOption("-l|--library"))
            config.setLibraryPath(args.getValueForOption("-l|--library").toStdString());

        // 2. Logging
        tunebox::ConsoleLogger::setMinimumLevel(
            tunebox::parseLogLevel(String(config.getLogLevel())));
        File logFile;
        if (!config.getLogFile().empty())
            logFile = File::getCurrentWorkingDirectory().getChildFile(String(config.getLogFile()));
        logger_ = std::make_unique<tunebox::ConsoleLogger>(logFile);
        Logger::setCurrentLogger(logger_.get());

        if (configFile != File() && !configFile.existsAsFile()) {
            fail("Config file not found: " + configFile.getFullPathName());
            return;
        }

        signalWatcher_ = std::make_unique<QuitSignalWatcher>();

        // 3. Panel test pattern instead of the player
        if (args.containsOption("--test-pattern")) {
            testPatternPanel_ = createPanel(config);
            testPattern_ = std::make_unique<tunebox::PanelTestPattern>(*testPatternPanel_);
            if (!testPattern_->start())
                fail("Failed to open display for test pattern");
            return;
        }

        // 4. Player
        runtime_ = std::make_unique<tunebox::PlayerRuntime>(
            tunebox::RuntimeSettings::fromConfig(config),
            std::make_unique<tunebox::GpioLineDriver>(config.getGpioChip()),
            [](tunebox::EventQueue& queue) -> std::unique_ptr<tunebox::MediaEngine> {
                return std::make_unique<tunebox::TracktionMediaEngine>(queue);
            },
            createPanel(config));

        if (!runtime_->startup())
            fail("TuneBox failed to start");
    }

    void shutdown() override {
        if (testPattern_ != nullptr) {
            testPattern_->stop();
            testPattern_.reset();
            testPatternPanel_.reset();
        }

        if (runtime_ != nullptr) {
            runtime_->shutdown();
            runtime_.reset();
        }

        signalWatcher_.reset();

        Logger::setCurrentLogger(nullptr);
        logger_.reset();
    }

    void systemRequestedQuit() override {
        quit();
    }

    void anotherInstanceStarted(const String&) override {}
};

// JUCE application startup
START_JUCE_APPLICATION(TuneBoxApplication)

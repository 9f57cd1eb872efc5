#include "audio/PortAudioCapture.hpp"
#include "config/AppConfig.hpp"
#include "session/DictationSession.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <poll.h>
#include <unistd.h>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>

static std::atomic<bool> g_stop{false};

static void signalHandler(int) {
    g_stop = true;
}

static std::string getEnv(const std::string& key,
                          const std::string& defaultVal = "") {
    const char* val = std::getenv(key.c_str());
    return val ? val : defaultVal;
}

static void loadDotEnv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
            val = val.substr(1, val.size() - 2);
        setenv(key.c_str(), val.c_str(), 0);  // existing env wins
    }
}

static void setupLogging() {
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink    = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "dictea.log", 1048576 * 5, 3);  // 5MB, 3 files

    auto logger = std::make_shared<spdlog::logger>(
        "dictea", spdlog::sinks_init_list{consoleSink, fileSink});
    spdlog::set_default_logger(logger);

    std::string logLevel = getEnv("DICTEA_LOG_LEVEL", "info");
    if (logLevel == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (logLevel == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (logLevel == "error") spdlog::set_level(spdlog::level::err);
    else                          spdlog::set_level(spdlog::level::info);
}

static void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [config.json] [--list-devices] [--language <code>]\n";
}

// Enter on stdin, checked without blocking past `ms`
static bool enterPressed(int ms) {
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    if (poll(&pfd, 1, ms) <= 0) return false;
    std::string line;
    std::getline(std::cin, line);
    return true;
}

int main(int argc, char* argv[]) {
    loadDotEnv(".env");
    setupLogging();

    std::string configPath = "dictea.json";
    std::string languageArg;
    bool listDevices = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--list-devices") == 0) {
            listDevices = true;
        } else if (std::strcmp(argv[i], "--language") == 0) {
            if (i + 1 >= argc) { usage(argv[0]); return 1; }
            languageArg = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0 ||
                   std::strcmp(argv[i], "-h") == 0) {
            usage(argv[0]);
            return 0;
        } else if (argv[i][0] == '-') {
            usage(argv[0]);
            return 1;
        } else {
            configPath = argv[i];
        }
    }

    spdlog::info("Dictea v0.1.0 starting");

    if (listDevices) {
        PortAudioCapture capture;
        auto devices = capture.listDevices();
        if (devices.empty()) {
            std::cout << "No input devices found\n";
            return 1;
        }
        for (auto& name : devices) std::cout << name << "\n";
        return 0;
    }

    AppConfig config = AppConfig::load(configPath);
    config.applyEnvironment();

    std::optional<Language> language;
    if (!languageArg.empty()) language = Language::fromCode(languageArg);

    std::signal(SIGINT,  signalHandler);
    std::signal(SIGTERM, signalHandler);

    DictationSession session(config);
    session.setEventCallback([](const SttEvent& event) {
        if (event.isFinal())
            std::cout << "[final] " << event.text << std::endl;
        else
            std::cout << "[partial] " << event.text << std::endl;
    });

    try {
        session.startRecording(language);
    } catch (const std::exception& e) {
        spdlog::error("Cannot start recording: {}", e.what());
        return 1;
    }

    std::cout << "Recording, press Enter to stop" << std::endl;

    while (!g_stop) {
        if (enterPressed(100)) break;
        if (session.pipelineStatus().is(PipelineStatus::State::Error)) {
            spdlog::error("Pipeline failed: {}", session.pipelineStatus().message);
            break;
        }
    }

    std::string text = session.stopRecording();
    std::cout << "\n" << text << std::endl;

    spdlog::info("Dictea exited cleanly");
    return 0;
}

#include "config/AppConfig.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

AppConfig AppConfig::fromJson(const nlohmann::json& j) {
    AppConfig c;
    c.sttEngine        = j.value("stt_engine",         c.sttEngine);
    c.openaiApiKey     = j.value("openai_api_key",     c.openaiApiKey);
    c.mistralApiKey    = j.value("mistral_api_key",    c.mistralApiKey);
    c.geminiApiKey     = j.value("gemini_api_key",     c.geminiApiKey);
    c.language         = j.value("language",           c.language);
    c.outputLanguage   = j.value("output_language",    c.outputLanguage);
    c.reformulate      = j.value("reformulate",        c.reformulate);
    c.globalShortcut   = j.value("global_shortcut",    c.globalShortcut);
    c.targetSampleRate = j.value("target_sample_rate", c.targetSampleRate);
    c.minDispatchMs    = j.value("min_dispatch_ms",    c.minDispatchMs);
    c.flushTimeoutMs   = j.value("flush_timeout_ms",   c.flushTimeoutMs);
    c.httpTimeoutMs    = j.value("http_timeout_ms",    c.httpTimeoutMs);
    c.localModelPath   = j.value("local_model_path",   c.localModelPath);
    c.localServerUrl   = j.value("local_server_url",   c.localServerUrl);
    return c;
}

nlohmann::json AppConfig::toJson() const {
    return {
        {"stt_engine",         sttEngine},
        {"openai_api_key",     openaiApiKey},
        {"mistral_api_key",    mistralApiKey},
        {"gemini_api_key",     geminiApiKey},
        {"language",           language},
        {"output_language",    outputLanguage},
        {"reformulate",        reformulate},
        {"global_shortcut",    globalShortcut},
        {"target_sample_rate", targetSampleRate},
        {"min_dispatch_ms",    minDispatchMs},
        {"flush_timeout_ms",   flushTimeoutMs},
        {"http_timeout_ms",    httpTimeoutMs},
        {"local_model_path",   localModelPath},
        {"local_server_url",   localServerUrl}
    };
}

AppConfig AppConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::info("No config at {}, using defaults", path);
        return {};
    }

    try {
        nlohmann::json j;
        f >> j;
        if (!j.is_object()) {
            spdlog::warn("Invalid config in {}, using defaults", path);
            return {};
        }
        spdlog::info("Config loaded from {}", path);
        return fromJson(j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Invalid config in {}, using defaults: {}", path, e.what());
        return {};
    }
}

bool AppConfig::save(const std::string& path) const {
    namespace fs = std::filesystem;

    std::error_code ec;
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);
    if (ec) {
        spdlog::error("Config save error: cannot create {}: {}",
                      parent.string(), ec.message());
        return false;
    }

    std::ofstream f(path);
    if (!f.is_open()) {
        spdlog::error("Config save error: cannot open {}", path);
        return false;
    }
    f << toJson().dump(2);
    spdlog::info("Config saved to {}", path);
    return static_cast<bool>(f);
}

void AppConfig::applyEnvironment() {
    auto fill = [](std::string& field, const char* var) {
        if (!field.empty()) return;
        if (const char* val = std::getenv(var)) field = val;
    };
    fill(openaiApiKey,  "OPENAI_API_KEY");
    fill(mistralApiKey, "MISTRAL_API_KEY");
    fill(geminiApiKey,  "GEMINI_API_KEY");
}

bool AppConfig::engineSettingsChanged(const AppConfig& a, const AppConfig& b) {
    return a.sttEngine        != b.sttEngine
        || a.openaiApiKey     != b.openaiApiKey
        || a.mistralApiKey    != b.mistralApiKey
        || a.geminiApiKey     != b.geminiApiKey
        || a.targetSampleRate != b.targetSampleRate
        || a.minDispatchMs    != b.minDispatchMs
        || a.flushTimeoutMs   != b.flushTimeoutMs
        || a.httpTimeoutMs    != b.httpTimeoutMs
        || a.localModelPath   != b.localModelPath
        || a.localServerUrl   != b.localServerUrl;
}

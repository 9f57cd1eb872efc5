#pragma once
#include <nlohmann/json.hpp>
#include <string>

// User configuration, persisted as JSON.
// Missing keys fall back to the defaults below.
struct AppConfig {
    std::string sttEngine      = "openai";   // openai | voxtral | gemini | local | voxtral-local
    std::string openaiApiKey;
    std::string mistralApiKey;
    std::string geminiApiKey;

    std::string language       = "auto";     // recording language
    std::string outputLanguage = "auto";
    bool        reformulate    = false;
    std::string globalShortcut = "CmdOrCtrl+Shift+Space";

    int targetSampleRate = 16000;
    int minDispatchMs    = -1;      // -1 = engine default (1000 network, 0 local)
    int flushTimeoutMs   = 30000;
    int httpTimeoutMs    = 30000;

    std::string localModelPath;
    std::string localServerUrl = "http://127.0.0.1:8080";

    static AppConfig fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;

    // Defaults when the file is missing or invalid
    static AppConfig load(const std::string& path);

    // Pretty JSON, parent directories created. Returns false on failure.
    bool save(const std::string& path) const;

    // Fill empty credentials from OPENAI_API_KEY, MISTRAL_API_KEY and
    // GEMINI_API_KEY
    void applyEnvironment();

    // True when switching from `a` to `b` needs a new engine
    static bool engineSettingsChanged(const AppConfig& a, const AppConfig& b);
};

#include "stt/EngineFactory.hpp"
#include "stt/CloudSttEngine.hpp"
#include "stt/LocalSttEngine.hpp"
#include <spdlog/spdlog.h>

DispatchPolicy dispatchPolicyFor(const AppConfig& config, bool local) {
    DispatchPolicy p;
    p.sampleRate = config.targetSampleRate;

    int minMs = config.minDispatchMs;
    if (minMs < 0) minMs = local ? 0 : 1000;
    p.minDispatchSamples = DispatchPolicy::samplesFor(minMs, p.sampleRate);

    p.flushTimeout = std::chrono::milliseconds(config.flushTimeoutMs);
    return p;
}

std::unique_ptr<ISttEngine> createEngine(const AppConfig& config) {
    const std::string& kind = config.sttEngine;

    if (kind == "local" || kind == "whisper-local" || kind == "voxtral-local") {
        LocalSttEngine::Options opts;
        opts.serverUrl     = config.localServerUrl;
        opts.httpTimeoutMs = config.httpTimeoutMs;
        if (kind == "voxtral-local") {
            opts.displayName    = "Voxtral (local)";
            opts.autoDispatchMs = 500;
        }
        auto engine = LocalSttEngine::load(config.localModelPath, opts,
                                           dispatchPolicyFor(config, true));
        spdlog::info("{} STT engine initialized", engine->name());
        return engine;
    }

    ProviderConfig provider;
    const std::string* apiKey = nullptr;
    if (kind == "gemini") {
        provider = ProviderConfig::gemini();
        apiKey   = &config.geminiApiKey;
    } else if (kind == "voxtral") {
        provider = ProviderConfig::voxtral();
        apiKey   = &config.mistralApiKey;
    } else {
        if (kind != "openai")
            spdlog::warn("Unknown stt_engine '{}', using OpenAI", kind);
        provider = ProviderConfig::openAi();
        apiKey   = &config.openaiApiKey;
    }

    auto engine = CloudSttEngine::load(provider, *apiKey,
                                       dispatchPolicyFor(config, false),
                                       config.httpTimeoutMs);
    spdlog::info("{} STT engine initialized", engine->name());
    return engine;
}

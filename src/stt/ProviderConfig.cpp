#include "stt/ProviderConfig.hpp"

ProviderConfig ProviderConfig::openAi() {
    ProviderConfig p;
    p.id          = "openai";
    p.displayName = "OpenAI Whisper";
    p.baseUrl     = "https://api.openai.com";
    p.path        = "/v1/audio/transcriptions";
    p.model       = "gpt-4o-transcribe";
    return p;
}

ProviderConfig ProviderConfig::voxtral() {
    ProviderConfig p;
    p.id          = "voxtral";
    p.displayName = "Voxtral";
    p.baseUrl     = "https://api.mistral.ai";
    p.path        = "/v1/audio/transcriptions";
    p.model       = "voxtral-mini-latest";
    return p;
}

ProviderConfig ProviderConfig::gemini() {
    ProviderConfig p;
    p.id          = "gemini";
    p.displayName = "Gemini";
    p.baseUrl     = "https://generativelanguage.googleapis.com";
    p.model       = "gemini-2.5-flash";
    p.path        = "/v1beta/models/" + p.model + ":generateContent";
    p.format      = RequestFormat::GenerateContent;
    p.auth        = Auth::ApiKeyHeader;
    p.authHeader  = "x-goog-api-key";
    p.textPointer = "/candidates/0/content/parts/0/text";
    return p;
}

// whisper.cpp's bundled HTTP server (examples/server)
ProviderConfig ProviderConfig::whisperServer(const std::string& url) {
    ProviderConfig p;
    p.id          = "whisper-server";
    p.displayName = "Whisper";
    p.baseUrl     = url;
    p.path        = "/inference";
    p.auth        = Auth::None;
    p.modelField.clear();
    p.extraFields = {{"response_format", "json"}};
    return p;
}

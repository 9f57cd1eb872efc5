#pragma once
#include "ITranscriptionBackend.hpp"
#include "ProviderConfig.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// One HTTP request per transcription, shaped by a ProviderConfig.
// Uses cpp-httplib; HTTPS endpoints need the OpenSSL-enabled build.
class HttpTranscriptionBackend : public ITranscriptionBackend {
public:
    struct FormField {
        std::string name;
        std::string content;
        std::string filename;      // empty for plain text fields
        std::string contentType;
    };

    HttpTranscriptionBackend(ProviderConfig provider,
                             std::string apiKey,
                             int timeoutMs = 30000);

    std::string transcribe(const std::string& wav,
                           const Language& language) override;

    const ProviderConfig& provider() const { return provider_; }

    // Request/response shaping, exposed for tests
    static std::vector<FormField> buildFormFields(const ProviderConfig& provider,
                                                  const std::string& wav,
                                                  const Language& language);
    static nlohmann::json buildGenerateContentBody(const std::string& wav,
                                                   const Language& language);
    static std::string transcriptionPrompt(const Language& language);

    // Throws SttError(InferenceError) when the body is not JSON.
    // A missing or non-string field yields an empty result.
    static std::string extractText(const std::string& body,
                                   const std::string& pointer);

    static std::string base64Encode(const std::string& data);
    static std::string trim(const std::string& s);

private:
    ProviderConfig provider_;
    std::string    apiKey_;
    int            timeoutMs_;
};

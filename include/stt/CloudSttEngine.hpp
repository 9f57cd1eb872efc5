#pragma once
#include "BufferedSttEngine.hpp"
#include "ProviderConfig.hpp"
#include <memory>
#include <string>

// Network transcription engine (OpenAI, Voxtral, Gemini).
// Accumulates everything and sends it in a single request on flush();
// these APIs are not built for streaming.
class CloudSttEngine : public BufferedSttEngine {
public:
    // Throws SttError(ModelNotFound) when the API key is empty
    static std::unique_ptr<CloudSttEngine> load(const ProviderConfig& provider,
                                                const std::string& apiKey,
                                                const DispatchPolicy& policy = {},
                                                int httpTimeoutMs = 30000);

    CloudSttEngine(const ProviderConfig& provider,
                   std::shared_ptr<ITranscriptionBackend> backend,
                   const DispatchPolicy& policy = {});

    const ProviderConfig& provider() const { return provider_; }

private:
    ProviderConfig provider_;
};

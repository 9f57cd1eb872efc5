#include "stt/CloudSttEngine.hpp"
#include "stt/HttpTranscriptionBackend.hpp"
#include <spdlog/spdlog.h>

std::unique_ptr<CloudSttEngine> CloudSttEngine::load(
    const ProviderConfig& provider,
    const std::string& apiKey,
    const DispatchPolicy& policy,
    int httpTimeoutMs)
{
    if (apiKey.empty()) {
        throw SttError(SttError::Kind::ModelNotFound,
                       provider.displayName + " API key required");
    }

    spdlog::info("Initializing {} ({}) with API key",
                 provider.displayName, provider.model);

    auto backend = std::make_shared<HttpTranscriptionBackend>(
        provider, apiKey, httpTimeoutMs);
    return std::make_unique<CloudSttEngine>(provider, std::move(backend), policy);
}

CloudSttEngine::CloudSttEngine(const ProviderConfig& provider,
                               std::shared_ptr<ITranscriptionBackend> backend,
                               const DispatchPolicy& policy)
    : BufferedSttEngine(provider.displayName, std::move(backend), [&] {
          // Network engines never dispatch on push
          DispatchPolicy p = policy;
          p.autoDispatchSamples = 0;
          return p;
      }())
    , provider_(provider) {}

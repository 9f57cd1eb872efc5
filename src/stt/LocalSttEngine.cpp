#include "stt/LocalSttEngine.hpp"
#include "stt/HttpTranscriptionBackend.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>

std::unique_ptr<LocalSttEngine> LocalSttEngine::load(
    const std::string& modelPath,
    const Options& options,
    DispatchPolicy policy)
{
    namespace fs = std::filesystem;

    std::error_code ec;
    if (modelPath.empty() || !fs::exists(modelPath, ec))
        throw SttError(SttError::Kind::ModelNotFound, modelPath);

    if (!fs::is_regular_file(modelPath, ec))
        throw SttError(SttError::Kind::ModelLoadError,
                       modelPath + " is not a model file");

    std::ifstream probe(modelPath, std::ios::binary);
    if (!probe.is_open())
        throw SttError(SttError::Kind::ModelLoadError,
                       "cannot read " + modelPath);

    spdlog::info("Loading {} model: {} (server {})",
                 options.displayName, modelPath, options.serverUrl);

    policy.autoDispatchSamples =
        DispatchPolicy::samplesFor(options.autoDispatchMs, policy.sampleRate);

    auto backend = std::make_shared<HttpTranscriptionBackend>(
        ProviderConfig::whisperServer(options.serverUrl), "",
        options.httpTimeoutMs);

    return std::make_unique<LocalSttEngine>(modelPath, options.displayName,
                                            std::move(backend), policy);
}

LocalSttEngine::LocalSttEngine(const std::string& modelPath,
                               const std::string& displayName,
                               std::shared_ptr<ITranscriptionBackend> backend,
                               const DispatchPolicy& policy)
    : BufferedSttEngine(displayName, std::move(backend), policy)
    , modelPath_(modelPath) {}

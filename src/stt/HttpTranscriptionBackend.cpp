#include "stt/HttpTranscriptionBackend.hpp"
#include "stt/SttError.hpp"
#include <httplib.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <cctype>

HttpTranscriptionBackend::HttpTranscriptionBackend(
    ProviderConfig provider, std::string apiKey, int timeoutMs)
    : provider_(std::move(provider))
    , apiKey_(std::move(apiKey))
    , timeoutMs_(timeoutMs) {}

std::string HttpTranscriptionBackend::transcribe(const std::string& wav,
                                                 const Language& language) {
    httplib::Client cli(provider_.baseUrl);
    cli.set_connection_timeout(timeoutMs_ / 1000, (timeoutMs_ % 1000) * 1000);
    cli.set_read_timeout(timeoutMs_ / 1000, (timeoutMs_ % 1000) * 1000);
    cli.set_write_timeout(timeoutMs_ / 1000, (timeoutMs_ % 1000) * 1000);

    httplib::Headers headers;
    switch (provider_.auth) {
        case ProviderConfig::Auth::Bearer:
            headers.emplace(provider_.authHeader, "Bearer " + apiKey_);
            break;
        case ProviderConfig::Auth::ApiKeyHeader:
            headers.emplace(provider_.authHeader, apiKey_);
            break;
        case ProviderConfig::Auth::None:
            break;
    }

    httplib::MultipartFormDataItems items;
    if (provider_.format == ProviderConfig::RequestFormat::MultipartForm) {
        for (auto& f : buildFormFields(provider_, wav, language))
            items.push_back({f.name, f.content, f.filename, f.contentType});
    }

    auto res = provider_.format == ProviderConfig::RequestFormat::MultipartForm
        ? cli.Post(provider_.path, headers, items)
        : cli.Post(provider_.path, headers,
                   buildGenerateContentBody(wav, language).dump(),
                   "application/json");

    if (!res) {
        throw SttError(SttError::Kind::InferenceError,
                       "Network error: " + httplib::to_string(res.error()));
    }

    if (res->status < 200 || res->status >= 300) {
        throw SttError(SttError::Kind::InferenceError,
                       provider_.displayName + " API error " +
                       std::to_string(res->status) + ": " +
                       res->body.substr(0, 200));
    }

    return extractText(res->body, provider_.textPointer);
}

std::vector<HttpTranscriptionBackend::FormField>
HttpTranscriptionBackend::buildFormFields(const ProviderConfig& provider,
                                          const std::string& wav,
                                          const Language& language) {
    std::vector<FormField> fields;
    fields.push_back({provider.fileField, wav, "audio.wav", "audio/wav"});

    if (!provider.modelField.empty())
        fields.push_back({provider.modelField, provider.model, "", ""});

    // Auto = let the service detect it
    if (!language.isAuto() && !provider.languageField.empty())
        fields.push_back({provider.languageField, language.code(), "", ""});

    for (auto& [name, value] : provider.extraFields)
        fields.push_back({name, value, "", ""});

    return fields;
}

std::string HttpTranscriptionBackend::transcriptionPrompt(const Language& language) {
    if (language.isAuto())
        return "Transcribe this audio exactly as spoken. "
               "Return only the transcription, nothing else.";
    return "Transcribe this audio exactly as spoken in " +
           language.displayName() +
           ". Return only the transcription, nothing else.";
}

nlohmann::json HttpTranscriptionBackend::buildGenerateContentBody(
    const std::string& wav, const Language& language)
{
    return {
        {"contents", {{
            {"parts", {
                {{"inline_data", {
                    {"mime_type", "audio/wav"},
                    {"data",      base64Encode(wav)}
                }}},
                {{"text", transcriptionPrompt(language)}}
            }}
        }}}
    };
}

std::string HttpTranscriptionBackend::extractText(const std::string& body,
                                                  const std::string& pointer) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw SttError(SttError::Kind::InferenceError,
                       std::string("JSON parse error: ") + e.what());
    }

    try {
        const auto& node = j.at(nlohmann::json::json_pointer(pointer));
        if (!node.is_string()) return "";
        return trim(node.get<std::string>());
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("No text at {} in response: {}", pointer, e.what());
        return "";
    }
}

std::string HttpTranscriptionBackend::base64Encode(const std::string& data) {
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(data.data()),
                            static_cast<int>(data.size()));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

std::string HttpTranscriptionBackend::trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

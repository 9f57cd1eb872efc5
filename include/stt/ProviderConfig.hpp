#pragma once
#include <string>
#include <utility>
#include <vector>

// Everything that differs between transcription services: where to send
// the audio, how to authenticate, how to shape the request and where the
// text sits in the JSON reply.
struct ProviderConfig {
    enum class RequestFormat {
        MultipartForm,     // WAV as a form file + text fields
        GenerateContent    // Gemini JSON body with base64 inline audio
    };

    enum class Auth {
        None,
        Bearer,            // Authorization: Bearer <key>
        ApiKeyHeader       // <authHeader>: <key>
    };

    std::string   id;             // "openai", "voxtral", ...
    std::string   displayName;    // used in logs and error messages
    std::string   baseUrl;        // scheme://host[:port]
    std::string   path;
    std::string   model;

    RequestFormat format     = RequestFormat::MultipartForm;
    Auth          auth       = Auth::Bearer;
    std::string   authHeader = "Authorization";

    // Multipart field names
    std::string   fileField     = "file";
    std::string   modelField    = "model";    // empty = not sent
    std::string   languageField = "language";
    std::vector<std::pair<std::string, std::string>> extraFields;

    // JSON pointer to the transcription in the response body
    std::string   textPointer = "/text";

    static ProviderConfig openAi();
    static ProviderConfig voxtral();
    static ProviderConfig gemini();
    static ProviderConfig whisperServer(const std::string& url);
};

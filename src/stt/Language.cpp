#include "stt/Language.hpp"
#include <algorithm>
#include <cctype>

Language Language::fromCode(const std::string& code) {
    std::string c = code;
    std::transform(c.begin(), c.end(), c.begin(),
                   [](unsigned char ch) { return std::tolower(ch); });

    if (c == "auto")                        return Id::Auto;
    if (c == "fr" || c == "french")         return Id::French;
    if (c == "en" || c == "english")        return Id::English;
    if (c == "es" || c == "spanish")        return Id::Spanish;
    if (c == "de" || c == "german")         return Id::German;
    if (c == "it" || c == "italian")        return Id::Italian;
    if (c == "pt" || c == "portuguese")     return Id::Portuguese;
    return other(c);
}

std::string Language::code() const {
    switch (id_) {
        case Id::Auto:       return "auto";
        case Id::French:     return "fr";
        case Id::English:    return "en";
        case Id::Spanish:    return "es";
        case Id::German:     return "de";
        case Id::Italian:    return "it";
        case Id::Portuguese: return "pt";
        case Id::Other:      return code_;
    }
    return "auto";
}

std::string Language::displayName() const {
    switch (id_) {
        case Id::Auto:       return "Auto";
        case Id::French:     return "French";
        case Id::English:    return "English";
        case Id::Spanish:    return "Spanish";
        case Id::German:     return "German";
        case Id::Italian:    return "Italian";
        case Id::Portuguese: return "Portuguese";
        case Id::Other:      return code_;
    }
    return "Auto";
}

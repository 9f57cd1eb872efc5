#pragma once
#include <string>

// Transcription language: a fixed set of named languages, automatic
// detection, or any other ISO 639-1 code.
class Language {
public:
    enum class Id {
        Auto,
        French,
        English,
        Spanish,
        German,
        Italian,
        Portuguese,
        Other
    };

    Language() = default;
    Language(Id id) : id_(id) {}

    static Language other(const std::string& code) {
        Language l(Id::Other);
        l.code_ = code;
        return l;
    }

    // Accepts ISO 639-1 codes and English names, case-insensitively.
    // Anything unrecognised becomes Other(lowercased input).
    static Language fromCode(const std::string& code);

    Id id() const { return id_; }
    bool isAuto() const { return id_ == Id::Auto; }

    // "auto", "fr", "en", ... or the stored code for Other
    std::string code() const;

    // English display name ("French"); the code for Other
    std::string displayName() const;

    bool operator==(const Language& o) const {
        return id_ == o.id_ && (id_ != Id::Other || code_ == o.code_);
    }
    bool operator!=(const Language& o) const { return !(*this == o); }

private:
    Id          id_ = Id::Auto;
    std::string code_;   // only meaningful for Id::Other
};

#pragma once
#include <string>
#include <utility>

// Transcription result emitted by an engine.
// Partial results may be superseded by a later Partial or resolved into a
// Final. Finals are never revised.
struct SttEvent {
    enum class Kind {
        Partial,
        Final
    };

    Kind        kind = Kind::Partial;
    std::string text;

    static SttEvent makePartial(std::string t) { return {Kind::Partial, std::move(t)}; }
    static SttEvent makeFinal(std::string t)   { return {Kind::Final, std::move(t)}; }

    bool isFinal() const { return kind == Kind::Final; }

    bool operator==(const SttEvent& o) const {
        return kind == o.kind && text == o.text;
    }
};

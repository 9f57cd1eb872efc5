#pragma once
#include "stt/SttEvent.hpp"
#include <string>

// Running text of one recording. A Partial replaces the pending partial;
// a Final is appended for good and clears it.
class Transcript {
public:
    void apply(const SttEvent& event) {
        if (event.isFinal()) {
            if (!finalText_.empty()) finalText_ += ' ';
            finalText_ += event.text;
            partialText_.clear();
        } else {
            partialText_ = event.text;
        }
    }

    void clear() {
        finalText_.clear();
        partialText_.clear();
    }

    const std::string& finalText() const { return finalText_; }
    const std::string& partialText() const { return partialText_; }

    // Finals followed by the pending partial, trimmed
    std::string text() const {
        std::string t = finalText_;
        if (!partialText_.empty()) {
            if (!t.empty()) t += ' ';
            t += partialText_;
        }
        const char* ws = " \t\r\n";
        auto b = t.find_first_not_of(ws);
        if (b == std::string::npos) return "";
        auto e = t.find_last_not_of(ws);
        return t.substr(b, e - b + 1);
    }

    bool empty() const { return finalText_.empty() && partialText_.empty(); }

private:
    std::string finalText_;
    std::string partialText_;
};

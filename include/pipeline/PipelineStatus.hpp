#pragma once
#include <string>

struct PipelineStatus {
    enum class State {
        Stopped,
        Starting,
        Running,
        Stopping,
        Error
    };

    State       state = State::Stopped;
    std::string message;   // only set for Error

    static PipelineStatus error(const std::string& msg) {
        return {State::Error, msg};
    }

    bool is(State s) const { return state == s; }

    bool operator==(const PipelineStatus& o) const {
        return state == o.state && message == o.message;
    }
    bool operator!=(const PipelineStatus& o) const { return !(*this == o); }

    std::string toString() const {
        switch (state) {
            case State::Stopped:  return "stopped";
            case State::Starting: return "starting";
            case State::Running:  return "running";
            case State::Stopping: return "stopping";
            case State::Error:    return "error: " + message;
        }
        return "unknown";
    }
};

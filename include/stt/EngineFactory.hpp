#pragma once
#include "BufferedSttEngine.hpp"
#include "config/AppConfig.hpp"
#include <memory>

// Build the engine selected by config.sttEngine:
//   "openai" (default for unknown values), "voxtral", "gemini",
//   "local" / "whisper-local", "voxtral-local".
// Throws SttError when credentials or the model reference are missing.
std::unique_ptr<ISttEngine> createEngine(const AppConfig& config);

// Dispatch policy derived from the config for a network or local engine
DispatchPolicy dispatchPolicyFor(const AppConfig& config, bool local);

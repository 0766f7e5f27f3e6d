#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/llm/provider.hpp"

namespace tracebrain::llm {

// Builds the configured provider, or nullptr when no provider is set.
// Credentials named by api_key_env are read here, once, at startup.
// Throws std::runtime_error for incomplete configuration.
std::shared_ptr<LanguageModelProvider> MakeProvider(const tracebrain::runtime::config::LlmConfig& config);

} // namespace tracebrain::llm

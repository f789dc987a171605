#pragma once
#include <stdexcept>
#include <string>

namespace sciclaw {

// Recoverable: one backend failed, the resolver moves on to the next one.
class ProviderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Prompt exceeded the model's input window; recovered once per iteration.
class ContextOverflowError : public ProviderError {
public:
    using ProviderError::ProviderError;
};

// A tool failed; becomes a failed tool result, never aborts a turn.
class ToolExecutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SandboxTimeoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SandboxCrashError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SandboxPolicyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Missing interpreter, no available provider at all. Fatal for the turn.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace sciclaw

// Error values carried by operation outcomes (no exceptions cross module boundaries).
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Forge {

enum class ErrorKind {
    NotFound,           // missing creature / item / battle / floor
    Validation,         // bad input; every failing condition is listed
    Conflict,           // input consumed by someone else before the destructive commit
    GenerationFailure   // result invalid after all fallbacks (contract violation)
};

struct Error {
    ErrorKind kind{ErrorKind::Validation};
    std::vector<std::string> messages;

    // "Validation: a; b; c"
    std::string describe() const;
};

const char* errorKindName(ErrorKind kind);

inline Error makeError(ErrorKind kind, std::string message) {
    Error e{};
    e.kind = kind;
    e.messages.push_back(std::move(message));
    return e;
}

// Collects violations so callers can report all of them at once.
class ErrorList {
public:
    void add(ErrorKind kind, std::string message);
    bool empty() const { return messages_.empty(); }

    // The most severe kind seen: GenerationFailure, then Validation, NotFound, Conflict.
    std::optional<Error> finish() const;

private:
    std::vector<std::string> messages_;
    ErrorKind kind_{ErrorKind::Conflict};
};

}  // namespace Forge

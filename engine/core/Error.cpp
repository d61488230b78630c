#include "Error.h"

namespace Forge {

namespace {
int severity(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Conflict: return 0;
        case ErrorKind::NotFound: return 1;
        case ErrorKind::Validation: return 2;
        case ErrorKind::GenerationFailure: return 3;
    }
    return 3;
}
}  // namespace

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::Validation:
            return "Validation";
        case ErrorKind::Conflict:
            return "Conflict";
        case ErrorKind::GenerationFailure:
        default:
            return "GenerationFailure";
    }
}

std::string Error::describe() const {
    std::string out = errorKindName(kind);
    out += ": ";
    for (std::size_t i = 0; i < messages.size(); ++i) {
        if (i > 0) out += "; ";
        out += messages[i];
    }
    return out;
}

void ErrorList::add(ErrorKind kind, std::string message) {
    if (messages_.empty() || severity(kind) > severity(kind_)) kind_ = kind;
    messages_.push_back(std::move(message));
}

std::optional<Error> ErrorList::finish() const {
    if (messages_.empty()) return std::nullopt;
    Error e{};
    e.kind = kind_;
    e.messages = messages_;
    return e;
}

}  // namespace Forge

#include "extract/failure.hpp"

namespace pystruct::extract {

auto failure_kind_name(FailureKind kind) -> std::string_view {
    switch (kind) {
    case FailureKind::Syntax:
        return "syntax";
    case FailureKind::Io:
        return "io";
    case FailureKind::Cancelled:
        return "cancelled";
    }
    return "syntax";
}

auto parse_failure_kind(std::string_view name) -> std::optional<FailureKind> {
    if (name == "syntax") {
        return FailureKind::Syntax;
    }
    if (name == "io") {
        return FailureKind::Io;
    }
    if (name == "cancelled") {
        return FailureKind::Cancelled;
    }
    return std::nullopt;
}

auto ExtractionFailure::to_string() const -> std::string {
    std::string out = file;
    if (line > 0) {
        out += ':' + std::to_string(line) + ':' + std::to_string(column);
    }
    out += ": ";
    switch (kind) {
    case FailureKind::Syntax:
        out += "syntax error: ";
        break;
    case FailureKind::Io:
        out += "I/O error: ";
        break;
    case FailureKind::Cancelled:
        out += "cancelled: ";
        break;
    }
    out += message;
    return out;
}

} // namespace pystruct::extract

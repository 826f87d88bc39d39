#ifndef PYSTRUCT_EXTRACT_FAILURE_HPP
#define PYSTRUCT_EXTRACT_FAILURE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pystruct::extract {

/// Why a file did not produce a module.
enum class FailureKind {
    Syntax,    ///< The text could not be parsed.
    Io,        ///< The file could not be read.
    Cancelled, ///< The run was cancelled before the file finished.
};

/// Returns the report name of a kind: "syntax", "io" or "cancelled".
[[nodiscard]] auto failure_kind_name(FailureKind kind) -> std::string_view;

[[nodiscard]] auto parse_failure_kind(std::string_view name) -> std::optional<FailureKind>;

/// A per-file failure. Never fatal to the run.
struct ExtractionFailure {
    FailureKind kind = FailureKind::Syntax;
    std::string file; ///< Path relative to the repository root.
    std::string message;
    uint32_t line = 0;   ///< 1-based, 0 when unknown.
    uint32_t column = 0; ///< 1-based, 0 when unknown.

    /// Formats as "pkg/mod.py:3:7: syntax error: expected ':'".
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const ExtractionFailure& other) const -> bool = default;
};

} // namespace pystruct::extract

#endif // PYSTRUCT_EXTRACT_FAILURE_HPP

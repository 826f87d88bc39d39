//! # Signatures
//!
//! Derivation of `signature` and `full_signature`:
//!
//! ```text
//! signature      = name "(" param ("," " " param)* ")" [" -> " return]
//! param          = ["*" | "**"] name [": " type]
//! full_signature = signature                      (no decorators)
//!                | annotations "\n" signature      (otherwise)
//! ```
//!
//! Types and the return are already normalized by the parser, so the same
//! declaration always renders the same bytes.
//!
//! # Example
//!
//! ```python
//! @lru_cache(maxsize=None)
//! def fib(n: int, *rest, **opts: Any) -> int: ...
//! ```
//!
//! signature: `fib(n: int, *rest, **opts: Any) -> int`
//! full_signature: `@lru_cache(maxsize=None)\nfib(n: int, *rest, **opts: Any) -> int`

#ifndef PYSTRUCT_MODEL_SIGNATURE_HPP
#define PYSTRUCT_MODEL_SIGNATURE_HPP

#include "model/entities.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pystruct::model {

/// The authored fields of a callable; `make_callable()` derives the rest.
struct CallableParts {
    std::string name;
    std::vector<Parameter> parameters;
    std::string annotations;
    std::optional<std::string> return_type;
    std::string body;
    uint32_t line_number = 0;
    uint32_t col_offset = 0;
};

[[nodiscard]] auto render_signature(std::string_view name, const std::vector<Parameter>& parameters,
                                    const std::optional<std::string>& return_type)
    -> std::string;

[[nodiscard]] auto render_full_signature(std::string_view annotations, std::string_view signature)
    -> std::string;

/// Builds a callable and computes its signatures.
[[nodiscard]] auto make_callable(CallableParts parts) -> Callable;

[[nodiscard]] auto make_function(CallableParts parts, std::string file) -> Function;

/// Builds a method; the constructor flag is set iff the name is `__init__`.
[[nodiscard]] auto make_method(CallableParts parts) -> Method;

} // namespace pystruct::model

#endif // PYSTRUCT_MODEL_SIGNATURE_HPP

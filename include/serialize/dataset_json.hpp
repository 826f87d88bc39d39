//! # Dataset Serialization
//!
//! Converts entity trees to and from the dataset JSON schema. A dataset
//! document is an array of repositories:
//!
//! ```text
//! repository: { name, url, pypi_tag, git_commit_hash, modules }
//! module:     { name, file_path, functions, classes }
//! function:   { identifier, parameters, annotations, return, body, signature,
//!               full_signature, file, line_number, col_offset }
//! class:      { identifier, methods, superclasses, fields, file }
//! method:     { identifier, parameters, annotations, return, body, signature,
//!               full_signature, constructor, line_number, col_offset }
//! parameter:  { identifier, type, line_number, col_offset, kind }
//! field:      { name, type }
//! ```
//!
//! Keys are written in the order above. Absent types and return types are
//! written as `null`.
//!
//! ## Reading
//!
//! The reader validates every required key and type and reports the first
//! problem with a JSON path (`$[0].modules[2].functions[0].identifier`).
//! `signature` and `full_signature` are recomputed from the other fields
//! rather than trusted. A missing `kind` reads as `regular`; missing
//! positions read as 0.

#ifndef PYSTRUCT_SERIALIZE_DATASET_JSON_HPP
#define PYSTRUCT_SERIALIZE_DATASET_JSON_HPP

#include "common.hpp"
#include "json/json_value.hpp"
#include "model/entities.hpp"

#include <string>
#include <string_view>

namespace pystruct::serialize {

/// A dataset document that does not match the schema.
struct DatasetError {
    std::string message;
    std::string path; ///< JSON path of the offending value, `$` for the root.

    /// Formats as `"$[0].modules: expected an array"`.
    [[nodiscard]] auto to_string() const -> std::string {
        return path + ": " + message;
    }
};

// ============================================================================
// Writing
// ============================================================================

[[nodiscard]] auto to_json(const model::Parameter& parameter) -> json::JsonValue;
[[nodiscard]] auto to_json(const model::Function& function) -> json::JsonValue;
[[nodiscard]] auto to_json(const model::Method& method) -> json::JsonValue;
[[nodiscard]] auto to_json(const model::Class& cls) -> json::JsonValue;
[[nodiscard]] auto to_json(const model::Module& module) -> json::JsonValue;
[[nodiscard]] auto to_json(const model::Repository& repository) -> json::JsonValue;
[[nodiscard]] auto to_json(const model::Dataset& dataset) -> json::JsonValue;

/// Renders a dataset as indented JSON text.
[[nodiscard]] auto write_dataset(const model::Dataset& dataset) -> std::string;

// ============================================================================
// Reading
// ============================================================================

[[nodiscard]] auto repository_from_json(const json::JsonValue& value)
    -> Result<Rc<const model::Repository>, DatasetError>;

/// Reads a dataset array. A single repository object is also accepted and
/// read as a one-element dataset.
[[nodiscard]] auto dataset_from_json(const json::JsonValue& value)
    -> Result<model::Dataset, DatasetError>;

/// Parses and reads dataset JSON text.
[[nodiscard]] auto read_dataset(std::string_view text) -> Result<model::Dataset, DatasetError>;

} // namespace pystruct::serialize

#endif // PYSTRUCT_SERIALIZE_DATASET_JSON_HPP

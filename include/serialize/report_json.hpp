//! # Run Report Serialization
//!
//! ```json
//! {
//!   "files_discovered": 3,
//!   "modules_extracted": 2,
//!   "elapsed_ms": 41,
//!   "failures": [
//!     { "file": "pkg/bad.py", "kind": "syntax", "message": "...", "line": 3, "column": 7 }
//!   ],
//!   "filters": [
//!     { "filter": "NoStringTypeFilter", "removed": { "repositories": 0, "modules": 0, ... } }
//!   ]
//! }
//! ```
//!
//! Per-file failures and filter removals are kept in separate sections.

#ifndef PYSTRUCT_SERIALIZE_REPORT_JSON_HPP
#define PYSTRUCT_SERIALIZE_REPORT_JSON_HPP

#include "extract/repository_extractor.hpp"
#include "filter/filter.hpp"
#include "json/json_value.hpp"
#include "model/stats.hpp"

namespace pystruct::serialize {

[[nodiscard]] auto to_json(const extract::ExtractionFailure& failure) -> json::JsonValue;
[[nodiscard]] auto to_json(const filter::RemovalCounts& counts) -> json::JsonValue;
[[nodiscard]] auto to_json(const filter::FilterReport& report) -> json::JsonValue;
[[nodiscard]] auto to_json(const model::EntityCounts& counts) -> json::JsonValue;

/// The full report of an extraction run.
[[nodiscard]] auto report_to_json(const extract::ExtractionReport& extraction,
                                  const filter::FilterReport& filters) -> json::JsonValue;

} // namespace pystruct::serialize

#endif // PYSTRUCT_SERIALIZE_REPORT_JSON_HPP

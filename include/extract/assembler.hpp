//! # Entity Assembler
//!
//! Folds per-file outcomes into a `Repository`: modules keep input order,
//! failures are collected separately. There is no renaming, deduplication or
//! cross-module resolution; each module stands alone.

#ifndef PYSTRUCT_EXTRACT_ASSEMBLER_HPP
#define PYSTRUCT_EXTRACT_ASSEMBLER_HPP

#include "common.hpp"
#include "extract/failure.hpp"
#include "extract/parallel.hpp"
#include "model/entities.hpp"

#include <vector>

namespace pystruct::extract {

struct Assembly {
    Rc<const model::Repository> repository;
    std::vector<ExtractionFailure> failures; ///< In input order.
};

[[nodiscard]] auto assemble_repository(model::RepositoryIdentity identity,
                                       std::vector<FileOutcome> outcomes) -> Assembly;

} // namespace pystruct::extract

#endif // PYSTRUCT_EXTRACT_ASSEMBLER_HPP

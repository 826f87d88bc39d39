#ifndef PYSTRUCT_MODEL_STATS_HPP
#define PYSTRUCT_MODEL_STATS_HPP

#include "model/entities.hpp"

#include <cstddef>

namespace pystruct::model {

/// Entity counts of a tree or a whole dataset.
struct EntityCounts {
    size_t repositories = 0;
    size_t modules = 0;
    size_t classes = 0;
    size_t functions = 0;
    size_t methods = 0;
    size_t parameters = 0;
    size_t typed_parameters = 0; ///< Parameters with a declared type.
    size_t typed_callables = 0;  ///< Functions and methods with any declared type.

    auto operator+=(const EntityCounts& other) -> EntityCounts&;

    [[nodiscard]] auto operator==(const EntityCounts& other) const -> bool = default;
};

[[nodiscard]] auto count_entities(const Repository& repository) -> EntityCounts;
[[nodiscard]] auto count_entities(const Dataset& dataset) -> EntityCounts;

} // namespace pystruct::model

#endif // PYSTRUCT_MODEL_STATS_HPP

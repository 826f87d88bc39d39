#include "extract/assembler.hpp"

namespace pystruct::extract {

auto assemble_repository(model::RepositoryIdentity identity, std::vector<FileOutcome> outcomes)
    -> Assembly {
    model::Repository repository{.identity = std::move(identity), .modules = {}};
    std::vector<ExtractionFailure> failures;

    for (auto& outcome : outcomes) {
        if (is_err(outcome)) {
            failures.push_back(std::move(unwrap_err(outcome)));
        } else {
            repository.modules.push_back(make_rc<model::Module>(std::move(unwrap(outcome))));
        }
    }

    return Assembly{.repository = make_rc<model::Repository>(std::move(repository)),
                    .failures = std::move(failures)};
}

} // namespace pystruct::extract

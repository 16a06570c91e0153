#pragma once

#include <tabula/core/error.hpp>
#include <tabula/engine/dataset.hpp>

#include <filesystem>
#include <string_view>

namespace tabula {

/// Persists a dataset as one delimited file with a header row.
///
/// The file at `target` is replaced atomically; partitioned datasets are
/// coalesced into the single artifact. Fails with IOError; never retried.
class Sink {
   public:
    virtual ~Sink() = default;

    [[nodiscard]] virtual auto persist(std::string_view name, const Dataset& dataset,
                                       const std::filesystem::path& target) -> Status = 0;
};

}  // namespace tabula

#pragma once

#include <tabula/core/logging.hpp>
#include <tabula/engine/aggregation.hpp>
#include <tabula/engine/compute_context.hpp>
#include <tabula/engine/normalizer.hpp>
#include <tabula/engine/row_source.hpp>
#include <tabula/engine/sink.hpp>
#include <tabula/io/csv.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace tabula {

enum class BackendKind : std::uint8_t {
    Local,
    Distributed,
};

/// "local" or "distributed".
[[nodiscard]] auto to_string(BackendKind kind) -> std::string_view;
[[nodiscard]] auto parse_backend_kind(std::string_view text) -> std::optional<BackendKind>;

/// Options shared by every stage of a backend.
struct EngineOptions {
    LoggerPtr logger;
    io::CsvReadOptions csv_read;
    io::CsvWriteOptions csv_write;
    std::vector<ViewSpec> views = default_views();
};

/// One implementation of the four-stage contract.
struct Backend {
    BackendKind kind = BackendKind::Local;
    std::unique_ptr<RowSource> source;
    std::unique_ptr<Normalizer> normalizer;
    std::unique_ptr<AggregationEngine> aggregator;
    std::unique_ptr<Sink> sink;
};

/// Synchronous, single-threaded stages over one in-memory partition.
[[nodiscard]] auto make_local_backend(EngineOptions options = {}) -> Backend;

/// Stages that run partition tasks on `context`. The context must outlive the
/// returned backend.
[[nodiscard]] auto make_distributed_backend(ComputeContext& context, EngineOptions options = {})
    -> Backend;

/// Select a backend by kind. Throws std::invalid_argument when a distributed
/// backend is requested without a context.
[[nodiscard]] auto make_backend(BackendKind kind, EngineOptions options,
                                ComputeContext* context = nullptr) -> Backend;

}  // namespace tabula

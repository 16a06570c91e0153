#include <tabula/engine/backend.hpp>

#include <stdexcept>

namespace tabula {

auto to_string(BackendKind kind) -> std::string_view {
    switch (kind) {
        case BackendKind::Local:
            return "local";
        case BackendKind::Distributed:
            return "distributed";
    }
    return "local";
}

auto parse_backend_kind(std::string_view text) -> std::optional<BackendKind> {
    if (text == "local") {
        return BackendKind::Local;
    }
    if (text == "distributed") {
        return BackendKind::Distributed;
    }
    return std::nullopt;
}

auto make_backend(BackendKind kind, EngineOptions options, ComputeContext* context) -> Backend {
    if (kind == BackendKind::Local) {
        return make_local_backend(std::move(options));
    }
    if (context == nullptr) {
        throw std::invalid_argument("distributed backend requires a compute context");
    }
    return make_distributed_backend(*context, std::move(options));
}

}  // namespace tabula

#pragma once

/// Convenience umbrella header for the Tabula library.

#include <tabula/core/column.hpp>
#include <tabula/core/error.hpp>
#include <tabula/core/table.hpp>
#include <tabula/engine/aggregation.hpp>
#include <tabula/engine/backend.hpp>
#include <tabula/engine/compute_context.hpp>
#include <tabula/pipeline/pipeline.hpp>

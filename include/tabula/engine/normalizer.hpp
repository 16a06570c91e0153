#pragma once

#include <tabula/core/error.hpp>
#include <tabula/engine/dataset.hpp>

namespace tabula {

/// Type-coerces a loaded dataset and adds the derived columns.
///
/// Returns a new dataset; the input is never modified. Normalizing an already
/// normalized dataset reproduces it exactly.
class Normalizer {
   public:
    virtual ~Normalizer() = default;

    [[nodiscard]] virtual auto normalize(const Dataset& dataset) -> Result<Dataset> = 0;
};

/// Normalize one partition:
///  - `timestamp` parsed; `date`, `year`, `month`, `day`, `day_of_week`
///    (Monday = 0) derived from it,
///  - `price` to double, `quantity` to int64, `rating` to double,
///  - `total_price = price * quantity`,
///  - missing `rating` replaced by 0 (an absent column counts as all missing),
///  - `is_gift`, if present, from boolean to {0, 1}.
///
/// Fails with TypeCoercionError naming the column and offending value, or
/// MissingColumnError when `timestamp`, `price` or `quantity` is absent.
[[nodiscard]] auto normalize_table(const Table& input) -> Result<Table>;

}  // namespace tabula

#include <tabula/core/column.hpp>
#include <tabula/core/time.hpp>

#include <cstdint>
#include <string>

// Column<T> is header-only; the instantiations below cover every element type
// a table column can hold.

namespace tabula {

template class Column<std::int64_t>;
template class Column<double>;
template class Column<std::string>;
template class Column<Date>;
template class Column<Timestamp>;

}  // namespace tabula

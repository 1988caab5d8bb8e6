#include <framecheck/core/column.hpp>
#include <framecheck/core/time.hpp>

#include <cstdint>
#include <string>

namespace framecheck {

// Explicit instantiations for the element types of ColumnValue.
template class Column<std::int64_t>;
template class Column<double>;
template class Column<std::string>;
template class Column<Bool>;
template class Column<Timestamp>;
template class Column<Date>;

}  // namespace framecheck

#include <boxcar/core/column.hpp>
#include <boxcar/core/time.hpp>

#include <cstdint>
#include <string>

// Explicit instantiations for every element type a Table can hold.

namespace boxcar {

template class Column<std::int16_t>;
template class Column<std::int32_t>;
template class Column<double>;
template class Column<std::string>;
template class Column<bool>;
template class Column<Timestamp>;

}  // namespace boxcar

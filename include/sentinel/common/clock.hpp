#pragma once

#include <sentinel/schema/primitives.hpp>

#include <functional>

namespace sentinel::common {

/// Wall-clock source in UTC milliseconds since the Unix epoch.
///
/// Every component that stamps records or checks a time window takes one of
/// these instead of reading the system clock directly.
using clock_source_t =
    std::function<sentinel::schema::timestamp_milliseconds_t()>;

clock_source_t system_clock();

}  // namespace sentinel::common

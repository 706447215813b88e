#ifndef ANP_UTIL_TYPES_HPP
#define ANP_UTIL_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <vector>

namespace anp::util {

using Bytes = std::vector<uint8_t>;
using Duration = std::chrono::milliseconds;

} //namespace anp::util

#endif

#pragma once

#include <cstddef>
#include <cstdint>

namespace parsable {

using u32 = std::uint32_t;
using uz  = std::size_t;

} // namespace parsable

#pragma once
#include <cstdint>
#include <vector>

namespace tailor {

using u64 = std::uint64_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
using f64 = double;

using Vec = std::vector<f64>;

}

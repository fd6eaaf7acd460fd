#pragma once
#include <cstdint>
#include <vector>
#include "tailor/state.hpp"

namespace tailor {
    std::uint64_t hash_state_fingerprint(const ShopState& st);
    std::uint64_t hash_history_fingerprint(const std::vector<ShopState>& history);
}

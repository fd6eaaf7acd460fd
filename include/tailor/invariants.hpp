#pragma once
#include "tailor/config.hpp"
#include "tailor/state.hpp"

namespace tailor {

void check_invariants(const ShopConfig& cfg, const ShopState& st);

}

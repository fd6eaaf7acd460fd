#include "tailor/fingerprint.hpp"
#include <cstdint>
#include <cstring>

namespace tailor {

static constexpr std::uint64_t FNV_OFFSET = 1469598103934665603ull;
static constexpr std::uint64_t FNV_PRIME = 1099511628211ull;

static std::uint64_t fnv1a_u64(const void* data, std::size_t n) {
  const std::uint8_t* p = (const std::uint8_t*)data;
  std::uint64_t h = FNV_OFFSET;
  for (std::size_t i = 0; i < n; ++i) {
    h ^= (std::uint64_t)p[i];
    h *= FNV_PRIME;
  }
  return h;
}

static void hash_double(std::uint64_t& h, double x) {
  std::uint64_t bits = 0;
  std::memcpy(&bits, &x, sizeof(bits));
  h ^= fnv1a_u64(&bits, sizeof(bits));
  h *= FNV_PRIME;
}

static void hash_int(std::uint64_t& h, std::int64_t x) {
  h ^= fnv1a_u64(&x, sizeof(x));
  h *= FNV_PRIME;
}

static void mix_costs(std::uint64_t& h, const CostBreakdown& c) {
  hash_double(h, c.material);
  hash_double(h, c.wages);
  hash_double(h, c.benefits);
  hash_double(h, c.advertising);
  hash_double(h, c.maintenance);
  hash_double(h, c.machine_trade);
  hash_double(h, c.outlet_trade);
  hash_double(h, c.storage);
  hash_double(h, c.rent);
  hash_double(h, c.interest);
}

static void mix_state(std::uint64_t& h, const ShopState& st) {
  hash_int(h, st.period);

  hash_double(h, st.inventory.material_stock);
  hash_double(h, st.inventory.finished_stock);
  hash_double(h, st.inventory.storage_capacity);

  hash_int(h, st.workforce.workers);
  hash_double(h, st.workforce.motivation);
  hash_double(h, st.workforce.wage);
  hash_double(h, st.workforce.benefits);

  hash_int(h, st.machines.machines);
  hash_double(h, st.machines.wear);
  hash_double(h, st.machines.maintenance_backlog);

  hash_double(h, st.production.capacity);
  hash_double(h, st.production.material_limit);
  hash_double(h, st.production.units_produced);
  hash_double(h, st.production.overflow_discarded);
  hash_double(h, st.production.idle_ratio);

  hash_double(h, st.commercial.price);
  hash_double(h, st.commercial.advertising);
  hash_double(h, st.commercial.awareness);
  hash_double(h, st.commercial.demand);
  hash_double(h, st.commercial.units_sold);
  hash_double(h, st.commercial.lost_sales);
  hash_double(h, st.commercial.material_price);
  hash_int(h, st.commercial.outlets);
  hash_int(h, st.commercial.location);

  hash_double(h, st.financial.cash);
  hash_double(h, st.financial.revenue);
  hash_double(h, st.financial.cost);
  mix_costs(h, st.financial.costs);
  hash_double(h, st.financial.profit);
  hash_double(h, st.financial.previous_profit);
  hash_double(h, st.financial.cumulative_profit);
  hash_double(h, st.financial.credit_factor);
  hash_double(h, st.financial.company_value);

  for (const auto& w : st.warnings) {
    hash_int(h, (std::int64_t)w.kind);
    h ^= fnv1a_u64(w.message.data(), w.message.size());
    h *= FNV_PRIME;
  }
}

std::uint64_t hash_state_fingerprint(const ShopState& st) {
  std::uint64_t h = FNV_OFFSET;
  mix_state(h, st);
  return h;
}

std::uint64_t hash_history_fingerprint(const std::vector<ShopState>& history) {
  std::uint64_t h = FNV_OFFSET;
  for (const auto& st : history) mix_state(h, st);
  return h;
}

}

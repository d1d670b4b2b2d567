#pragma once

#include "orbitwarp/core/energy_pool.h"
#include "orbitwarp/core/vec2.h"
#include "orbitwarp/core/warp_config.h"
#include "orbitwarp/core/warp_memory.h"
#include "orbitwarp/core/warp_types.h"

namespace orbitwarp {

// Breakdown of a warp price.
//
// cost = floor(max(base_cost * multiplier, min_cost_fraction * base_cost))
// where multiplier is the product of the five learned factors. When the quote
// was computed without a full context (`adaptive == false`) every factor is 1.0
// and cost == base_cost.
struct WarpQuote {
  double distance{0.0};
  double base_cost{0.0};

  double familiarity{1.0};
  double mastery{1.0};
  double emergency_score{0.0};
  double emergency{1.0};
  double exploration{1.0};
  double affinity{1.0};

  double multiplier{1.0};
  double cost{0.0};

  bool adaptive{false};
  // The floor under the learned discounts was hit.
  bool floored{false};
};

// Pure pricing: reads the memory and the energy pool, never mutates either.
class CostEngine {
 public:
  CostEngine(const EnergyPool& energy, const WarpMemory& memory, const CostConfig& cfg = CostConfig{});

  // Static fallback: the physics base cost.
  WarpQuote quote(double distance) const;

  // Any null argument falls back to the static base cost.
  WarpQuote quote(double distance, const Vec2* source, const Destination* dest, const WarpContext* ctx) const;

  // Measures the distance from `source` to the destination itself.
  WarpQuote quote_for(const Vec2& source, const Destination& dest, const WarpContext& ctx) const;

  bool affordable(const WarpQuote& q) const { return energy_.has_energy(q.cost); }

  const CostConfig& config() const { return cfg_; }

 private:
  const EnergyPool& energy_;
  const WarpMemory& memory_;
  CostConfig cfg_;
};

} // namespace orbitwarp

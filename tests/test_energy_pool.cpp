#include <cmath>
#include <iostream>
#include <limits>

#include "orbitwarp/core/energy_pool.h"

#define OW_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {
bool approx(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }
} // namespace

int test_energy_pool() {
  using namespace orbitwarp;
  const double nan = std::numeric_limits<double>::quiet_NaN();

  EnergyPool pool;
  OW_ASSERT(approx(pool.current(), 1000.0));
  OW_ASSERT(approx(pool.max(), 1000.0));
  OW_ASSERT(approx(pool.percent(), 1.0));

  // Physics floor.
  OW_ASSERT(approx(pool.base_cost(2500.0), 50.0));
  OW_ASSERT(approx(pool.base_cost(12345.0), 123.0));
  OW_ASSERT(approx(pool.base_cost(0.0), 50.0));
  OW_ASSERT(approx(pool.base_cost(-300.0), 50.0));
  OW_ASSERT(approx(pool.base_cost(nan), 50.0));

  // All-or-nothing consumption.
  OW_ASSERT(pool.has_energy(1000.0));
  OW_ASSERT(!pool.has_energy(1000.5));
  OW_ASSERT(!pool.has_energy(nan));
  OW_ASSERT(pool.consume(50.0));
  OW_ASSERT(approx(pool.current(), 950.0));
  OW_ASSERT(!pool.consume(2000.0));
  OW_ASSERT(approx(pool.current(), 950.0));
  OW_ASSERT(!pool.consume(-10.0));
  OW_ASSERT(!pool.consume(nan));
  OW_ASSERT(approx(pool.current(), 950.0));

  // Regeneration is additive and capped.
  pool.regenerate(0.5);
  OW_ASSERT(approx(pool.current(), 975.0));
  pool.regenerate(0.0);
  pool.regenerate(0.0);
  OW_ASSERT(approx(pool.current(), 975.0));
  pool.regenerate(-3.0);
  pool.regenerate(nan);
  OW_ASSERT(approx(pool.current(), 975.0));
  pool.regenerate(10.0);
  OW_ASSERT(approx(pool.current(), 1000.0));

  // Suspended while a warp is in flight.
  OW_ASSERT(pool.consume(100.0));
  pool.set_regen_suspended(true);
  pool.regenerate(5.0);
  OW_ASSERT(approx(pool.current(), 900.0));
  OW_ASSERT(pool.status().regen_suspended);
  pool.set_regen_suspended(false);
  pool.regenerate(1.0);
  OW_ASSERT(approx(pool.current(), 950.0));

  // Pickups.
  pool.add(30.0);
  OW_ASSERT(approx(pool.current(), 980.0));
  pool.add(-5.0);
  OW_ASSERT(approx(pool.current(), 980.0));
  pool.add(1.0e9);
  OW_ASSERT(approx(pool.current(), 1000.0));

  // Capacity changes keep the fill ratio.
  OW_ASSERT(pool.consume(500.0));
  OW_ASSERT(pool.set_max(2000.0));
  OW_ASSERT(approx(pool.max(), 2000.0));
  OW_ASSERT(approx(pool.current(), 1000.0));
  OW_ASSERT(!pool.set_max(0.0));
  OW_ASSERT(!pool.set_max(-1.0));
  OW_ASSERT(approx(pool.max(), 2000.0));

  {
    EnergyPool up;
    up.upgrade_capacity(1);
    OW_ASSERT(approx(up.max(), 1200.0));
    OW_ASSERT(approx(up.current(), 1200.0));
    up.upgrade_regeneration(2);
    OW_ASSERT(approx(up.regen_per_second(), 75.0));
    up.upgrade_regeneration(0);
    OW_ASSERT(approx(up.regen_per_second(), 50.0));
  }

  // Restored snapshots are sanitized.
  {
    EnergyPool p;
    EnergySnapshot s;
    s.energy = 5000.0;
    s.max_energy = 1500.0;
    s.regen_per_second = 20.0;
    p.restore(s);
    OW_ASSERT(approx(p.max(), 1500.0));
    OW_ASSERT(approx(p.current(), 1500.0));
    OW_ASSERT(approx(p.regen_per_second(), 20.0));

    s.energy = nan;
    s.max_energy = -4.0;
    s.regen_per_second = nan;
    p.restore(s);
    OW_ASSERT(approx(p.max(), 1000.0));
    OW_ASSERT(approx(p.current(), 1000.0));
    OW_ASSERT(approx(p.regen_per_second(), 50.0));

    s.energy = -20.0;
    s.max_energy = 800.0;
    s.regen_per_second = 10.0;
    p.restore(s);
    OW_ASSERT(approx(p.current(), 0.0));

    const EnergySnapshot back = p.snapshot();
    OW_ASSERT(approx(back.max_energy, 800.0));
    OW_ASSERT(approx(back.regen_per_second, 10.0));
  }

  return 0;
}

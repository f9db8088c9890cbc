// ============================================================================
// test_inter_arrival.cpp -- Test exponential inter-arrival time model
// ============================================================================
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <vector>

#include "errors.hpp"
#include "exponential.hpp"
#include "inter_arrival.hpp"

#define EXPECT_TRUE(x) do{ \
  if(!(x)){ \
    std::fprintf(stderr,"EXPECT_TRUE failed: %s @ %s:%d\n",#x,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

#define EXPECT_EQ(a,b) do{ \
  auto _va=(a); auto _vb=(b); \
  if(!((_va)==(_vb))){ \
    std::fprintf(stderr,"EXPECT_EQ failed: %s=%lld %s=%lld @ %s:%d\n", \
                 #a,(long long)_va,#b,(long long)_vb,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

#define EXPECT_NEAR(a,b,tol) do{ \
  double _va=(a); double _vb=(b); \
  if(!(std::fabs(_va-_vb)<=(tol))){ \
    std::fprintf(stderr,"EXPECT_NEAR failed: %s=%.12g %s=%.12g tol=%g @ %s:%d\n", \
                 #a,_va,#b,_vb,(double)(tol),__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

using namespace std::chrono;
using sighting::InsufficientDataError;
using sighting::InterArrivalModel;
using sighting::InvalidArgumentError;
using sighting::SightingEvent;

static SightingEvent on(year_month_day ymd) {
  SightingEvent e;
  e.timestamp = sys_seconds{sys_days{ymd}};
  e.category  = "J";
  e.position  = {48.5, -123.0};
  return e;
}

// ============================================================================
// Test 1: mean of consecutive differences and the survival endpoints
// ============================================================================
void test_basic_fit() {
  auto m = InterArrivalModel::fit_hours({0.0, 10.0, 20.0, 40.0});

  EXPECT_NEAR(m.mean_hours(), 40.0 / 3.0, 1e-12);
  EXPECT_NEAR(m.rate(), 3.0 / 40.0, 1e-12);
  EXPECT_EQ(m.distinct_events(), 4u);

  EXPECT_NEAR(m.survival(0.0), 1.0, 0.0);
  EXPECT_NEAR(m.survival(m.mean_hours()), std::exp(-1.0), 1e-12);
  EXPECT_TRUE(m.survival(1e9) < 1e-12);
  EXPECT_NEAR(sighting::survival_probability(m, 10.0), std::exp(-0.75), 1e-12);

  std::puts("basic fit: OK");
}

// ============================================================================
// Test 2: order and duplicates do not matter
// ============================================================================
void test_dedup_and_sort() {
  auto m = InterArrivalModel::fit_hours({40.0, 0.0, 20.0, 10.0, 10.0, 0.0, 40.0});
  EXPECT_NEAR(m.mean_hours(), 40.0 / 3.0, 1e-12);
  EXPECT_EQ(m.distinct_events(), 4u);

  std::puts("dedup and sort: OK");
}

// ============================================================================
// Test 3: fit from dated events, several sightings per day count once
// ============================================================================
void test_fit_from_events() {
  std::vector<SightingEvent> events{
    on(2021y / July / 4),
    on(2021y / July / 1),
    on(2021y / July / 2),
    on(2021y / July / 2),
    on(2021y / July / 4),
  };
  auto m = InterArrivalModel::fit(events);
  EXPECT_EQ(m.distinct_events(), 3u);
  EXPECT_NEAR(m.mean_hours(), 36.0, 1e-9);   // diffs 24 h, 48 h

  std::puts("fit from events: OK");
}

// ============================================================================
// Test 4: fewer than two distinct timestamps
// ============================================================================
void test_insufficient_data() {
  int threw = 0;
  try { (void)InterArrivalModel::fit({}); }
  catch (const InsufficientDataError&) { ++threw; }

  try { (void)InterArrivalModel::fit({on(2021y / July / 4), on(2021y / July / 4)}); }
  catch (const InsufficientDataError&) { ++threw; }

  try { (void)InterArrivalModel::fit_hours({5.0}); }
  catch (const InsufficientDataError&) { ++threw; }

  EXPECT_EQ(threw, 3);
  std::puts("insufficient data (throws): OK");
}

// ============================================================================
// Test 5: negative or non-finite waits are rejected
// ============================================================================
void test_invalid_wait() {
  auto m = InterArrivalModel::fit_hours({0.0, 24.0});
  int threw = 0;
  try { (void)m.survival(-1.0); }
  catch (const InvalidArgumentError&) { ++threw; }

  try { (void)m.cdf(std::numeric_limits<double>::quiet_NaN()); }
  catch (const InvalidArgumentError&) { ++threw; }

  try { (void)m.survival(std::numeric_limits<double>::infinity()); }
  catch (const InvalidArgumentError&) { ++threw; }

  EXPECT_EQ(threw, 3);
  std::puts("invalid wait (throws): OK");
}

// ============================================================================
// Test 6: cdf and survival are complementary; queries do not refit
// ============================================================================
void test_stateless_queries() {
  auto m = InterArrivalModel::fit_hours({0.0, 5.0, 30.0});
  const double mean = m.mean_hours();
  for (double t : {0.0, 1.0, 7.5, 15.0, 100.0}) {
    EXPECT_NEAR(m.cdf(t) + m.survival(t), 1.0, 1e-12);
    EXPECT_TRUE(m.survival(t) == m.survival(t));
  }
  EXPECT_TRUE(m.mean_hours() == mean);

  EXPECT_NEAR(sighting::exponential_cdf(0.0, 2.0), 0.0, 0.0);
  EXPECT_NEAR(sighting::exponential_sf(2.0, 2.0), std::exp(-1.0), 1e-12);

  std::puts("stateless queries: OK");
}

// ============================================================================
// Main
// ============================================================================
int main() {
  std::puts("Running InterArrivalModel tests...");
  test_basic_fit();
  test_dedup_and_sort();
  test_fit_from_events();
  test_insufficient_data();
  test_invalid_wait();
  test_stateless_queries();
  std::puts("All InterArrivalModel tests PASSED.");
  return 0;
}

// ============================================================================
// test_event_store.cpp -- Test CSV loading and period filters
// ============================================================================
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "errors.hpp"
#include "event_store.hpp"

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

namespace fs = std::filesystem;
using namespace std::chrono;
using sighting::EventStore;
using sighting::InvalidArgumentError;
using sighting::MalformedRecordError;

static const char* SAMPLE =
  "Date,Pod,Latitude,Longitude\n"
  "07/04/21,J,48.52,-123.15\n"
  "\n"
  "07/05/21,\"J, K\",48.50,-123.10\n"
  "08/01/21,L,47.60,-122.40\n"
  "12/31/99,K,49.00,-124.00\n"
  "07/20/2022,JKL,48.40,-123.00\n";

static EventStore parse(const std::string& text,
                        sighting::RecordLayout layout = sighting::RecordLayout::Sightings) {
  std::istringstream in(text);
  return EventStore::from_stream(in, layout);
}

// Expect a MalformedRecordError on `line`.
static void expect_malformed(const std::string& text, std::size_t line,
                             sighting::RecordLayout layout = sighting::RecordLayout::Sightings) {
  bool threw = false;
  try {
    (void)parse(text, layout);
  } catch (const MalformedRecordError& err) {
    EXPECT_EQ(err.line(), line);
    threw = true;
  }
  EXPECT_TRUE(threw);
}

// ============================================================================
// Test 1: header skipped, quoted labels, blank lines
// ============================================================================
void test_parse_sample() {
  auto store = parse(SAMPLE);
  EXPECT_EQ(store.size(), 5u);

  const auto& ev = store.events();
  EXPECT_TRUE(ev[0].category == "J");
  EXPECT_TRUE(ev[1].category == "J, K");
  EXPECT_NEAR(ev[0].position.latitude, 48.52, 1e-12);
  EXPECT_NEAR(ev[0].position.longitude, -123.15, 1e-12);
  EXPECT_TRUE(ev[0].timestamp == sys_seconds{sys_days{2021y / July / 4}});
  EXPECT_TRUE(ev[3].timestamp == sys_seconds{sys_days{1999y / December / 31}});
  EXPECT_TRUE(ev[4].timestamp == sys_seconds{sys_days{2022y / July / 20}});

  std::puts("parse sample: OK");
}

// ============================================================================
// Test 2: date parsing
// ============================================================================
void test_parse_date() {
  EXPECT_TRUE(sighting::parse_date("01/02/68") == sys_days{2068y / January / 2});
  EXPECT_TRUE(sighting::parse_date("01/02/69") == sys_days{1969y / January / 2});
  EXPECT_TRUE(sighting::parse_date(" 2/29/2024 ") == sys_days{2024y / February / 29});

  int threw = 0;
  // 257 and 260 would wrap to 1 and 4 if narrowed to a byte.
  for (const char* bad : {"13/01/21", "02/30/21", "7-4-21", "07/04/021", "07/04", "aa/bb/cc",
                          "257/04/21", "01/260/21", "00/04/21", "07/00/21"}) {
    try { (void)sighting::parse_date(bad); }
    catch (const InvalidArgumentError&) { ++threw; }
  }
  EXPECT_EQ(threw, 10);

  std::puts("parse date: OK");
}

// ============================================================================
// Test 3: CSV row splitting
// ============================================================================
void test_split_row() {
  auto f = sighting::split_csv_row("a,\"b, c\",\"say \"\"hi\"\"\",");
  EXPECT_EQ(f.size(), 4u);
  EXPECT_TRUE(f[1] == "b, c");
  EXPECT_TRUE(f[2] == "say \"hi\"");
  EXPECT_TRUE(f[3].empty());

  bool threw = false;
  try { (void)sighting::split_csv_row("a,\"open"); }
  catch (const InvalidArgumentError&) { threw = true; }
  EXPECT_TRUE(threw);

  std::puts("split row: OK");
}

// ============================================================================
// Test 4: any malformed row fails the whole load
// ============================================================================
void test_malformed_rows() {
  const std::string header = "Date,Pod,Latitude,Longitude\n";
  const std::string good   = "07/04/21,J,48.52,-123.15\n";

  expect_malformed(header + good + "07/04/21,J,abc,-123.15\n", 3);
  expect_malformed(header + good + "07/04/21,J,48.52\n", 3);
  expect_malformed(header + "13/04/21,J,48.52,-123.15\n", 2);
  expect_malformed(header + "257/04/21,J,48.52,-123.15\n", 2);
  expect_malformed(header + good + "01/260/21,J,48.52,-123.15\n", 3);
  expect_malformed(header + good + good + "07/04/21,J,95.0,-123.15\n", 4);
  expect_malformed(header + "07/04/21,J,48.52,-190\n", 2);
  expect_malformed(header + "07/04/21,\"J,48.52,-123.15\n", 2);

  std::puts("malformed rows (throw): OK");
}

// ============================================================================
// Test 5: trailing columns are ignored
// ============================================================================
void test_extra_columns() {
  auto store = parse("Date,Pod,Latitude,Longitude,Observer,Notes\n"
                     "07/04/21,J,48.52,-123.15,ferry,\"breaching, 3 calves\"\n"
                     "07/05/21,K,48.50,-123.10\n");
  EXPECT_EQ(store.size(), 2u);
  EXPECT_TRUE(store.events()[0].category == "J");
  EXPECT_NEAR(store.events()[0].position.longitude, -123.15, 1e-12);
  EXPECT_TRUE(store.events()[1].category == "K");

  std::puts("extra columns: OK");
}

// ============================================================================
// Test 6: history rows need only a valid date
// ============================================================================
void test_dates_only() {
  const auto layout = sighting::RecordLayout::DatesOnly;
  auto store = parse("Date,Pod,Latitude,Longitude\n"
                     "07/04/21,J,,\n"
                     "07/05/21\n"
                     "07/06/21,L,not-a-number,-500\n", layout);
  EXPECT_EQ(store.size(), 3u);
  EXPECT_TRUE(store.events()[0].category == "J");
  EXPECT_TRUE(store.events()[1].category.empty());
  EXPECT_TRUE(store.events()[2].timestamp == sys_seconds{sys_days{2021y / July / 6}});

  // The date itself is still checked.
  expect_malformed("Date\n07/04/21\n13/04/21\n", 3, layout);
  expect_malformed("Date\n257/04/21\n", 2, layout);

  // The same blank coordinates fail a sightings load.
  expect_malformed("Date,Pod,Latitude,Longitude\n07/04/21,J,,\n", 2);

  std::puts("dates-only layout: OK");
}

// ============================================================================
// Test 7: period filters keep original order
// ============================================================================
void test_filters() {
  auto store = parse(SAMPLE);

  auto july = store.select(sighting::by_month(7));
  EXPECT_EQ(july.size(), 3u);
  EXPECT_TRUE(july[0].category == "J");
  EXPECT_TRUE(july[1].category == "J, K");
  EXPECT_TRUE(july[2].category == "JKL");

  EXPECT_EQ(store.select(sighting::by_month(12)).size(), 1u);
  EXPECT_EQ(store.select(sighting::by_month(3)).size(), 0u);
  EXPECT_EQ(store.select(sighting::all_events()).size(), 5u);

  auto range = store.select(sighting::by_date_range(sys_days{2021y / July / 5},
                                                    sys_days{2021y / August / 1}));
  EXPECT_EQ(range.size(), 2u);

  int threw = 0;
  try { (void)sighting::by_month(0); }
  catch (const InvalidArgumentError&) { ++threw; }
  try { (void)sighting::by_month(13); }
  catch (const InvalidArgumentError&) { ++threw; }
  try {
    (void)sighting::by_date_range(sys_days{2021y / July / 5}, sys_days{2021y / July / 4});
  } catch (const InvalidArgumentError&) { ++threw; }
  EXPECT_EQ(threw, 3);

  std::puts("period filters: OK");
}

// ============================================================================
// Test 8: load from disk
// ============================================================================
void test_load_csv() {
  const fs::path path = fs::temp_directory_path() / "sighting_test_event_store.csv";
  {
    std::ofstream out(path);
    out << SAMPLE;
  }
  auto store = EventStore::load_csv(path.string());
  EXPECT_EQ(store.size(), 5u);
  EXPECT_EQ(EventStore::load_csv(path.string(), sighting::RecordLayout::DatesOnly).size(), 5u);
  fs::remove(path);

  bool threw = false;
  try { (void)EventStore::load_csv((fs::temp_directory_path() / "no_such_sightings.csv").string()); }
  catch (const InvalidArgumentError&) { threw = true; }
  EXPECT_TRUE(threw);

  std::puts("load csv: OK");
}

// ============================================================================
// Main
// ============================================================================
int main() {
  std::puts("Running EventStore tests...");
  test_parse_sample();
  test_parse_date();
  test_split_row();
  test_malformed_rows();
  test_extra_columns();
  test_dates_only();
  test_filters();
  test_load_csv();
  std::puts("All EventStore tests PASSED.");
  return 0;
}

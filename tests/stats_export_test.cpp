#include <sstream>
#include <stdexcept>
#include <string>

#include "core/stats_export.hpp"

#include "check.hpp"

static occ::CountSnapshot Sample() {
  occ::CountSnapshot s;
  s.frame_index = 42;

  occ::LineCounts l;
  l.id = "door";
  l.name = "Front, door";
  l.per_class[0] = occ::LineCount{3, 1};
  l.per_class[2] = occ::LineCount{0, 2};
  s.lines.push_back(l);

  occ::ZoneCounts z;
  z.id = "lot";
  z.name = "Lot";
  z.per_class[2] = occ::ZoneCount{5, 4, 1};
  s.zones.push_back(z);
  return s;
}

static void TestCsv() {
  std::ostringstream out;
  occ::WriteCountsCsv(Sample(), out);

  const std::string expected =
      "type,counter_id,counter_name,class_id,class_name,in,out,entries,exits,currently_inside\n"
      "line,door,\"Front, door\",0,person,3,1,,,\n"
      "line,door,\"Front, door\",2,car,0,2,,,\n"
      "zone,lot,Lot,2,car,,,5,4,1\n";
  OCC_CHECK(occ::test::Eq(out.str(), expected));
}

static void TestEmptySnapshot() {
  std::ostringstream out;
  occ::WriteCountsCsv(occ::CountSnapshot{}, out);
  OCC_CHECK(occ::test::Eq(out.str(),
                          "type,counter_id,counter_name,class_id,class_name,in,out,entries,exits,currently_inside\n"));
  OCC_CHECK(occ::test::Eq(occ::FormatCountSummary(occ::CountSnapshot{}), "No counters defined\n"));
}

static void TestSummary() {
  const std::string text = occ::FormatCountSummary(Sample());
  OCC_CHECK(text.find("Front, door [door]: in=3 out=3 total=6") != std::string::npos);
  OCC_CHECK(text.find("  - car: in=0 out=2") != std::string::npos);
  OCC_CHECK(text.find("Lot [lot]: inside=1 entered=5 exited=4") != std::string::npos);
}

static void TestUnwritablePath() {
  OCC_CHECK(occ::test::Throws<std::runtime_error>(
      [&] { occ::WriteCountsCsvFile(Sample(), "does/not/exist/stats.csv"); }));
}

int main() {
  TestCsv();
  TestEmptySnapshot();
  TestSummary();
  TestUnwritablePath();
  return occ::test::Finish("stats_export_test");
}

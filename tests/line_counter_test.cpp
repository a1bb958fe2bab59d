#include "core/line_counter.hpp"

#include "check.hpp"

using occ::CrossingDirection;

static occ::LineDefinition HorizontalLine() {
  occ::LineDefinition def;
  def.id = "line_1";
  def.name = "Line 1";
  def.start = {0.f, 50.f};
  def.end = {100.f, 50.f};
  return def;
}

static void TestSingleCrossing() {
  occ::LineCounter line(HorizontalLine());

  OCC_CHECK(line.observe(1, 0, {50.f, 10.f}, {50.f, 10.f}) == CrossingDirection::None);
  OCC_CHECK(line.observe(1, 0, {50.f, 10.f}, {50.f, 40.f}) == CrossingDirection::None);
  OCC_CHECK(line.observe(1, 0, {50.f, 40.f}, {50.f, 60.f}) == CrossingDirection::In);
  OCC_CHECK(line.observe(1, 0, {50.f, 60.f}, {50.f, 90.f}) == CrossingDirection::None);

  const occ::LineCounts c = line.counts();
  OCC_CHECK(occ::test::Eq(c.of(0).in, 1));
  OCC_CHECK(occ::test::Eq(c.of(0).out, 0));
  OCC_CHECK(occ::test::Eq(c.total().in, 1));
  OCC_CHECK(occ::test::Eq(c.id, "line_1"));
}

static void TestOppositeDirection() {
  occ::LineCounter line(HorizontalLine());
  line.observe(7, 2, {50.f, 90.f}, {50.f, 90.f});
  OCC_CHECK(line.observe(7, 2, {50.f, 90.f}, {50.f, 10.f}) == CrossingDirection::Out);
  OCC_CHECK(occ::test::Eq(line.counts().of(2).out, 1));
  OCC_CHECK(occ::test::Eq(line.counts().of(2).in, 0));
}

static void TestRestingOnLine() {
  occ::LineCounter line(HorizontalLine());
  line.observe(1, 0, {50.f, 40.f}, {50.f, 40.f});

  // Onto the line and back to the same side is not a crossing
  OCC_CHECK(line.observe(1, 0, {50.f, 40.f}, {50.f, 50.f}) == CrossingDirection::None);
  OCC_CHECK(line.observe(1, 0, {50.f, 50.f}, {50.f, 50.f}) == CrossingDirection::None);
  OCC_CHECK(line.observe(1, 0, {50.f, 50.f}, {50.f, 40.f}) == CrossingDirection::None);

  // Through the line via a sample on it counts once
  OCC_CHECK(line.observe(1, 0, {50.f, 40.f}, {50.f, 50.f}) == CrossingDirection::None);
  OCC_CHECK(line.observe(1, 0, {50.f, 50.f}, {50.f, 60.f}) == CrossingDirection::In);
  OCC_CHECK(occ::test::Eq(line.counts().total().in, 1));

  // A track first seen on the line seeds from its next off-line sample
  OCC_CHECK(line.observe(2, 0, {20.f, 50.f}, {20.f, 50.f}) == CrossingDirection::None);
  OCC_CHECK(line.observe(2, 0, {20.f, 50.f}, {20.f, 70.f}) == CrossingDirection::None);
  OCC_CHECK(line.observe(2, 0, {20.f, 70.f}, {20.f, 30.f}) == CrossingDirection::Out);
}

static void TestOscillation() {
  occ::LineCounter line(HorizontalLine());
  line.observe(1, 0, {50.f, 40.f}, {50.f, 40.f});
  for (int i = 0; i < 6; ++i) {
    const float from = (i % 2 == 0) ? 40.f : 60.f;
    const float to = (i % 2 == 0) ? 60.f : 40.f;
    OCC_CHECK(line.observe(1, 0, {50.f, from}, {50.f, to}) != CrossingDirection::None);
  }
  OCC_CHECK(occ::test::Eq(line.counts().of(0).in, 3));
  OCC_CHECK(occ::test::Eq(line.counts().of(0).out, 3));
}

static void TestClassFilter() {
  occ::LineDefinition def = HorizontalLine();
  def.classes = occ::ClassFilter::Only({0});
  occ::LineCounter line(def);

  line.observe(1, 2, {50.f, 10.f}, {50.f, 10.f});
  OCC_CHECK(line.observe(1, 2, {50.f, 10.f}, {50.f, 90.f}) == CrossingDirection::None);
  OCC_CHECK(occ::test::Eq(line.counts().total().in, 0));
  OCC_CHECK(line.counts().per_class.empty());

  // Side is tracked even for a disabled class: enabling it later only counts new crossings
  line.set_classes(occ::ClassFilter::All());
  OCC_CHECK(line.observe(1, 2, {50.f, 90.f}, {50.f, 95.f}) == CrossingDirection::None);
  OCC_CHECK(line.observe(1, 2, {50.f, 95.f}, {50.f, 10.f}) == CrossingDirection::Out);

  line.set_classes(occ::ClassFilter::None());
  line.observe(3, 0, {50.f, 10.f}, {50.f, 10.f});
  OCC_CHECK(line.observe(3, 0, {50.f, 10.f}, {50.f, 90.f}) == CrossingDirection::None);
}

static void TestForgetAndReset() {
  occ::LineCounter line(HorizontalLine());
  line.observe(1, 0, {50.f, 10.f}, {50.f, 10.f});
  line.observe(1, 0, {50.f, 10.f}, {50.f, 90.f});
  OCC_CHECK(occ::test::Eq(line.tracked(), 1u));

  line.forget(1);
  OCC_CHECK(occ::test::Eq(line.tracked(), 0u));
  OCC_CHECK(occ::test::Eq(line.counts().total().in, 1));

  line.reset_counts();
  OCC_CHECK(line.counts().per_class.empty());
  OCC_CHECK(occ::test::Eq(line.definition().id, "line_1"));
}

int main() {
  TestSingleCrossing();
  TestOppositeDirection();
  TestRestingOnLine();
  TestOscillation();
  TestClassFilter();
  TestForgetAndReset();
  return occ::test::Finish("line_counter_test");
}

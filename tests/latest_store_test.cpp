#include <atomic>
#include <cstdint>
#include <thread>

#include "core/count_snapshot.hpp"
#include "infra/latest_store.hpp"

#include "check.hpp"

static void TestEmpty() {
  occ::LatestStore<occ::CountSnapshot> store;
  OCC_CHECK(!store.has_value());
  OCC_CHECK(!store.read_latest());
  OCC_CHECK(occ::test::Eq(store.version(), 0u));
}

static void TestOverwrite() {
  occ::LatestStore<occ::CountSnapshot> store;
  for (std::uint64_t f = 1; f <= 3; ++f) {
    occ::CountSnapshot s;
    s.frame_index = f;
    store.write(s);
  }

  const auto latest = store.read_latest();
  OCC_CHECK(latest.has_value());
  OCC_CHECK(occ::test::Eq(latest->frame_index, 3u));
  OCC_CHECK(occ::test::Eq(store.version(), 3u));
}

static void TestReadIfNewer() {
  occ::LatestStore<occ::CountSnapshot> store;
  std::uint64_t seen = 0;
  OCC_CHECK(!store.read_if_newer(seen));

  occ::CountSnapshot s;
  s.frame_index = 7;
  store.write(s);

  const auto first = store.read_if_newer(seen);
  OCC_CHECK(first.has_value());
  OCC_CHECK(occ::test::Eq(seen, 1u));
  OCC_CHECK(!store.read_if_newer(seen));
}

static void TestConcurrentWriter() {
  occ::LatestStore<occ::CountSnapshot> store;
  std::atomic_bool done{false};

  std::thread writer([&] {
    for (std::uint64_t f = 1; f <= 2000; ++f) {
      occ::CountSnapshot s;
      s.frame_index = f;
      store.write(s);
    }
    done.store(true);
  });

  // Readers only ever see frame indices moving forward
  std::uint64_t last = 0;
  while (!done.load()) {
    if (auto s = store.read_latest()) {
      OCC_CHECK(s->frame_index >= last);
      last = s->frame_index;
    }
  }
  writer.join();
  OCC_CHECK(occ::test::Eq(store.read_latest()->frame_index, 2000u));
}

int main() {
  TestEmpty();
  TestOverwrite();
  TestReadIfNewer();
  TestConcurrentWriter();
  return occ::test::Finish("latest_store_test");
}

#include <gtest/gtest.h>

#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "test_support.hpp"

TEST(Concurrency, FirstAccessComputesOnce) {
  RegistryFixture fx;
  auto id = define(fx.catalog, make_model("Reading", {int_field("a"), int_field("b")}));

  constexpr int kThreads = 16;
  std::vector<std::string> hashes(kThreads);
  run_concurrent(kThreads, [&](int index) {
    auto hash = fx.registry.get_or_create(id);
    hashes[static_cast<std::size_t>(index)] = hash ? *hash : std::string{};
  });

  for (const auto& hash : hashes) {
    EXPECT_EQ(hash, hashes.front());
  }
  EXPECT_FALSE(hashes.front().empty());
  EXPECT_EQ(fx.provider->calls(), 3);
}

TEST(Concurrency, ManyTypesStayIndependent) {
  RegistryFixture fx;
  constexpr int kTypes = 8;
  std::vector<sid::identity::TypeId> ids;
  for (int i = 0; i < kTypes; ++i) {
    ids.push_back(define(fx.catalog, make_model("M" + std::to_string(i), {int_field("value")})));
  }

  constexpr int kThreads = 12;
  std::mutex mutex;
  std::set<std::string> seen;
  run_concurrent(kThreads, [&](int index) {
    for (int round = 0; round < kTypes; ++round) {
      auto id = ids[static_cast<std::size_t>((index + round) % kTypes)];
      auto report = fx.registry.report(id);
      if (report) {
        std::lock_guard lock(mutex);
        seen.insert(report->hash);
      }
    }
  });

  EXPECT_EQ(seen.size(), static_cast<std::size_t>(kTypes));
  EXPECT_EQ(fx.provider->calls(), 3 * kTypes);
}

TEST(Concurrency, RebuildWhileReading) {
  RegistryFixture fx;
  auto id = define(fx.catalog, make_model("Reading", {int_field("value")}));
  auto expected = fx.hash(id);

  constexpr int kThreads = 8;
  constexpr int kIterations = 50;
  std::atomic<int> mismatches{0};
  run_concurrent(kThreads, [&](int index) {
    for (int i = 0; i < kIterations; ++i) {
      auto hash = index % 2 == 0 ? fx.registry.rebuild(id) : fx.registry.get_or_create(id);
      if (!hash || *hash != expected) {
        mismatches.fetch_add(1, std::memory_order_relaxed);
      }
    }
  });

  EXPECT_EQ(mismatches.load(), 0);
  EXPECT_TRUE(fx.registry.has_hash(id));
}

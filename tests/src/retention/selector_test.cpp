#include <gtest/gtest.h>
#include <snapkeep/policy/parser.hpp>
#include <snapkeep/retention/bucket.hpp>
#include <snapkeep/retention/selector.hpp>
#include <snapkeep/testing/common.hpp>

#include <algorithm>
#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace {

using snapkeep::schema::decision_t;
using snapkeep::schema::granularity_t;
using snapkeep::testing::make_snapshot;
using snapkeep::testing::make_time;

snapkeep::schema::retention_policy_t make_policy(const std::string& text) {
  auto error = std::string{};
  auto policy = snapkeep::policy::try_parse_policy(text, error);
  EXPECT_TRUE(policy.has_value()) << error;
  return policy.value_or(snapkeep::schema::retention_policy_t{});
}

std::set<std::string> identifiers_with(
    const snapkeep::schema::classification_t& classification,
    const decision_t decision) {
  auto out = std::set<std::string>{};
  for (const auto& entry : classification.entries) {
    if (entry.decision == decision) {
      out.insert(entry.snapshot.identifier);
    }
  }
  return out;
}

// One snapshot every `step_hours` hours going back from `newest`.
std::vector<snapkeep::schema::snapshot_t> make_series(
    const snapkeep::schema::timestamp_t& newest,
    const int count,
    const int step_hours) {
  auto out = std::vector<snapkeep::schema::snapshot_t>{};
  for (auto i = 0; i < count; ++i) {
    auto created = newest - std::chrono::hours{i * step_hours};
    out.push_back(make_snapshot(
        "tank@" + snapkeep::schema::format_timestamp(created), created));
  }
  return out;
}

}  // namespace

TEST(selector, hourly_policy_keeps_newest_per_hour) {
  auto snapshots = std::vector{
      make_snapshot("tank@1000", make_time(2021, 10, 2, 10, 0)),
      make_snapshot("tank@1030", make_time(2021, 10, 2, 10, 30)),
      make_snapshot("tank@1115", make_time(2021, 10, 2, 11, 15)),
  };
  auto result = snapkeep::retention::classify(
      snapshots, make_policy("h2"), make_time(2021, 10, 2, 11, 20));

  EXPECT_EQ(identifiers_with(result, decision_t::keep),
            (std::set<std::string>{"tank@1030", "tank@1115"}));
  EXPECT_EQ(identifiers_with(result, decision_t::destroy),
            (std::set<std::string>{"tank@1000"}));
  EXPECT_EQ(result.kept_per_granularity[snapkeep::schema::to_index(
                granularity_t::hourly)],
            2u);
}

TEST(selector, empty_policy_keeps_only_protected) {
  auto snapshots = std::vector{
      make_snapshot("tank@pinned", make_time(2021, 10, 1), true),
      make_snapshot("tank@loose", make_time(2021, 10, 2)),
  };
  auto result = snapkeep::retention::classify(snapshots, make_policy(""),
                                              make_time(2021, 10, 3));

  EXPECT_EQ(identifiers_with(result, decision_t::keep),
            (std::set<std::string>{"tank@pinned"}));
  EXPECT_EQ(identifiers_with(result, decision_t::destroy),
            (std::set<std::string>{"tank@loose"}));
}

TEST(selector, daily_policy_keeps_latest_day) {
  auto snapshots = std::vector{
      make_snapshot("tank@day3", make_time(2021, 10, 1, 12)),
      make_snapshot("tank@day2", make_time(2021, 10, 2, 12)),
      make_snapshot("tank@day1", make_time(2021, 10, 3, 12)),
  };
  auto result = snapkeep::retention::classify(snapshots, make_policy("d1"),
                                              make_time(2021, 10, 3, 12));

  EXPECT_EQ(identifiers_with(result, decision_t::keep),
            (std::set<std::string>{"tank@day1"}));
  EXPECT_EQ(result.future_dated, 0u);
}

TEST(selector, output_is_newest_first_and_covers_every_input) {
  auto snapshots = make_series(make_time(2021, 10, 2, 23), 50, 5);
  auto result = snapkeep::retention::classify(snapshots, make_policy("d3w2"),
                                              make_time(2021, 10, 3));

  ASSERT_EQ(result.entries.size(), snapshots.size());
  auto seen = std::set<std::string>{};
  for (std::size_t i = 0; i < result.entries.size(); ++i) {
    seen.insert(result.entries[i].snapshot.identifier);
    if (i > 0) {
      EXPECT_GE(result.entries[i - 1].snapshot.created_at,
                result.entries[i].snapshot.created_at);
    }
  }
  EXPECT_EQ(seen.size(), snapshots.size());
}

TEST(selector, ties_are_ordered_by_identifier) {
  auto when = make_time(2021, 10, 2, 10);
  auto snapshots = std::vector{
      make_snapshot("tank@a", when),
      make_snapshot("tank@c", when),
      make_snapshot("tank@b", when),
  };
  auto result = snapkeep::retention::classify(snapshots, make_policy("h1"),
                                              make_time(2021, 10, 2, 11));

  ASSERT_EQ(result.entries.size(), 3u);
  EXPECT_EQ(result.entries[0].snapshot.identifier, "tank@c");
  EXPECT_EQ(result.entries[0].decision, decision_t::keep);
  EXPECT_EQ(result.entries[1].snapshot.identifier, "tank@b");
  EXPECT_EQ(result.entries[2].snapshot.identifier, "tank@a");
}

TEST(selector, classification_is_idempotent_and_order_independent) {
  auto snapshots = make_series(make_time(2021, 12, 31, 22), 200, 7);
  auto policy = make_policy("h24d30w8m6y1");
  auto now = make_time(2022, 1, 1);

  auto first = snapkeep::retention::classify(snapshots, policy, now);
  std::reverse(snapshots.begin(), snapshots.end());
  auto second = snapkeep::retention::classify(snapshots, policy, now);

  ASSERT_EQ(first.entries.size(), second.entries.size());
  for (std::size_t i = 0; i < first.entries.size(); ++i) {
    EXPECT_EQ(first.entries[i].snapshot.identifier,
              second.entries[i].snapshot.identifier);
    EXPECT_EQ(first.entries[i].decision, second.entries[i].decision);
    EXPECT_EQ(first.entries[i].kept_by, second.entries[i].kept_by);
  }
  EXPECT_EQ(first.kept_per_granularity, second.kept_per_granularity);
}

TEST(selector, each_granularity_keeps_at_most_its_count) {
  auto snapshots = make_series(make_time(2021, 12, 31, 22), 400, 3);
  auto policy = make_policy("h5d4w3m2y1");
  auto result = snapkeep::retention::classify(snapshots, policy,
                                              make_time(2022, 1, 1));

  for (auto granularity : snapkeep::schema::kGranularities) {
    auto buckets = std::set<snapkeep::retention::bucket_index_t>{};
    for (const auto& entry : result.entries) {
      if (entry.kept_by.test(snapkeep::schema::to_index(granularity))) {
        EXPECT_TRUE(buckets
                        .insert(snapkeep::retention::bucket_index(
                            granularity, entry.snapshot.created_at))
                        .second);
      }
    }
    EXPECT_EQ(buckets.size(), snapkeep::schema::count_of(policy, granularity));
  }
}

TEST(selector, kept_snapshots_are_the_newest_in_their_buckets) {
  auto snapshots = make_series(make_time(2021, 10, 3, 23), 72, 1);
  auto result = snapkeep::retention::classify(snapshots, make_policy("d2"),
                                              make_time(2021, 10, 4));

  EXPECT_EQ(identifiers_with(result, decision_t::keep),
            (std::set<std::string>{"tank@2021-10-03T23:00:00Z",
                                   "tank@2021-10-02T23:00:00Z"}));
}

TEST(selector, protected_snapshots_survive_and_take_no_slots) {
  auto snapshots = std::vector{
      make_snapshot("tank@pinned", make_time(2021, 10, 3, 12), true),
      make_snapshot("tank@newest", make_time(2021, 10, 3, 8)),
      make_snapshot("tank@older", make_time(2021, 10, 2, 8)),
      make_snapshot("tank@oldest", make_time(2021, 10, 1, 8), true),
  };
  auto result = snapkeep::retention::classify(snapshots, make_policy("d1"),
                                              make_time(2021, 10, 4));

  EXPECT_EQ(identifiers_with(result, decision_t::keep),
            (std::set<std::string>{"tank@pinned", "tank@newest",
                                   "tank@oldest"}));
  for (const auto& entry : result.entries) {
    if (entry.snapshot.is_protected) {
      EXPECT_TRUE(entry.kept_by.none());
    }
  }
}

TEST(selector, future_dated_snapshots_are_counted_not_dropped) {
  auto snapshots = std::vector{
      make_snapshot("tank@future", make_time(2030, 1, 1)),
      make_snapshot("tank@today", make_time(2021, 10, 2, 9)),
  };
  auto result = snapkeep::retention::classify(snapshots, make_policy("d1"),
                                              make_time(2021, 10, 2, 10));

  EXPECT_EQ(result.future_dated, 1u);
  EXPECT_EQ(identifiers_with(result, decision_t::keep),
            (std::set<std::string>{"tank@future"}));
}

TEST(selector, count_decisions_splits_entries) {
  auto snapshots = make_series(make_time(2021, 10, 2, 23), 10, 1);
  auto result = snapkeep::retention::classify(snapshots, make_policy("h3"),
                                              make_time(2021, 10, 3));

  EXPECT_EQ(snapkeep::retention::count_decisions(result, decision_t::keep), 3u);
  EXPECT_EQ(snapkeep::retention::count_decisions(result, decision_t::destroy),
            7u);
}

TEST(selector, empty_input_yields_empty_classification) {
  auto result = snapkeep::retention::classify({}, make_policy("h24"),
                                              make_time(2021, 10, 2));
  EXPECT_TRUE(result.entries.empty());
  EXPECT_EQ(result.future_dated, 0u);
}

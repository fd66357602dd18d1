#include <gtest/gtest.h>
#include <snapkeep/schema/error_code.hpp>
#include <snapkeep/schema/granularity.hpp>
#include <snapkeep/schema/primitives.hpp>
#include <snapkeep/testing/common.hpp>

TEST(primitives, split_snapshot_name_separates_dataset_and_tag) {
  auto name = snapkeep::schema::try_split_snapshot_name("tank/home@daily-1");
  ASSERT_TRUE(name.has_value());
  EXPECT_EQ(name->dataset, "tank/home");
  EXPECT_EQ(name->tag, "daily-1");
}

TEST(primitives, split_snapshot_name_rejects_malformed_names) {
  EXPECT_FALSE(snapkeep::schema::try_split_snapshot_name("tank/home"));
  EXPECT_FALSE(snapkeep::schema::try_split_snapshot_name("@tag"));
  EXPECT_FALSE(snapkeep::schema::try_split_snapshot_name("tank@"));
  EXPECT_FALSE(snapkeep::schema::try_split_snapshot_name("tank@a@b"));
  EXPECT_FALSE(snapkeep::schema::try_split_snapshot_name(""));
}

TEST(primitives, parse_epoch_seconds_requires_plain_decimal) {
  auto parsed = snapkeep::schema::try_parse_epoch_seconds("1633132800");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, snapkeep::testing::make_time(2021, 10, 2));

  EXPECT_FALSE(snapkeep::schema::try_parse_epoch_seconds(""));
  EXPECT_FALSE(snapkeep::schema::try_parse_epoch_seconds("Sat Oct  2 10:00"));
  EXPECT_FALSE(snapkeep::schema::try_parse_epoch_seconds("12x"));
}

TEST(primitives, parse_epoch_seconds_stays_within_four_digit_years) {
  EXPECT_EQ(snapkeep::schema::try_parse_epoch_seconds("-62135596800"),
            snapkeep::testing::make_time(1, 1, 1));
  EXPECT_EQ(snapkeep::schema::try_parse_epoch_seconds("253402300799"),
            snapkeep::testing::make_time(9999, 12, 31, 23, 59, 59));
  EXPECT_FALSE(snapkeep::schema::try_parse_epoch_seconds("-62135596801"));
  EXPECT_FALSE(snapkeep::schema::try_parse_epoch_seconds("253402300800"));
  EXPECT_FALSE(
      snapkeep::schema::try_parse_epoch_seconds("9223372036854775807"));
  EXPECT_FALSE(
      snapkeep::schema::try_parse_epoch_seconds("-9223372036854775808"));
}

TEST(primitives, parse_byte_count_rejects_signs_and_suffixes) {
  EXPECT_EQ(snapkeep::schema::try_parse_byte_count("4096"), 4096u);
  EXPECT_FALSE(snapkeep::schema::try_parse_byte_count("-1"));
  EXPECT_FALSE(snapkeep::schema::try_parse_byte_count("1.2M"));
}

TEST(primitives, format_timestamp_is_rfc3339_utc) {
  auto when = snapkeep::testing::make_time(2021, 10, 2, 9, 59, 7);
  EXPECT_EQ(snapkeep::schema::format_timestamp(when), "2021-10-02T09:59:07Z");
}

TEST(primitives, make_snapshot_name_appends_autosnap_suffix) {
  auto when = snapkeep::testing::make_time(2021, 1, 5, 23);
  EXPECT_EQ(snapkeep::schema::make_snapshot_name("tank/home", when),
            "tank/home@2021-01-05T23:00:00Z-autosnap");
}

TEST(primitives, granularity_units_round_trip) {
  for (auto granularity : snapkeep::schema::kGranularities) {
    auto unit = snapkeep::schema::to_unit(granularity);
    EXPECT_EQ(snapkeep::schema::try_from_unit(unit), granularity);
  }
  EXPECT_FALSE(snapkeep::schema::try_from_unit('x').has_value());
  EXPECT_EQ(snapkeep::schema::to_string(snapkeep::schema::granularity_t::weekly),
            "weekly");
}

TEST(primitives, error_codes_have_stable_names) {
  EXPECT_EQ(snapkeep::schema::to_string(
                snapkeep::schema::error_code_t::safety_violation),
            "safety_violation");
  EXPECT_EQ(
      snapkeep::schema::to_string(snapkeep::schema::error_code_t::catalog_error),
      "catalog_error");
}

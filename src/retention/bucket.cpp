#include <snapkeep/retention/bucket.hpp>

#include <chrono>

namespace snapkeep::retention {

namespace {

// 1970-01-01 was a Thursday; shifting by three days aligns week zero to
// Monday 1969-12-29.
constexpr auto kMondayAlignment = std::chrono::days{3};

}  // namespace

bucket_index_t bucket_index(const schema::granularity_t granularity,
                            const schema::timestamp_t& timestamp) {
  using namespace std::chrono;
  switch (granularity) {
    case schema::granularity_t::hourly:
      return floor<hours>(timestamp).time_since_epoch().count();
    case schema::granularity_t::daily:
      return floor<days>(timestamp).time_since_epoch().count();
    case schema::granularity_t::weekly:
      return floor<weeks>(timestamp + kMondayAlignment)
          .time_since_epoch()
          .count();
    case schema::granularity_t::monthly: {
      const auto date = year_month_day{floor<days>(timestamp)};
      return static_cast<bucket_index_t>(static_cast<int>(date.year())) * 12 +
             static_cast<bucket_index_t>(static_cast<unsigned>(date.month())) -
             1;
    }
    case schema::granularity_t::yearly:
      return static_cast<int>(year_month_day{floor<days>(timestamp)}.year());
  }
  return 0;
}

schema::timestamp_t bucket_start(const schema::granularity_t granularity,
                                 const schema::timestamp_t& timestamp) {
  using namespace std::chrono;
  switch (granularity) {
    case schema::granularity_t::hourly:
      return floor<hours>(timestamp);
    case schema::granularity_t::daily:
      return floor<days>(timestamp);
    case schema::granularity_t::weekly:
      return floor<weeks>(timestamp + kMondayAlignment) - kMondayAlignment;
    case schema::granularity_t::monthly: {
      const auto date = year_month_day{floor<days>(timestamp)};
      return sys_days{date.year() / date.month() / 1};
    }
    case schema::granularity_t::yearly: {
      const auto date = year_month_day{floor<days>(timestamp)};
      return sys_days{date.year() / January / 1};
    }
  }
  return timestamp;
}

}  // namespace snapkeep::retention

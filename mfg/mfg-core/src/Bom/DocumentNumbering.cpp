#include "mfg-core/src/Bom/DocumentNumbering.hpp"

#include <chrono>
#include <utility>

#include <fmt/format.h>

namespace mfg_core
{

namespace
{

std::chrono::year_month_day civilDate(TimePoint at)
{
  return std::chrono::year_month_day{
    std::chrono::floor<std::chrono::days>(at)};
}

}  // namespace

DocumentNumbering::DocumentNumbering(Config config)
  : config_{std::move(config)}
{
}

std::string DocumentNumbering::nextBomNumber(TimePoint at)
{
  auto const date = civilDate(at);
  auto const period =
    fmt::format("{:04d}{:02d}",
                static_cast<int>(date.year()),
                static_cast<unsigned>(date.month()));
  auto const key = config_.bomPrefix + "-" + period;
  return fmt::format("{}-{:04d}", key, nextInPeriod(key));
}

std::string DocumentNumbering::nextOrderNumber(TimePoint at)
{
  auto const date = civilDate(at);
  auto const key =
    fmt::format("{}-{:04d}", config_.orderPrefix, static_cast<int>(date.year()));
  return fmt::format("{}-{:04d}", key, nextInPeriod(key));
}

uint32_t DocumentNumbering::nextInPeriod(const std::string& periodKey)
{
  std::lock_guard<std::mutex> lock{mutex_};
  return ++counters_[periodKey];
}

}  // namespace mfg_core

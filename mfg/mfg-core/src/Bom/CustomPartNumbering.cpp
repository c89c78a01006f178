// Ticket: 0005_custom_part_numbering

#include "mfg-core/src/Bom/CustomPartNumbering.hpp"

#include <algorithm>
#include <charconv>
#include <set>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "mfg-core/src/Logging.hpp"

namespace mfg_core
{

namespace
{

constexpr int kMaxRegistrationAttempts = 16;

void checkSeries(const CustomPartNumbering::Series& series)
{
  if (series.prefix.empty())
  {
    throw std::invalid_argument("Custom part series prefix must not be empty");
  }
  if (series.width <= 0)
  {
    throw std::invalid_argument("Custom part series width must be positive");
  }
}

}  // namespace

CustomPartNumbering::CustomPartNumbering(
  mfg_catalog::CatalogRegistry& catalog,
  Series defaultSeries,
  std::map<std::string, Series> categorySeries,
  std::shared_ptr<spdlog::logger> logger)
  : catalog_{catalog}, logger_{logger ? std::move(logger) : defaultLogger()}
{
  std::set<std::string> stems;
  auto claimStem = [&stems](const Series& series)
  {
    checkSeries(series);
    if (!stems.insert(series.prefix + series.separator).second)
    {
      throw std::invalid_argument("Custom part series prefix " +
                                  series.prefix + " is used twice");
    }
  };

  claimStem(defaultSeries);
  defaultState_ = std::make_unique<SeriesState>(std::move(defaultSeries));
  seedFromCatalog(*defaultState_);

  for (auto& [categoryId, series] : categorySeries)
  {
    claimStem(series);
    auto state = std::make_unique<SeriesState>(std::move(series));
    seedFromCatalog(*state);
    categoryStates_.emplace(categoryId, std::move(state));
  }
}

std::string CustomPartNumbering::mint(const std::string& categoryId)
{
  auto& state = stateFor(categoryId);
  while (true)
  {
    auto const sequence = state.counter.next();
    auto number = render(state.series, sequence);
    if (!catalog_.hasPart(number))
    {
      logger_->debug("Minted custom part number {} for category {}",
                     number,
                     categoryId);
      return number;
    }
    logger_->debug("Custom part number {} already in use, skipping", number);
  }
}

CustomPartNumbering::Synthesized CustomPartNumbering::synthesize(
  const mfg_catalog::OptionFamily& family,
  const std::string& optionValue)
{
  for (int attempt = 0; attempt < kMaxRegistrationAttempts; ++attempt)
  {
    mfg_catalog::Part part;
    part.partId = mint(family.categoryId);
    part.name = fmt::format("{} {} (custom)", family.displayName, optionValue);
    part.categoryId = family.categoryId;
    part.isCustom = true;
    part.specifications[family.optionKey] = optionValue;

    try
    {
      auto registered =
        catalog_.registerCustomPart(part, family.optionKey, optionValue);
      bool const created = registered.partId == part.partId;
      if (created)
      {
        logger_->info("Registered custom part {} for {}={}",
                      registered.partId,
                      family.optionKey,
                      optionValue);
      }
      return Synthesized{std::move(registered), created};
    }
    catch (const std::logic_error& e)
    {
      // The number was attached to a part between mint() and registration
      logger_->warn("Retrying custom part registration: {}", e.what());
    }
  }

  throw std::runtime_error(
    fmt::format("Could not register a custom part for {}={} after {} attempts",
                family.optionKey,
                optionValue,
                kMaxRegistrationAttempts));
}

std::string CustomPartNumbering::format(const std::string& categoryId,
                                        uint64_t sequence) const
{
  return render(stateFor(categoryId).series, sequence);
}

uint64_t CustomPartNumbering::peek(const std::string& categoryId) const
{
  return stateFor(categoryId).counter.peek();
}

CustomPartNumbering::SeriesState& CustomPartNumbering::stateFor(
  const std::string& categoryId)
{
  auto it = categoryStates_.find(categoryId);
  return it == categoryStates_.end() ? *defaultState_ : *it->second;
}

const CustomPartNumbering::SeriesState& CustomPartNumbering::stateFor(
  const std::string& categoryId) const
{
  auto it = categoryStates_.find(categoryId);
  return it == categoryStates_.end() ? *defaultState_ : *it->second;
}

std::string CustomPartNumbering::render(const Series& series,
                                        uint64_t sequence)
{
  return fmt::format("{}{}{:0{}}",
                     series.prefix,
                     series.separator,
                     sequence,
                     series.width);
}

void CustomPartNumbering::seedFromCatalog(SeriesState& state)
{
  auto const stem = state.series.prefix + state.series.separator;
  uint64_t highest = 0;
  bool found = false;

  for (const auto& id : catalog_.partIdsWithPrefix(stem))
  {
    const char* begin = id.data() + stem.size();
    const char* end = id.data() + id.size();
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end)
    {
      continue;  // Not a number of this series
    }
    highest = std::max(highest, value);
    found = true;
  }

  if (found)
  {
    state.counter.advancePast(highest);
    logger_->debug("Custom part series {} resumes at {}",
                   stem,
                   state.counter.peek());
  }
}

}  // namespace mfg_core

// Ticket: 0005_custom_part_numbering

#ifndef MFG_CORE_BOM_CUSTOM_PART_NUMBERING_HPP
#define MFG_CORE_BOM_CUSTOM_PART_NUMBERING_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "mfg-catalog/src/CatalogRegistry.hpp"
#include "mfg-core/src/Bom/SequenceCounter.hpp"

namespace mfg_core
{

/**
 * @brief Mints part numbers for synthesized components and registers them
 *
 * Numbers are prefix + separator + zero-padded sequence (700-1025). Each
 * series has one SequenceCounter shared by every caller, independent of any
 * order or configuration lock. At construction each counter is advanced past
 * the highest number already present in the catalog, and mint() skips any
 * number that has since been attached to a live part, so a number is never
 * issued twice.
 *
 * Thread Safety:
 *   mint() and synthesize() are safe to call concurrently.
 */
class CustomPartNumbering
{
public:
  /// Part bound to an option value, and whether this call registered it
  struct Synthesized
  {
    mfg_catalog::Part part;
    bool created{false};
  };

  struct Series
  {
    std::string prefix{"700"};
    std::string separator{"-"};
    uint64_t firstSequence{1000};
    int width{4};  // Minimum digits; longer sequences are not truncated
  };

  /**
   * @param catalog Registry custom parts are registered in
   * @param defaultSeries Series for categories without their own
   * @param categorySeries Per-category series overrides
   * @param logger Logger, or nullptr for the shared default
   * @throws std::invalid_argument if a series has an empty prefix or a
   * non-positive width
   */
  CustomPartNumbering(mfg_catalog::CatalogRegistry& catalog,
                      Series defaultSeries,
                      std::map<std::string, Series> categorySeries = {},
                      std::shared_ptr<spdlog::logger> logger = nullptr);

  CustomPartNumbering(const CustomPartNumbering&) = delete;
  CustomPartNumbering& operator=(const CustomPartNumbering&) = delete;

  /**
   * @brief Reserve the next unused part number of a category's series
   *
   * The number is not registered; synthesize() does that. A number that is
   * minted but never registered is a gap.
   */
  std::string mint(const std::string& categoryId);

  /**
   * @brief Mint a number and register a custom part for an option value
   *
   * If another caller registered a part for the same option value first,
   * that part is returned with created unset and the minted number becomes
   * a gap. Registration is immediate and outlives any enclosing unit of work.
   *
   * @return The catalog part bound to (family.optionKey, optionValue)
   */
  Synthesized synthesize(const mfg_catalog::OptionFamily& family,
                               const std::string& optionValue);

  /// Rendered number for a sequence value of a category's series
  [[nodiscard]] std::string format(const std::string& categoryId,
                                   uint64_t sequence) const;

  /// Sequence value the next mint() for a category would try first
  [[nodiscard]] uint64_t peek(const std::string& categoryId) const;

private:
  struct SeriesState
  {
    explicit SeriesState(Series s)
      : series{std::move(s)}, counter{series.firstSequence}
    {
    }

    Series series;
    SequenceCounter counter;
  };

  SeriesState& stateFor(const std::string& categoryId);
  const SeriesState& stateFor(const std::string& categoryId) const;

  static std::string render(const Series& series, uint64_t sequence);
  void seedFromCatalog(SeriesState& state);

  mfg_catalog::CatalogRegistry& catalog_;
  std::shared_ptr<spdlog::logger> logger_;

  // Built at construction and never resized, so lookups need no lock
  std::unique_ptr<SeriesState> defaultState_;
  std::map<std::string, std::unique_ptr<SeriesState>> categoryStates_;
};

}  // namespace mfg_core

#endif  // MFG_CORE_BOM_CUSTOM_PART_NUMBERING_HPP

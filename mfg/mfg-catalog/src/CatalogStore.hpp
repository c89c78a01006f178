// Ticket: 0002_catalog_store

#ifndef MFG_CATALOG_CATALOG_STORE_HPP
#define MFG_CATALOG_CATALOG_STORE_HPP

#include <optional>
#include <string>
#include <vector>

#include "mfg-catalog/src/CatalogTypes.hpp"

namespace mfg_catalog
{

/**
 * @brief Read-only catalog contract consumed by BOM synthesis
 *
 * Implementations must be safe to call from multiple threads.
 */
class CatalogStore
{
public:
  virtual ~CatalogStore() = default;

  /**
   * @brief Direct components of an assembly effective at a point in time
   *
   * @param assemblyId Assembly to expand
   * @param asOf Instant the effective window is evaluated at
   * @return Active components whose window contains asOf, ordered by
   *         assembly sequence then component id. Empty if the assembly has no
   *         components or does not exist.
   */
  [[nodiscard]] virtual std::vector<AssemblyComponent> expand(
    const std::string& assemblyId,
    TimePoint asOf) const = 0;

  /**
   * @brief All active edges of an assembly, ignoring effective windows
   *
   * Used by cycle detection: the acyclic invariant holds over the whole
   * graph, not just the edges effective today.
   */
  [[nodiscard]] virtual std::vector<AssemblyComponent> components(
    const std::string& assemblyId) const = 0;

  /**
   * @brief Unit cost and weight of a component
   * @return std::nullopt if the component is not in the catalog
   */
  [[nodiscard]] virtual std::optional<ComponentCost> unitCost(
    const std::string& componentId,
    ComponentType type) const = 0;

  [[nodiscard]] virtual std::optional<Assembly> findAssembly(
    const std::string& assemblyId) const = 0;

  [[nodiscard]] virtual std::optional<Part> findPart(
    const std::string& partId) const = 0;

  [[nodiscard]] virtual std::optional<OptionFamily> findOptionFamily(
    const std::string& optionKey) const = 0;

  /**
   * @brief Part bound to an option value
   * @return std::nullopt if no part satisfies the value
   */
  [[nodiscard]] virtual std::optional<Part> resolveOption(
    const std::string& optionKey,
    const std::string& optionValue) const = 0;
};

}  // namespace mfg_catalog

#endif  // MFG_CATALOG_CATALOG_STORE_HPP

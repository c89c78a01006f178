#ifndef MFG_CATALOG_CATALOG_REGISTRY_HPP
#define MFG_CATALOG_CATALOG_REGISTRY_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "mfg-catalog/src/CatalogStore.hpp"

namespace mfg_catalog
{

/**
 * @brief In-memory catalog holding categories, parts, assemblies and the
 * component graph
 *
 * The registry is the writable side of the catalog. The workflow core only
 * reads it through CatalogStore, with one exception: custom part numbering
 * registers synthesized parts via registerCustomPart().
 *
 * Thread Safety:
 *   All public methods are thread-safe via internal mutex.
 */
class CatalogRegistry : public CatalogStore
{
public:
  CatalogRegistry() = default;

  CatalogRegistry(const CatalogRegistry&) = delete;
  CatalogRegistry& operator=(const CatalogRegistry&) = delete;

  void addCategory(Category category);

  /**
   * @brief Register a part
   * @throws std::invalid_argument if the part id is empty or already present
   */
  void addPart(Part part);

  /**
   * @brief Register an assembly or sub-assembly
   * @throws std::invalid_argument if the assembly id is empty or already
   * present
   */
  void addAssembly(Assembly assembly);

  /**
   * @brief Add an edge to the component graph
   *
   * Edges may reference components that are registered later; dangling
   * references are reported by AssemblyGraph at synthesis time.
   *
   * @throws std::invalid_argument if the base quantity is not positive or the
   * waste factor is outside [0, 1)
   */
  void addComponent(AssemblyComponent component);

  void addOptionFamily(OptionFamily family);

  /**
   * @brief Bind an option value to an existing part
   * @throws std::invalid_argument if the option family or part is unknown
   */
  void bindOption(OptionBinding binding);

  /**
   * @brief Register a synthesized part and bind it to its option value
   *
   * If another caller bound the same option value first, the existing part is
   * returned and the supplied part is discarded.
   *
   * @param part Part carrying a freshly minted id
   * @param optionKey Option family key
   * @param optionValue Option value the part satisfies
   * @return The part now bound to (optionKey, optionValue)
   * @throws std::logic_error if the part id is already registered
   */
  Part registerCustomPart(Part part,
                          const std::string& optionKey,
                          const std::string& optionValue);

  [[nodiscard]] bool hasPart(const std::string& partId) const;

  /**
   * @brief Ids of all parts whose id begins with a prefix
   */
  [[nodiscard]] std::vector<std::string> partIdsWithPrefix(
    const std::string& prefix) const;

  [[nodiscard]] size_t partCount() const;

  // CatalogStore
  [[nodiscard]] std::vector<AssemblyComponent> expand(
    const std::string& assemblyId,
    TimePoint asOf) const override;
  [[nodiscard]] std::vector<AssemblyComponent> components(
    const std::string& assemblyId) const override;
  [[nodiscard]] std::optional<ComponentCost> unitCost(
    const std::string& componentId,
    ComponentType type) const override;
  [[nodiscard]] std::optional<Assembly> findAssembly(
    const std::string& assemblyId) const override;
  [[nodiscard]] std::optional<Part> findPart(
    const std::string& partId) const override;
  [[nodiscard]] std::optional<OptionFamily> findOptionFamily(
    const std::string& optionKey) const override;
  [[nodiscard]] std::optional<Part> resolveOption(
    const std::string& optionKey,
    const std::string& optionValue) const override;

private:
  using OptionKey = std::pair<std::string, std::string>;

  mutable std::mutex mutex_;

  std::unordered_map<std::string, Category> categories_;
  std::map<std::string, Part> parts_;
  std::unordered_map<std::string, Assembly> assemblies_;
  std::unordered_map<std::string, std::vector<AssemblyComponent>> edges_;
  std::unordered_map<std::string, OptionFamily> optionFamilies_;
  std::map<OptionKey, std::string> optionBindings_;
};

}  // namespace mfg_catalog

#endif  // MFG_CATALOG_CATALOG_REGISTRY_HPP

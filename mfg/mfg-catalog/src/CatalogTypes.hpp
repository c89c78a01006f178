// Ticket: 0002_catalog_store

#ifndef MFG_CATALOG_CATALOG_TYPES_HPP
#define MFG_CATALOG_CATALOG_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace mfg_catalog
{

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Kind of node referenced by an AssemblyComponent edge
 */
enum class ComponentType : uint8_t
{
  Part,
  Assembly
};

const char* toString(ComponentType type);

/**
 * @brief Position of an assembly in the catalog hierarchy
 *
 * Category -> Assembly -> SubAssembly -> Part. Sub-assemblies are stored as
 * assemblies with level SubAssembly so that the component graph has a single
 * node type for everything that can be exploded.
 */
enum class AssemblyLevel : uint8_t
{
  Assembly,
  SubAssembly
};

struct Category
{
  std::string categoryId;
  std::string name;
};

/**
 * @brief Leaf catalog entry
 *
 * Custom (700-series) parts are ordinary parts with isCustom set; once
 * registered they resolve exactly like standard parts.
 */
struct Part
{
  std::string partId;
  std::string name;
  std::string categoryId;
  double unitCost{0.0};  // [USD]
  double weightKg{0.0};  // [kg]
  bool isCustom{false};

  // Free-form specification for synthesized parts (option key -> value)
  std::map<std::string, std::string> specifications;
};

struct Assembly
{
  std::string assemblyId;
  std::string name;
  std::string categoryId;
  AssemblyLevel level{AssemblyLevel::Assembly};
  double basePrice{0.0};  // [USD]
  double weightKg{0.0};   // [kg]
};

/**
 * @brief Edge of the component graph (assembly -> part or assembly)
 */
struct AssemblyComponent
{
  std::string assemblyId;
  std::string componentId;
  ComponentType type{ComponentType::Part};
  double baseQuantity{1.0};
  double wasteFactor{0.0};  // Fraction of base quantity lost, [0, 1)
  bool optional{false};
  std::optional<std::string> substituteGroup;
  int assemblySequence{0};
  bool isActive{true};

  // Effective window, [effectiveFrom, effectiveUntil). Unset bounds are open.
  std::optional<TimePoint> effectiveFrom;
  std::optional<TimePoint> effectiveUntil;

  [[nodiscard]] bool isEffectiveAt(TimePoint asOf) const;
};

/**
 * @brief Cost and weight of a single unit of a component
 */
struct ComponentCost
{
  double unitCost{0.0};
  double weightKg{0.0};
  bool isCustom{false};
};

/**
 * @brief Declares a configuration option key whose values select parts
 *
 * A configuration carrying this option key contributes one BOM line per
 * generation: the part bound to the selected value, or a freshly synthesized
 * custom part when no binding exists.
 */
struct OptionFamily
{
  std::string optionKey;    // e.g. "pegboardSize"
  std::string categoryId;   // Category for synthesized parts
  std::string displayName;  // Used to name synthesized parts
  double quantity{1.0};
};

/**
 * @brief Maps one option value to the catalog part that satisfies it
 */
struct OptionBinding
{
  std::string optionKey;
  std::string optionValue;
  std::string partId;
};

}  // namespace mfg_catalog

#endif  // MFG_CATALOG_CATALOG_TYPES_HPP

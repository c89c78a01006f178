#include "mfg-catalog/src/CatalogRegistry.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace mfg_catalog
{

const char* toString(ComponentType type)
{
  switch (type)
  {
    case ComponentType::Part:
      return "PART";
    case ComponentType::Assembly:
      return "ASSEMBLY";
  }
  return "UNKNOWN";
}

bool AssemblyComponent::isEffectiveAt(TimePoint asOf) const
{
  if (effectiveFrom && asOf < *effectiveFrom)
  {
    return false;
  }
  if (effectiveUntil && asOf >= *effectiveUntil)
  {
    return false;
  }
  return true;
}

void CatalogRegistry::addCategory(Category category)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto id = category.categoryId;
  categories_[id] = std::move(category);
}

void CatalogRegistry::addPart(Part part)
{
  if (part.partId.empty())
  {
    throw std::invalid_argument("Part id must not be empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (parts_.count(part.partId) > 0)
  {
    throw std::invalid_argument("Duplicate part id: " + part.partId);
  }
  auto id = part.partId;
  parts_.emplace(std::move(id), std::move(part));
}

void CatalogRegistry::addAssembly(Assembly assembly)
{
  if (assembly.assemblyId.empty())
  {
    throw std::invalid_argument("Assembly id must not be empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (assemblies_.count(assembly.assemblyId) > 0)
  {
    throw std::invalid_argument("Duplicate assembly id: " +
                                assembly.assemblyId);
  }
  auto id = assembly.assemblyId;
  assemblies_.emplace(std::move(id), std::move(assembly));
}

void CatalogRegistry::addComponent(AssemblyComponent component)
{
  if (component.baseQuantity <= 0.0)
  {
    throw std::invalid_argument("Component " + component.componentId +
                                " must have a positive base quantity");
  }
  if (component.wasteFactor < 0.0 || component.wasteFactor >= 1.0)
  {
    throw std::invalid_argument("Component " + component.componentId +
                                " waste factor must be in [0, 1)");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  edges_[component.assemblyId].push_back(std::move(component));
}

void CatalogRegistry::addOptionFamily(OptionFamily family)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto key = family.optionKey;
  optionFamilies_[key] = std::move(family);
}

void CatalogRegistry::bindOption(OptionBinding binding)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (optionFamilies_.count(binding.optionKey) == 0)
  {
    throw std::invalid_argument("Unknown option family: " + binding.optionKey);
  }
  if (parts_.count(binding.partId) == 0)
  {
    throw std::invalid_argument("Cannot bind option to unknown part: " +
                                binding.partId);
  }
  optionBindings_[{binding.optionKey, binding.optionValue}] = binding.partId;
}

Part CatalogRegistry::registerCustomPart(Part part,
                                         const std::string& optionKey,
                                         const std::string& optionValue)
{
  std::lock_guard<std::mutex> lock(mutex_);

  auto bound = optionBindings_.find({optionKey, optionValue});
  if (bound != optionBindings_.end())
  {
    return parts_.at(bound->second);
  }

  if (parts_.count(part.partId) > 0)
  {
    throw std::logic_error("Custom part number already in use: " +
                           part.partId);
  }

  part.isCustom = true;
  optionBindings_[{optionKey, optionValue}] = part.partId;
  auto id = part.partId;
  auto inserted = parts_.emplace(std::move(id), std::move(part));
  return inserted.first->second;
}

bool CatalogRegistry::hasPart(const std::string& partId) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return parts_.count(partId) > 0;
}

std::vector<std::string> CatalogRegistry::partIdsWithPrefix(
  const std::string& prefix) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  // parts_ is ordered, so matching ids form one contiguous range
  for (auto it = parts_.lower_bound(prefix);
       it != parts_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
       ++it)
  {
    ids.push_back(it->first);
  }
  return ids;
}

size_t CatalogRegistry::partCount() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return parts_.size();
}

std::vector<AssemblyComponent> CatalogRegistry::expand(
  const std::string& assemblyId,
  TimePoint asOf) const
{
  std::vector<AssemblyComponent> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = edges_.find(assemblyId);
    if (it == edges_.end())
    {
      return result;
    }
    for (const auto& edge : it->second)
    {
      if (edge.isActive && edge.isEffectiveAt(asOf))
      {
        result.push_back(edge);
      }
    }
  }

  std::stable_sort(result.begin(),
                   result.end(),
                   [](const AssemblyComponent& a, const AssemblyComponent& b)
                   {
                     if (a.assemblySequence != b.assemblySequence)
                     {
                       return a.assemblySequence < b.assemblySequence;
                     }
                     return a.componentId < b.componentId;
                   });
  return result;
}

std::vector<AssemblyComponent> CatalogRegistry::components(
  const std::string& assemblyId) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<AssemblyComponent> result;
  auto it = edges_.find(assemblyId);
  if (it != edges_.end())
  {
    std::copy_if(it->second.begin(),
                 it->second.end(),
                 std::back_inserter(result),
                 [](const AssemblyComponent& edge) { return edge.isActive; });
  }
  return result;
}

std::optional<ComponentCost> CatalogRegistry::unitCost(
  const std::string& componentId,
  ComponentType type) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (type == ComponentType::Part)
  {
    auto it = parts_.find(componentId);
    if (it == parts_.end())
    {
      return std::nullopt;
    }
    return ComponentCost{
      it->second.unitCost, it->second.weightKg, it->second.isCustom};
  }

  auto it = assemblies_.find(componentId);
  if (it == assemblies_.end())
  {
    return std::nullopt;
  }
  return ComponentCost{it->second.basePrice, it->second.weightKg, false};
}

std::optional<Assembly> CatalogRegistry::findAssembly(
  const std::string& assemblyId) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = assemblies_.find(assemblyId);
  if (it == assemblies_.end())
  {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Part> CatalogRegistry::findPart(const std::string& partId) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = parts_.find(partId);
  if (it == parts_.end())
  {
    return std::nullopt;
  }
  return it->second;
}

std::optional<OptionFamily> CatalogRegistry::findOptionFamily(
  const std::string& optionKey) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = optionFamilies_.find(optionKey);
  if (it == optionFamilies_.end())
  {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Part> CatalogRegistry::resolveOption(
  const std::string& optionKey,
  const std::string& optionValue) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto bound = optionBindings_.find({optionKey, optionValue});
  if (bound == optionBindings_.end())
  {
    return std::nullopt;
  }
  auto part = parts_.find(bound->second);
  if (part == parts_.end())
  {
    return std::nullopt;
  }
  return part->second;
}

}  // namespace mfg_catalog

// Ticket: 0003_assembly_cycle_detection

#include "mfg-catalog/src/AssemblyGraph.hpp"

#include <unordered_map>

namespace mfg_catalog
{

namespace
{

std::string joinPath(const std::vector<std::string>& path)
{
  std::string joined;
  for (const auto& node : path)
  {
    if (!joined.empty())
    {
      joined += " -> ";
    }
    joined += node;
  }
  return joined;
}

enum class Mark : uint8_t
{
  InProgress,
  Done
};

/**
 * @brief Recursive DFS state for a single verify() call
 */
class CycleDetector
{
public:
  explicit CycleDetector(const CatalogStore& catalog) : catalog_{catalog}
  {
  }

  void visit(const std::string& assemblyId)
  {
    marks_[assemblyId] = Mark::InProgress;
    path_.push_back(assemblyId);

    for (const auto& edge : catalog_.components(assemblyId))
    {
      if (edge.type == ComponentType::Part)
      {
        if (!catalog_.findPart(edge.componentId))
        {
          auto path = path_;
          path.push_back(edge.componentId);
          throw DataIntegrityError(
            "Assembly " + assemblyId + " references missing part " +
              edge.componentId,
            std::move(path));
        }
        continue;
      }

      if (!catalog_.findAssembly(edge.componentId))
      {
        auto path = path_;
        path.push_back(edge.componentId);
        throw DataIntegrityError("Assembly " + assemblyId +
                                   " references missing assembly " +
                                   edge.componentId,
                                 std::move(path));
      }

      auto mark = marks_.find(edge.componentId);
      if (mark == marks_.end())
      {
        visit(edge.componentId);
      }
      else if (mark->second == Mark::InProgress)
      {
        auto path = path_;
        path.push_back(edge.componentId);
        throw DataIntegrityError("Cyclic assembly reference: " + joinPath(path),
                                 std::move(path));
      }
    }

    path_.pop_back();
    marks_[assemblyId] = Mark::Done;
  }

  [[nodiscard]] size_t visitedCount() const
  {
    return marks_.size();
  }

private:
  const CatalogStore& catalog_;
  std::unordered_map<std::string, Mark> marks_;
  std::vector<std::string> path_;
};

}  // anonymous namespace

DataIntegrityError::DataIntegrityError(const std::string& message,
                                       std::vector<std::string> path)
  : std::runtime_error{message}, path_{std::move(path)}
{
}

size_t AssemblyGraph::verify(const CatalogStore& catalog,
                             const std::string& rootAssemblyId)
{
  if (!catalog.findAssembly(rootAssemblyId))
  {
    throw DataIntegrityError("Unknown assembly: " + rootAssemblyId,
                             {rootAssemblyId});
  }

  CycleDetector detector{catalog};
  detector.visit(rootAssemblyId);
  return detector.visitedCount();
}

}  // namespace mfg_catalog

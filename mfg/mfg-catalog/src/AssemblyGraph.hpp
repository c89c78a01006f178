// Ticket: 0003_assembly_cycle_detection

#ifndef MFG_CATALOG_ASSEMBLY_GRAPH_HPP
#define MFG_CATALOG_ASSEMBLY_GRAPH_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "mfg-catalog/src/CatalogStore.hpp"

namespace mfg_catalog
{

/**
 * @brief Fatal catalog fault: cyclic or dangling component reference
 *
 * Thrown rather than returned. Any unit of work in flight when this is raised
 * must be rolled back.
 */
class DataIntegrityError : public std::runtime_error
{
public:
  DataIntegrityError(const std::string& message,
                     std::vector<std::string> path = {});

  /// Component chain leading to the fault, root first
  [[nodiscard]] const std::vector<std::string>& path() const
  {
    return path_;
  }

private:
  std::vector<std::string> path_;
};

/**
 * @brief Structural checks over the assembly component graph
 *
 * Depth-first traversal from a root assembly with visited/in-progress marks.
 * Reaching an in-progress node means a back edge, i.e. a cycle. Every edge is
 * also checked for a resolvable target so that synthesis never meets a
 * dangling reference half way through a unit of work.
 *
 * All edges marked active are traversed regardless of their effective window.
 *
 * Thread safety: Stateless static utility, safe to call from any thread.
 * Error handling: Throws DataIntegrityError on the first fault found.
 */
class AssemblyGraph
{
public:
  /**
   * @brief Verify the transitive closure below an assembly
   *
   * @param catalog Catalog to traverse
   * @param rootAssemblyId Assembly to start from
   * @return Number of distinct assemblies visited (root included)
   * @throws DataIntegrityError if the root is unknown, a cycle exists, or an
   * edge references a missing part or assembly
   */
  static size_t verify(const CatalogStore& catalog,
                       const std::string& rootAssemblyId);

  AssemblyGraph() = delete;
};

}  // namespace mfg_catalog

#endif  // MFG_CATALOG_ASSEMBLY_GRAPH_HPP

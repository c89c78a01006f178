#include <cstdlib>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "mfg-core/src/Engine.hpp"
#include "mfg-core/src/Logging.hpp"
#include "mfg-exe/src/SampleCatalog.hpp"

#ifdef MFG_WITH_LEDGER
#include "mfg-ledger/src/LedgerRecorder.hpp"
#endif

namespace
{

struct Options
{
  double basins{2.0};
  double length{48.0};
  bool lifter{false};
  std::string pegboard;
  std::string ledgerPath;
  uint32_t quantity{1};
  double unitPrice{2400.0};
};

void printUsage(const char* program)
{
  fmt::print(
    "Usage: {} [--basins N] [--length INCHES] [--lifter] [--pegboard SIZE]\n"
    "          [--quantity N] [--price AMOUNT] [--ledger PATH]\n",
    program);
}

double parseNumber(std::string_view flag, const std::string& text)
{
  try
  {
    std::size_t consumed = 0;
    double value = std::stod(text, &consumed);
    if (consumed != text.size())
    {
      throw std::invalid_argument{text};
    }
    return value;
  }
  catch (const std::logic_error&)
  {
    throw std::invalid_argument{
      fmt::format("{} expects a number, got '{}'", flag, text)};
  }
}

/**
 * @brief Parse argv into Options
 * @return std::nullopt when --help was requested
 * @throws std::invalid_argument on an unknown flag or malformed value
 */
std::optional<Options> parseArguments(int argc, char** argv)
{
  Options options;
  std::vector<std::string> args(argv + 1, argv + argc);

  for (std::size_t i = 0; i < args.size(); ++i)
  {
    const auto& flag = args[i];
    auto value = [&]() -> const std::string&
    {
      if (i + 1 >= args.size())
      {
        throw std::invalid_argument{flag + " requires a value"};
      }
      return args[++i];
    };

    if (flag == "--help" || flag == "-h")
    {
      return std::nullopt;
    }
    else if (flag == "--basins")
    {
      options.basins = parseNumber(flag, value());
    }
    else if (flag == "--length")
    {
      options.length = parseNumber(flag, value());
    }
    else if (flag == "--lifter")
    {
      options.lifter = true;
    }
    else if (flag == "--pegboard")
    {
      options.pegboard = value();
    }
    else if (flag == "--quantity")
    {
      options.quantity = static_cast<uint32_t>(parseNumber(flag, value()));
    }
    else if (flag == "--price")
    {
      options.unitPrice = parseNumber(flag, value());
    }
    else if (flag == "--ledger")
    {
      options.ledgerPath = value();
    }
    else
    {
      throw std::invalid_argument{"Unknown argument: " + flag};
    }
  }

  return options;
}

mfg_core::ConfigurationSelection toSelection(const Options& options)
{
  mfg_core::ConfigurationSelection selection;
  selection.parameters["basinCount"] = options.basins;
  selection.parameters["sinkLength"] = options.length;
  selection.features["lifter"] = options.lifter;
  if (options.lifter)
  {
    selection.options["lifterModel"] = "DL2";
  }
  if (!options.pegboard.empty())
  {
    selection.options["pegboardSize"] = options.pegboard;
  }
  return selection;
}

std::string errorText(const std::optional<mfg_core::EngineError>& error)
{
  return error ? mfg_core::describe(*error) : "unknown failure";
}

int runWorkflow(const Options& options,
                const std::shared_ptr<spdlog::logger>& logger)
{
  using namespace mfg_core;

  mfg_catalog::CatalogRegistry catalog;
  mfg_exe::seedSampleCatalog(catalog);

  WorkflowEngine::Config config;
  config.rules = mfg_exe::sampleRules();

  SinkSet sinks;
  auto audit = std::make_shared<InMemoryAuditSink>();
  sinks.audit = audit;

#ifdef MFG_WITH_LEDGER
  std::shared_ptr<mfg_ledger::LedgerRecorder> ledger;
  if (!options.ledgerPath.empty())
  {
    mfg_ledger::LedgerRecorder::Config ledgerConfig;
    ledgerConfig.databasePath = options.ledgerPath;
    ledger = std::make_shared<mfg_ledger::LedgerRecorder>(ledgerConfig, logger);
    sinks.records.push_back(ledger);
  }
#else
  if (!options.ledgerPath.empty())
  {
    logger->warn("Built without cpp_sqlite; --ledger {} ignored",
                 options.ledgerPath);
  }
#endif

  WorkflowEngine engine{catalog, config, sinks, logger};

  Actor coordinator{"coordinator", {Role::ProductionCoordinator}};
  Actor inspector{"inspector", {Role::QcInspector}};
  Actor assembler{"assembler", {Role::Assembler}};

  auto order = engine.createOrder("CUST-DEMO", false, coordinator);
  if (!order.success)
  {
    logger->error("Order creation failed: {}", errorText(order.error));
    return EXIT_FAILURE;
  }
  logger->info("Created order {}", order.orderNumber);

  OrderItemRequest request;
  request.assemblyId = mfg_exe::kSinkAssembly;
  request.quantity = options.quantity;
  request.unitPrice = options.unitPrice;
  request.selection = toSelection(options);
  auto item = engine.addOrderItem(order.orderId, request, coordinator);
  if (!item.success)
  {
    logger->error("Adding {} failed: {}",
                  mfg_exe::kSinkAssembly,
                  errorText(item.error));
    return EXIT_FAILURE;
  }

  auto advance = [&](OrderPhase target, const Actor& actor)
  {
    auto result =
      engine.transitionOrderPhase(order.orderId, target, actor, "");
    if (!result.success)
    {
      logger->error(
        "Transition to {} failed: {}", toString(target), errorText(result.error));
      return false;
    }
    logger->info("Order {} -> {}", order.orderNumber, toString(target));
    return true;
  };

  if (!advance(OrderPhase::Configuration, coordinator))
  {
    return EXIT_FAILURE;
  }

  auto validation = engine.validateConfiguration(item.configurationId);
  if (validation)
  {
    for (const auto& warning : validation->warnings)
    {
      logger->warn("{}: {}", warning.ruleName, warning.message);
    }
  }

  auto bom = engine.requestBOM(item.orderItemId, coordinator);
  if (!bom.success)
  {
    logger->error("BOM request refused: {}", errorText(bom.error));
    if (bom.validation)
    {
      for (const auto& issue : bom.validation->errors)
      {
        logger->error("  {} [{}]: {}", issue.ruleName, issue.field, issue.message);
      }
    }
    return EXIT_FAILURE;
  }

  if (auto active = engine.bom(*bom.bomId))
  {
    for (const auto& line : active->lines)
    {
      logger->info(fmt::format("  {:>3} {:<12} {:>8.3f} x {:>9.2f} = {:>10.2f}{}",
                               line.lineNumber,
                               line.componentId,
                               line.adjustedQuantity,
                               line.unitCost,
                               line.extendedCost,
                               line.isCustom ? " (custom)" : ""));
    }
  }
  logger->info("{}: {} lines, {} custom, cost {:.2f}, weight {:.2f} kg",
               bom.bomNumber,
               bom.totalParts,
               bom.customPartsCount,
               bom.totalCost,
               bom.totalWeight);

  if (!advance(OrderPhase::Approval, coordinator) ||
      !advance(OrderPhase::Production, coordinator))
  {
    return EXIT_FAILURE;
  }

  for (const auto& task : engine.tasks(item.orderItemId))
  {
    auto done = engine.completeTask(task.taskId, assembler);
    if (!done.success)
    {
      logger->error("Completing task {} failed: {}",
                    task.taskId,
                    errorText(done.error));
      return EXIT_FAILURE;
    }
  }
  if (auto metrics = engine.productionMetrics(item.orderItemId))
  {
    logger->info("Production {}: {}/{} tasks ({:.0f}%)",
                 toString(metrics->status),
                 metrics->completedTasks,
                 metrics->totalTasks,
                 metrics->completionPercentage);
  }

  if (!advance(OrderPhase::QualityControl, coordinator) ||
      !advance(OrderPhase::Packaging, inspector) ||
      !advance(OrderPhase::Shipping, coordinator) ||
      !advance(OrderPhase::Delivered, coordinator))
  {
    return EXIT_FAILURE;
  }

  if (auto totals = engine.calculateOrderTotals(order.orderId))
  {
    logger->info(
      "Totals: subtotal {:.2f}, discount {:.2f}, tax {:.2f}, shipping {:.2f}, "
      "total {:.2f}",
      totals->subtotal,
      totals->discountAmount,
      totals->taxAmount,
      totals->shippingAmount,
      totals->total);
  }
  logger->info("{} audit events recorded", audit->events().size());

#ifdef MFG_WITH_LEDGER
  if (ledger)
  {
    ledger->flush();
  }
#endif

  return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv)
{
  auto logger = mfg_core::defaultLogger();

  std::optional<Options> options;
  try
  {
    options = parseArguments(argc, argv);
  }
  catch (const std::invalid_argument& e)
  {
    logger->error("{}", e.what());
    printUsage(argv[0]);
    return EXIT_FAILURE;
  }

  if (!options)
  {
    printUsage(argv[0]);
    return EXIT_SUCCESS;
  }

  try
  {
    return runWorkflow(*options, logger);
  }
  catch (const std::exception& e)
  {
    logger->critical("Workflow aborted: {}", e.what());
    return EXIT_FAILURE;
  }
}

#include "mfg-core/src/Logging.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace mfg_core
{

std::shared_ptr<spdlog::logger> defaultLogger(const std::string& name)
{
  // spdlog's registry rejects duplicate names, so lookup and creation must
  // happen under one lock
  static std::mutex creationMutex;
  std::lock_guard<std::mutex> lock{creationMutex};

  if (auto existing = spdlog::get(name))
  {
    return existing;
  }
  return spdlog::stdout_color_mt(name);
}

}  // namespace mfg_core

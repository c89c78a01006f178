#ifndef MFG_CORE_LOGGING_HPP
#define MFG_CORE_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace mfg_core
{

/**
 * @brief Named console logger shared by the workflow components
 *
 * Returns the registered logger if one with this name already exists,
 * otherwise creates a colored stdout logger. Components that receive a null
 * logger fall back to this.
 */
std::shared_ptr<spdlog::logger> defaultLogger(const std::string& name = "mfg");

}  // namespace mfg_core

#endif  // MFG_CORE_LOGGING_HPP

#pragma once

#include <string>

namespace logging {

/**
 * @brief configure Sets up the spdlog default logger
 * @param name Logger name, used as the journald identifier with systemd
 * @param systemd Route log output to systemd-journald instead of stderr
 * @param debug Enable debug level
 * @param trace Enable trace level, takes precedence over debug
 */
void configure(std::string const& name, bool systemd, bool debug, bool trace);

}  // namespace logging

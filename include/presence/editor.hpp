#pragma once

#include <ostream>
#include <string>

namespace presence {

/**
 * @brief run_editor Adds or updates address -> name in the mapping file
 * @param err Receives the failure message
 * @return EXIT_SUCCESS, or EXIT_FAILURE on a malformed address, empty name or I/O failure
 */
int run_editor(std::string const& file, std::string const& address, std::string const& name,
               std::ostream& err);

}  // namespace presence

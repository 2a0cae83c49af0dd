#ifndef DATASWAP_LOGGING_HPP
#define DATASWAP_LOGGING_HPP

#include "dataswap/config.hpp"
#include "dataswap/types.hpp"

#include <string>

namespace dataswap {

// Install the "dataswap" logger (colour, stderr) as the spdlog default.
// stdout stays free for command output.
void setup_logging(const LogConfig& config);

// One-line rendering of a pool's full state for log records
std::string describe(const Pool& pool);

} // namespace dataswap

#endif // DATASWAP_LOGGING_HPP

#pragma once

#include <string>

namespace brvalid {

/**
 * Set the global log level by name: debug, info, warn or error.
 * @throws std::runtime_error for any other name.
 */
void SetLogLevel(const std::string& level);

/** Send log output to stderr instead of stdout. */
void RedirectLogsToStderr();

}  // namespace brvalid

#include <brvalid/logging.hpp>

#include <trantor/utils/Logger.h>

#include <cstdint>
#include <cstdio>
#include <stdexcept>

namespace brvalid {

void SetLogLevel(const std::string& level) {
  if (level == "debug") {
    trantor::Logger::setLogLevel(trantor::Logger::kDebug);
  } else if (level == "info") {
    trantor::Logger::setLogLevel(trantor::Logger::kInfo);
  } else if (level == "warn") {
    trantor::Logger::setLogLevel(trantor::Logger::kWarn);
  } else if (level == "error") {
    trantor::Logger::setLogLevel(trantor::Logger::kError);
  } else {
    throw std::runtime_error("Invalid log level: " + level +
                             " (must be debug, info, warn, or error)");
  }
}

void RedirectLogsToStderr() {
  trantor::Logger::setOutputFunction(
      [](const char* msg, const uint64_t len) { fwrite(msg, 1, len, stderr); },
      []() { fflush(stderr); });
}

}  // namespace brvalid

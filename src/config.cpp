#include <brvalid/config.hpp>

#include <trantor/utils/Logger.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace brvalid {

namespace {

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

uint64_t ParseUnsigned(const std::string& value, const std::string& what) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::runtime_error(what + " must be a non-negative integer, got '" + value + "'");
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    throw std::runtime_error(what + " is out of range: " + value);
  }
}

uint32_t ParseThreads(const std::string& value) {
  uint64_t n = ParseUnsigned(value, "threads");
  if (n > 4096) {
    throw std::runtime_error("threads is out of range: " + value);
  }
  return static_cast<uint32_t>(n);
}

// Apply one "section.key: value" setting. Returns false for unknown keys.
bool ApplySetting(Config* config, const std::string& section,
                  const std::string& key, const std::string& value) {
  if (section == "executor") {
    if (key == "threads") {
      config->executor.threads = ParseThreads(value);
    } else if (key == "min_rows_per_task") {
      config->executor.min_rows_per_task =
          static_cast<size_t>(ParseUnsigned(value, "min_rows_per_task"));
    } else {
      return false;
    }
  } else if (section == "phone") {
    if (key == "area_codes") {
      config->phone.area_codes = value;
    } else {
      return false;
    }
  } else if (section == "io") {
    if (key == "input") {
      config->io.input_path = value;
    } else if (key == "format") {
      config->io.format = value;
    } else if (key == "null_token") {
      config->io.null_token = value;
    } else if (key == "metrics_out") {
      config->io.metrics_out = value;
    } else {
      return false;
    }
  } else if (section == "logging") {
    if (key == "level") {
      config->log_level = value;
    } else {
      return false;
    }
  } else if (section.empty()) {
    // Top-level keys
    if (key == "operation") {
      config->operation = value;
    } else {
      return false;
    }
  } else {
    return false;
  }
  return true;
}

}  // namespace

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options] <operation> [input]\n"
            << "\nOperations:\n";
  for (Operation op : AllOperations()) {
    std::cerr << "  " << OperationName(op) << "\n";
  }
  std::cerr << "\nOptions:\n"
            << "  --config, -c <path>         Path to YAML config file\n"
            << "  --threads <n>               Worker threads (default: auto)\n"
            << "  --min-rows-per-task <n>     Rows per parallel task (default: 4096)\n"
            << "  --area-codes <list>         all, assigned, or e.g. 11-19,21 (default: all)\n"
            << "  --format, -f <fmt>          Output format: text, json (default: text)\n"
            << "  --null-token <s>            Input line marking a null value (default: empty line)\n"
            << "  --metrics-out <path>        Write Prometheus metrics to path\n"
            << "  --log-level <level>         Log level: debug, info, warn, error\n"
            << "  --version                   Show version\n"
            << "  --help, -h                  Show this help\n"
            << "\nExamples:\n"
            << "  " << argv0 << " validate_document documents.txt\n"
            << "  " << argv0 << " --format json format_phone - < phones.txt\n"
            << "  " << argv0 << " --config /etc/brvalid.yaml --area-codes assigned validate_phone\n";
}

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string line;
  int line_no = 0;

  while (std::getline(file, line)) {
    ++line_no;
    const bool indented = !line.empty() && (line[0] == ' ' || line[0] == '\t');
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      throw std::runtime_error(path + ":" + std::to_string(line_no) +
                               ": expected 'key: value'");
    }

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      current_section = key;
      continue;
    }

    // Unindented keys after a section belong to the top level again
    if (!indented) {
      current_section.clear();
    }

    // Remove quotes from value if present
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    if (!ApplySetting(&config, current_section, key, value)) {
      LOG_WARN << path << ":" << line_no << ": ignoring unknown key '"
               << (current_section.empty() ? key : current_section + "." + key) << "'";
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  // Find the config file first so that every other flag overrides it
  std::string config_file;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      if (i + 1 >= argc) {
        throw std::runtime_error("--config requires a path argument");
      }
      config_file = argv[i + 1];
    }
  }

  Config config = config_file.empty() ? Config{} : LoadFromFile(config_file);
  std::vector<std::string> positional;

  auto next = [&](int* i, const std::string& flag, const char* what) -> std::string {
    if (++*i >= argc) {
      throw std::runtime_error(flag + " requires " + what);
    }
    return argv[*i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      config.show_help = true;
    } else if (arg == "--version") {
      config.show_version = true;
    } else if (arg == "--config" || arg == "-c") {
      ++i;  // Already loaded
    } else if (arg == "--threads") {
      config.executor.threads = ParseThreads(next(&i, arg, "a number"));
    } else if (arg == "--min-rows-per-task") {
      config.executor.min_rows_per_task =
          static_cast<size_t>(ParseUnsigned(next(&i, arg, "a number"), "min_rows_per_task"));
    } else if (arg == "--area-codes") {
      config.phone.area_codes = next(&i, arg, "an area code list");
    } else if (arg == "--format" || arg == "-f") {
      config.io.format = next(&i, arg, "a format");
    } else if (arg == "--null-token") {
      config.io.null_token = next(&i, arg, "a token");
    } else if (arg == "--metrics-out") {
      config.io.metrics_out = next(&i, arg, "a path");
    } else if (arg == "--log-level") {
      config.log_level = next(&i, arg, "a level");
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw std::runtime_error("Unknown option: " + arg);
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.size() > 2) {
    throw std::runtime_error("Unexpected argument: " + positional[2]);
  }
  if (!positional.empty()) {
    config.operation = positional[0];
  }
  if (positional.size() == 2) {
    config.io.input_path = positional[1];
  }

  return config;
}

void Config::Validate() const {
  if (operation.empty()) {
    throw std::runtime_error("operation is required");
  }
  if (!ParseOperation(operation)) {
    throw std::runtime_error("Unknown operation: " + operation);
  }

  if (executor.min_rows_per_task == 0) {
    throw std::runtime_error("min_rows_per_task must be at least 1");
  }

  if (io.format != "text" && io.format != "json") {
    throw std::runtime_error("Invalid format: " + io.format + " (must be text or json)");
  }

  if (io.input_path.empty()) {
    throw std::runtime_error("input path is empty (use - for stdin)");
  }

  // Validate log level
  if (log_level != "debug" && log_level != "info" &&
      log_level != "warn" && log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + log_level +
                             " (must be debug, info, warn, or error)");
  }

  // Area codes are parsed here so errors surface before any input is read
  ToExecutorOptions();
}

ExecutorOptions Config::ToExecutorOptions() const {
  ExecutorOptions opt;
  opt.threads = executor.threads;
  opt.min_rows_per_task = executor.min_rows_per_task;
  try {
    opt.area_codes = AreaCodeTable::Parse(phone.area_codes);
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(std::string("Invalid area_codes: ") + e.what());
  }
  return opt;
}

}  // namespace brvalid

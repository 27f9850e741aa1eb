#pragma once

#include <brvalid/batch.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace brvalid {

/**
 * Batch executor configuration.
 */
struct ExecutorConfig {
  uint32_t threads = 0;  // 0 = auto-detect CPU cores
  size_t min_rows_per_task = 4096;
};

/**
 * Phone parsing configuration.
 */
struct PhoneConfig {
  // "all", "assigned", or a list such as "11-19,21,27"
  std::string area_codes = "all";
};

/**
 * Input/output configuration for the command-line tool.
 */
struct IoConfig {
  std::string input_path = "-";  // "-" reads stdin
  std::string format = "text";   // text or json
  std::string null_token;        // Input lines equal to this are absent values
  std::string metrics_out;       // Write Prometheus metrics here (empty = off)
};

/**
 * Complete configuration.
 */
struct Config {
  std::string operation;
  ExecutorConfig executor;
  PhoneConfig phone;
  IoConfig io;
  std::string log_level = "info";
  bool show_help = false;
  bool show_version = false;

  /**
   * Load configuration from a YAML-like file.
   * @throws std::runtime_error if file cannot be read or parsed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration from command-line arguments.
   * A --config file is loaded first; other flags override it.
   * @param argc Argument count
   * @param argv Argument values
   * @return Parsed configuration
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;

  /**
   * Build executor options (area code table, threads, task size).
   * @throws std::runtime_error if the area code list is invalid.
   */
  ExecutorOptions ToExecutorOptions() const;
};

/** Print command-line usage to stderr. */
void PrintUsage(const char* argv0);

}  // namespace brvalid

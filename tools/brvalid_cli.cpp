#include <brvalid/batch.hpp>
#include <brvalid/config.hpp>
#include <brvalid/io.hpp>
#include <brvalid/logging.hpp>
#include <brvalid/metrics.hpp>
#include <brvalid/version.hpp>

#include <trantor/utils/Logger.h>

#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  // Result rows go to stdout; keep log lines out of them
  brvalid::RedirectLogsToStderr();

  brvalid::Config config;
  try {
    config = brvalid::Config::LoadFromArgs(argc, argv);
    if (config.show_help) {
      brvalid::PrintUsage(argv[0]);
      return 0;
    }
    if (config.show_version) {
      std::cout << "brvalid " << brvalid::Version() << "\n";
      return 0;
    }
    config.Validate();
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n\n";
    brvalid::PrintUsage(argv[0]);
    return 2;
  }

  try {
    brvalid::SetLogLevel(config.log_level);
    const brvalid::Operation op = *brvalid::ParseOperation(config.operation);

    brvalid::ExecutorOptions opt = config.ToExecutorOptions();
    std::shared_ptr<brvalid::PrometheusMetrics> metrics;
    if (!config.io.metrics_out.empty()) {
      metrics = std::make_shared<brvalid::PrometheusMetrics>();
      opt.metrics = metrics;
    }

    brvalid::Column input =
        brvalid::ReadColumnFromPath(config.io.input_path, config.io.null_token);
    LOG_DEBUG << "Read " << input.size() << " values from " << config.io.input_path;

    brvalid::BatchExecutor executor(opt);
    const uint64_t start = brvalid::internal::NowMicros();
    std::vector<brvalid::Cell> cells = executor.Run(op, input);
    const uint64_t elapsed_us = brvalid::internal::NowMicros() - start;

    if (config.io.format == "json") {
      brvalid::WriteJson(std::cout, cells);
    } else {
      brvalid::WriteText(std::cout, cells, config.io.null_token);
    }
    std::cout.flush();
    if (!std::cout) {
      LOG_ERROR << "Failed to write results to stdout";
      return 1;
    }

    brvalid::CellSummary summary = brvalid::Summarize(cells);
    if (brvalid::IsPredicate(op)) {
      LOG_INFO << brvalid::OperationName(op) << ": rows=" << summary.rows
               << " true=" << summary.true_count << " false=" << summary.false_count
               << " null=" << summary.absent << " elapsed_us=" << elapsed_us
               << " threads=" << executor.threads();
    } else {
      LOG_INFO << brvalid::OperationName(op) << ": rows=" << summary.rows
               << " present=" << summary.strings << " absent=" << summary.absent
               << " elapsed_us=" << elapsed_us << " threads=" << executor.threads();
    }

    if (metrics) {
      std::ofstream file(config.io.metrics_out);
      if (!file.is_open()) {
        LOG_ERROR << "Cannot open metrics file: " << config.io.metrics_out;
        return 1;
      }
      file << metrics->Export();
    }

    return 0;
  } catch (const std::exception& e) {
    LOG_ERROR << e.what();
    return 1;
  }
}

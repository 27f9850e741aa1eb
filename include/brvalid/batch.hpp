#pragma once

#include <brvalid/document.hpp>
#include <brvalid/metrics.hpp>
#include <brvalid/operations.hpp>
#include <brvalid/phone.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace brvalid {

/** A column of text values; std::nullopt marks an absent (null) value. */
using Value = std::optional<std::string>;
using Column = std::vector<Value>;

/**
 * Options for the batch executor.
 */
struct ExecutorOptions {
  // Worker threads including the calling thread (0 = hardware concurrency).
  // 1 runs every batch inline on the calling thread.
  uint32_t threads = 0;

  // Batches are split into tasks of at least this many rows.
  // Batches smaller than this never leave the calling thread.
  size_t min_rows_per_task = 4096;

  // Area codes accepted by the phone operations.
  AreaCodeTable area_codes = AreaCodeTable::All();

  // Observability hook (optional). Each typed operation emits
  // brvalid.<op>.rows_total, .null_total, .positive_total and .latency_us.
  std::shared_ptr<MetricsSink> metrics;
};

namespace internal {

class WorkerPool;

// Result cell type for a per-value function returning R: functions that
// already return std::optional<T> are not wrapped twice.
template <typename R>
struct OptionalOfImpl {
  using type = std::optional<R>;
};

template <typename T>
struct OptionalOfImpl<std::optional<T>> {
  using type = std::optional<T>;
};

template <typename R>
using OptionalOf = typename OptionalOfImpl<R>::type;

}  // namespace internal

/**
 * brvalid::BatchExecutor
 *
 * Applies a per-value operation across a column:
 * - output[i] depends only on input[i], and output.size() == input.size()
 * - absent inputs map to absent outputs without invoking the operation
 * - a malformed value never affects any other position
 *
 * Large columns are split into contiguous ranges and mapped on a fixed-size
 * worker pool. Per-value operations are pure, so workers share nothing but
 * the read-only input and their own disjoint output ranges.
 *
 * All const methods are safe to call from multiple threads.
 */
class BatchExecutor {
 public:
  explicit BatchExecutor(const ExecutorOptions& opt = ExecutorOptions{});
  ~BatchExecutor();

  BatchExecutor(const BatchExecutor&) = delete;
  BatchExecutor& operator=(const BatchExecutor&) = delete;

  /**
   * Map fn over every present value of input.
   *
   * fn is called as fn(std::string_view) and must not throw for ordinary
   * input. If it does throw, the first exception is rethrown here after
   * every range has finished.
   */
  template <typename Fn>
  auto Map(const Column& input, Fn fn) const
      -> std::vector<internal::OptionalOf<std::invoke_result_t<Fn&, std::string_view>>>;

  // --- Typed column operations ---

  std::vector<std::optional<bool>> ValidateDocument(const Column& input) const;

  /** Kind by digit count; kUnrecognized is reported as absent. */
  std::vector<std::optional<IdentifierKind>> ClassifyDocument(const Column& input) const;

  /** Kind only for checksum-valid values, absent otherwise. */
  std::vector<std::optional<IdentifierKind>> IdentifyDocument(const Column& input) const;

  Column FormatDocument(const Column& input) const;

  std::vector<std::optional<bool>> ValidatePhone(const Column& input, PhoneMode mode) const;

  Column FormatPhone(const Column& input) const;

  Column RemoveAccents(const Column& input) const;

  Column TitleCase(const Column& input) const;

  /** Run any operation by tag; booleans and strings are returned as cells. */
  std::vector<Cell> Run(Operation op, const Column& input) const;

  /**
   * Invoke fn(begin, end) over disjoint ranges that cover [0, n).
   * Blocks until every range is done, then rethrows the first exception
   * raised by fn, if any.
   */
  void ParallelFor(size_t n, const std::function<void(size_t, size_t)>& fn) const;

  /** Effective thread count, including the calling thread. */
  uint32_t threads() const { return threads_; }

  const ExecutorOptions& options() const { return opt_; }

 private:
  ExecutorOptions opt_;
  uint32_t threads_ = 1;
  std::unique_ptr<internal::WorkerPool> pool_;
};

template <typename Fn>
auto BatchExecutor::Map(const Column& input, Fn fn) const
    -> std::vector<internal::OptionalOf<std::invoke_result_t<Fn&, std::string_view>>> {
  using Result = internal::OptionalOf<std::invoke_result_t<Fn&, std::string_view>>;

  std::vector<Result> out(input.size());
  ParallelFor(input.size(), [&](size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) {
      if (input[i]) {
        out[i] = fn(std::string_view(*input[i]));
      }
    }
  });
  return out;
}

}  // namespace brvalid

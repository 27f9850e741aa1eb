#include <brvalid/batch.hpp>
#include <brvalid/text.hpp>

#include <trantor/utils/Logger.h>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>

namespace brvalid {

namespace internal {

/**
 * Fixed-size pool of worker threads draining a FIFO task queue.
 * Threads are started in the constructor and joined in the destructor.
 */
class WorkerPool {
 public:
  explicit WorkerPool(uint32_t threads) {
    workers_.reserve(threads);
    for (uint32_t i = 0; i < threads; ++i) {
      workers_.emplace_back([this] { WorkerLoop(); });
    }
  }

  ~WorkerPool() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) {
      t.join();
    }
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Submit(std::function<void()> task) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
  }

  size_t size() const { return workers_.size(); }

 private:
  void WorkerLoop() {
    for (;;) {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
        if (tasks_.empty()) return;  // stopping and drained
        task = std::move(tasks_.front());
        tasks_.pop_front();
      }
      task();
    }
  }

  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> tasks_;
  bool stopping_ = false;
  std::vector<std::thread> workers_;
};

}  // namespace internal

namespace {

// Completion state shared by the ranges of one ParallelFor call.
struct RangeLatch {
  std::mutex mu;
  std::condition_variable cv;
  size_t remaining = 0;
  std::exception_ptr first_error;

  void Run(const std::function<void(size_t, size_t)>& fn, size_t begin, size_t end) {
    std::exception_ptr error;
    try {
      fn(begin, end);
    } catch (...) {
      error = std::current_exception();
    }

    std::lock_guard<std::mutex> lock(mu);
    if (error && !first_error) {
      first_error = error;
    }
    if (--remaining == 0) {
      cv.notify_all();
    }
  }
};

inline bool IsPositive(const std::optional<bool>& v) { return v.value_or(false); }

template <typename T>
bool IsPositive(const std::optional<T>& v) {
  return v.has_value();
}

// Emit per-batch metrics. Runs on the calling thread after the map has
// finished, so workers never touch a shared counter.
template <typename T>
void RecordBatch(MetricsSink* metrics,
                 Operation op,
                 const Column& input,
                 const std::vector<std::optional<T>>& output,
                 uint64_t start_us) {
  if (!metrics) return;

  uint64_t nulls = 0;
  uint64_t positives = 0;
  for (size_t i = 0; i < input.size(); ++i) {
    if (!input[i]) {
      ++nulls;
    } else if (IsPositive(output[i])) {
      ++positives;
    }
  }

  const std::string prefix = std::string("brvalid.") + OperationName(op);
  metrics->Counter(prefix + ".rows_total", input.size());
  metrics->Counter(prefix + ".null_total", nulls);
  metrics->Counter(prefix + ".positive_total", positives);
  metrics->Histogram(prefix + ".latency_us", internal::NowMicros() - start_us);
}

template <typename T>
std::vector<Cell> ToCells(const std::vector<std::optional<T>>& column) {
  std::vector<Cell> out(column.size());
  for (size_t i = 0; i < column.size(); ++i) {
    if (column[i]) out[i] = *column[i];
  }
  return out;
}

std::vector<Cell> ToCells(const std::vector<std::optional<IdentifierKind>>& column) {
  std::vector<Cell> out(column.size());
  for (size_t i = 0; i < column.size(); ++i) {
    if (column[i]) out[i] = std::string(KindName(*column[i]));
  }
  return out;
}

}  // namespace

// --- BatchExecutor ---

BatchExecutor::BatchExecutor(const ExecutorOptions& opt) : opt_(opt) {
  threads_ = opt_.threads;
  if (threads_ == 0) {
    threads_ = std::thread::hardware_concurrency();
    if (threads_ == 0) threads_ = 4;  // Fallback
  }
  if (opt_.min_rows_per_task == 0) {
    opt_.min_rows_per_task = 1;
  }

  // The calling thread works one range itself
  if (threads_ > 1) {
    pool_ = std::make_unique<internal::WorkerPool>(threads_ - 1);
  }

  if (opt_.metrics) {
    opt_.metrics->Gauge("brvalid.executor.threads", static_cast<double>(threads_));
  }
  LOG_DEBUG << "BatchExecutor started with " << threads_ << " threads, "
            << opt_.min_rows_per_task << " rows per task minimum";
}

BatchExecutor::~BatchExecutor() = default;

void BatchExecutor::ParallelFor(size_t n,
                                const std::function<void(size_t, size_t)>& fn) const {
  if (n == 0) return;

  const size_t max_tasks = static_cast<size_t>(threads_);
  size_t tasks = std::min((n + opt_.min_rows_per_task - 1) / opt_.min_rows_per_task, max_tasks);
  if (!pool_ || tasks <= 1) {
    fn(0, n);
    return;
  }

  const size_t chunk = (n + tasks - 1) / tasks;
  tasks = (n + chunk - 1) / chunk;
  LOG_DEBUG << "Mapping " << n << " rows as " << tasks << " ranges of " << chunk;

  RangeLatch latch;
  latch.remaining = tasks;

  // Ranges 1..tasks-1 go to the pool; range 0 runs here
  for (size_t t = 1; t < tasks; ++t) {
    const size_t begin = t * chunk;
    const size_t end = std::min(n, begin + chunk);
    pool_->Submit([&latch, &fn, begin, end] { latch.Run(fn, begin, end); });
  }
  latch.Run(fn, 0, std::min(n, chunk));

  std::unique_lock<std::mutex> lock(latch.mu);
  latch.cv.wait(lock, [&latch] { return latch.remaining == 0; });
  if (latch.first_error) {
    std::rethrow_exception(latch.first_error);
  }
}

std::vector<std::optional<bool>> BatchExecutor::ValidateDocument(const Column& input) const {
  const uint64_t start = internal::NowMicros();
  auto out = Map(input, [](std::string_view v) {
    return ValidateDigits(ExtractDigits(v)).valid;
  });
  RecordBatch(opt_.metrics.get(), Operation::kValidateDocument, input, out, start);
  return out;
}

std::vector<std::optional<IdentifierKind>> BatchExecutor::ClassifyDocument(
    const Column& input) const {
  const uint64_t start = internal::NowMicros();
  auto out = Map(input, [](std::string_view v) -> std::optional<IdentifierKind> {
    IdentifierKind kind = Classify(ExtractDigits(v));
    if (kind == IdentifierKind::kUnrecognized) return std::nullopt;
    return kind;
  });
  RecordBatch(opt_.metrics.get(), Operation::kClassifyDocument, input, out, start);
  return out;
}

std::vector<std::optional<IdentifierKind>> BatchExecutor::IdentifyDocument(
    const Column& input) const {
  const uint64_t start = internal::NowMicros();
  auto out = Map(input, [](std::string_view v) -> std::optional<IdentifierKind> {
    ValidationOutcome outcome = ValidateDigits(ExtractDigits(v));
    if (!outcome.valid) return std::nullopt;
    return outcome.kind;
  });
  RecordBatch(opt_.metrics.get(), Operation::kIdentifyDocument, input, out, start);
  return out;
}

Column BatchExecutor::FormatDocument(const Column& input) const {
  const uint64_t start = internal::NowMicros();
  auto out = Map(input, [](std::string_view v) { return FormatDigits(ExtractDigits(v)); });
  RecordBatch(opt_.metrics.get(), Operation::kFormatDocument, input, out, start);
  return out;
}

std::vector<std::optional<bool>> BatchExecutor::ValidatePhone(const Column& input,
                                                              PhoneMode mode) const {
  const uint64_t start = internal::NowMicros();
  const AreaCodeTable& area_codes = opt_.area_codes;
  auto out = Map(input, [mode, &area_codes](std::string_view v) {
    return ParsePhone(ExtractDigits(v), mode, area_codes).ok();
  });
  RecordBatch(opt_.metrics.get(),
              mode == PhoneMode::kStrict ? Operation::kValidatePhone
                                         : Operation::kValidatePhoneFlexible,
              input, out, start);
  return out;
}

Column BatchExecutor::FormatPhone(const Column& input) const {
  const uint64_t start = internal::NowMicros();
  const AreaCodeTable& area_codes = opt_.area_codes;
  auto out = Map(input, [&area_codes](std::string_view v) {
    return FormatPhoneDigits(ExtractDigits(v), area_codes);
  });
  RecordBatch(opt_.metrics.get(), Operation::kFormatPhone, input, out, start);
  return out;
}

Column BatchExecutor::RemoveAccents(const Column& input) const {
  const uint64_t start = internal::NowMicros();
  auto out = Map(input, [](std::string_view v) { return brvalid::RemoveAccents(v); });
  RecordBatch(opt_.metrics.get(), Operation::kRemoveAccents, input, out, start);
  return out;
}

Column BatchExecutor::TitleCase(const Column& input) const {
  const uint64_t start = internal::NowMicros();
  auto out = Map(input, [](std::string_view v) { return brvalid::TitleCase(v); });
  RecordBatch(opt_.metrics.get(), Operation::kTitleCase, input, out, start);
  return out;
}

std::vector<Cell> BatchExecutor::Run(Operation op, const Column& input) const {
  switch (op) {
    case Operation::kValidateDocument:
      return ToCells(ValidateDocument(input));
    case Operation::kClassifyDocument:
      return ToCells(ClassifyDocument(input));
    case Operation::kIdentifyDocument:
      return ToCells(IdentifyDocument(input));
    case Operation::kFormatDocument:
      return ToCells(FormatDocument(input));
    case Operation::kValidatePhone:
      return ToCells(ValidatePhone(input, PhoneMode::kStrict));
    case Operation::kValidatePhoneFlexible:
      return ToCells(ValidatePhone(input, PhoneMode::kFlexible));
    case Operation::kFormatPhone:
      return ToCells(FormatPhone(input));
    case Operation::kRemoveAccents:
      return ToCells(RemoveAccents(input));
    case Operation::kTitleCase:
      return ToCells(TitleCase(input));
  }
  return std::vector<Cell>(input.size());
}

}  // namespace brvalid

// Performance benchmarks for brvalid
// Uses Google Benchmark for accurate measurement and CI regression tracking
//
// Organization:
// 1. MICROBENCHMARKS: single-value operations (digit extraction, checksums)
// 2. MACROBENCHMARKS: column operations through BatchExecutor
//
// Benchmark hygiene:
// - Pre-generate all test data outside timing loops
// - Use fixed seeds for reproducible datasets

#include <benchmark/benchmark.h>

#include <brvalid/batch.hpp>
#include <brvalid/document.hpp>
#include <brvalid/phone.hpp>
#include <brvalid/test_utils.hpp>
#include <brvalid/text.hpp>

#include <string>
#include <vector>

namespace {

// =============================================================================
// Dataset Helpers
// =============================================================================

std::vector<std::string> DocumentValues(size_t n) {
  brvalid::testing::DocumentGenerator gen(1234);
  std::vector<std::string> values;
  values.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    switch (i % 4) {
      case 0: values.push_back(gen.Cpf()); break;
      case 1: values.push_back(brvalid::testing::AddNoise(gen.Cnpj(), i)); break;
      case 2: values.push_back(gen.CorruptCheckDigit(gen.Cpf())); break;
      default: values.push_back("not a document"); break;
    }
  }
  return values;
}

std::vector<std::string> PhoneValues() {
  return {"+55 (11) 98765-4321", "(21) 3456-7890", "011 98765-4321",
          "0055 48 3222-1234", "12345", "11 87654-3210"};
}

// =============================================================================
// PART 1: MICROBENCHMARKS - Single values
// =============================================================================

static void BM_ExtractDigits(benchmark::State& state) {
  std::string input = "CNPJ: 60.204.424/0001-08";
  for (auto _ : state) {
    auto raw = brvalid::ExtractDigits(input);
    benchmark::DoNotOptimize(raw);
  }
}
BENCHMARK(BM_ExtractDigits);

static void BM_ValidateCpf(benchmark::State& state) {
  auto raw = brvalid::ExtractDigits("505.429.838-00");
  for (auto _ : state) {
    auto outcome = brvalid::ValidateDigits(raw);
    benchmark::DoNotOptimize(outcome);
  }
}
BENCHMARK(BM_ValidateCpf);

static void BM_ValidateCnpj(benchmark::State& state) {
  auto raw = brvalid::ExtractDigits("60.204.424/0001-08");
  for (auto _ : state) {
    auto outcome = brvalid::ValidateDigits(raw);
    benchmark::DoNotOptimize(outcome);
  }
}
BENCHMARK(BM_ValidateCnpj);

static void BM_ParsePhone_Strict(benchmark::State& state) {
  auto raw = brvalid::ExtractDigits("+55 (11) 98765-4321");
  for (auto _ : state) {
    auto result = brvalid::ParsePhone(raw, brvalid::PhoneMode::kStrict);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_ParsePhone_Strict);

static void BM_TitleCase(benchmark::State& state) {
  std::string input;
  for (int i = 0; i < state.range(0) / 16; ++i) {
    input += "JOÃO DA CONCEIÇÃO ";
  }
  for (auto _ : state) {
    auto out = brvalid::TitleCase(input);
    benchmark::DoNotOptimize(out);
  }
  state.SetBytesProcessed(state.iterations() * input.size());
}
BENCHMARK(BM_TitleCase)->Range(64, 1 << 14);

// =============================================================================
// PART 2: MACROBENCHMARKS - Column operations
// =============================================================================

static void BM_Batch_ValidateDocument(benchmark::State& state) {
  brvalid::ExecutorOptions opt;
  opt.threads = static_cast<uint32_t>(state.range(1));
  brvalid::BatchExecutor executor(opt);

  const size_t rows = static_cast<size_t>(state.range(0));
  brvalid::Column input = brvalid::testing::MakeColumn(DocumentValues(1024), rows, 10);

  for (auto _ : state) {
    auto out = executor.ValidateDocument(input);
    benchmark::DoNotOptimize(out);
  }
  state.SetItemsProcessed(state.iterations() * rows);
}
BENCHMARK(BM_Batch_ValidateDocument)
    ->Args({1 << 12, 1})
    ->Args({1 << 16, 1})
    ->Args({1 << 20, 1})
    ->Args({1 << 20, 4})
    ->UseRealTime();

static void BM_Batch_FormatPhone(benchmark::State& state) {
  brvalid::ExecutorOptions opt;
  opt.threads = static_cast<uint32_t>(state.range(1));
  brvalid::BatchExecutor executor(opt);

  const size_t rows = static_cast<size_t>(state.range(0));
  brvalid::Column input = brvalid::testing::MakeColumn(PhoneValues(), rows, 10);

  for (auto _ : state) {
    auto out = executor.FormatPhone(input);
    benchmark::DoNotOptimize(out);
  }
  state.SetItemsProcessed(state.iterations() * rows);
}
BENCHMARK(BM_Batch_FormatPhone)
    ->Args({1 << 16, 1})
    ->Args({1 << 20, 1})
    ->Args({1 << 20, 4})
    ->UseRealTime();

}  // namespace

BENCHMARK_MAIN();

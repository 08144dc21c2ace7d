#include "jarstore/base/log.hpp"
#include "jarstore/jar.hpp"
#include "jarstore/jar_writer.hpp"
#include "utils/random_generator.hpp"

#include <benchmark/benchmark.h>

#include <filesystem>
#include <format>
#include <memory>
#include <string>

namespace jarstore::test {

namespace {

constexpr uint64_t kNumRows = 100000;

std::unique_ptr<Jar> BuildJar(const std::string& dir, CodecType codec) {
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  auto path = dir + "/bench.jar";

  ColumnOptions column;
  column.codec_ = codec;
  auto options = JarOptions::Uniform(1, column);
  options.compression_threads_ = 4;
  auto writer = JarWriter::Create(path, options);
  if (!writer) {
    Log::Fatal("Create jar writer failed, error={}", writer.error().ToString());
  }
  for (uint64_t row = 0; row < kNumRows; ++row) {
    auto value = std::format("{}:{}", row, utils::RandomGenerator::RandAlphString(128));
    if (auto res = writer.value()->PushRow(0, value); !res) {
      Log::Fatal("Push row failed, error={}", res.error().ToString());
    }
    if (auto res = writer.value()->PushKey(std::format("key-{}", row)); !res) {
      Log::Fatal("Push key failed, error={}", res.error().ToString());
    }
  }
  if (auto res = writer.value()->Seal(); !res) {
    Log::Fatal("Seal jar failed, error={}", res.error().ToString());
  }

  auto jar = Jar::Open(path);
  if (!jar) {
    Log::Fatal("Open jar failed, error={}", jar.error().ToString());
  }
  return std::move(jar).value();
}

} // namespace

static void BenchGetRow(benchmark::State& state) {
  const auto codec = static_cast<CodecType>(state.range(0));
  auto jar = BuildJar(std::format("/tmp/jarstore/JarBench/GetRow{}", ToString(codec)), codec);

  std::string buffer;
  for (auto _ : state) {
    auto row = utils::RandomGenerator::RandU64(0, kNumRows);
    auto res = jar->GetRow(0, row, &buffer);
    benchmark::DoNotOptimize(res);
  }
  state.SetLabel(ToString(codec));
}

static void BenchLookupKey(benchmark::State& state) {
  auto jar = BuildJar("/tmp/jarstore/JarBench/LookupKey", CodecType::kRaw);

  std::string key;
  for (auto _ : state) {
    key = std::format("key-{}", utils::RandomGenerator::RandU64(0, kNumRows * 2));
    auto res = jar->LookupKey(key);
    benchmark::DoNotOptimize(res);
  }
}

BENCHMARK(BenchGetRow)
    ->Arg(static_cast<int64_t>(CodecType::kRaw))
    ->Arg(static_cast<int64_t>(CodecType::kZstd))
    ->Arg(static_cast<int64_t>(CodecType::kLz4));
BENCHMARK(BenchLookupKey);

} // namespace jarstore::test

BENCHMARK_MAIN();

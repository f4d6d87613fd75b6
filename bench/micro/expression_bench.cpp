#include <benchmark/benchmark.h>
#include <verity/expression.hpp>
#include <verity/tokenizer.hpp>

#include <cstdint>
#include <string>
#include <vector>

static const char* kRule =
    "(os == 'windows' or os .* \"linux\") and cores >= 4 and !legacy or arch == 'x86_64'";

static void BM_Tokenize(benchmark::State& state) {
  for (auto _ : state) {
    benchmark::DoNotOptimize(verity::lexer::tokenize(kRule));
  }
}
BENCHMARK(BM_Tokenize);

static void BM_Compile(benchmark::State& state) {
  for (auto _ : state) {
    auto rule = verity::expression::compile(kRule);
    benchmark::DoNotOptimize(rule);
  }
}
BENCHMARK(BM_Compile);

static void BM_Evaluate(benchmark::State& state) {
  auto rule = verity::expression::compile(kRule);
  if (!rule) {
    state.SkipWithError(rule.error().message.c_str());
    return;
  }
  const verity::binding vars{{"os", std::string("linux-gnu")}, {"cores", 8.0},
                             {"legacy", false}, {"arch", std::string("arm64")}};
  for (auto _ : state) {
    benchmark::DoNotOptimize(rule->matches(vars));
  }
}
BENCHMARK(BM_Evaluate);

static void BM_ApplyFilter(benchmark::State& state) {
  auto rule = verity::expression::compile("price >= 10 and color == 'red'");
  if (!rule) {
    state.SkipWithError(rule.error().message.c_str());
    return;
  }
  const auto n = static_cast<std::size_t>(state.range(0));
  std::vector<verity::binding> rows(n);
  std::vector<verity::record_view> store;
  store.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    rows[i] = {{"price", static_cast<double>(i % 20)}, {"color", std::string(i % 3 ? "red" : "blue")}};
    store.push_back({i, &rows[i]});
  }
  for (auto _ : state) {
    benchmark::DoNotOptimize(verity::apply_filter(&*rule, store));
  }
  state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * static_cast<std::int64_t>(n));
}
BENCHMARK(BM_ApplyFilter)->Arg(1024)->Arg(16384);

BENCHMARK_MAIN();

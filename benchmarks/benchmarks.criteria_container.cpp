// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>
#include <boost/unordered/unordered_flat_map.hpp>

#include <criteria/container/criteria_container.hpp>
#include <criteria/predicates/predicates.hpp>

namespace {
  auto make_keys(std::size_t count) -> std::vector<std::string>
  {
    auto keys = std::vector<std::string>{};
    keys.reserve(count);
    for (auto i = std::size_t{0}; i < count; ++i) {
      keys.push_back("key_" + std::to_string(i));
    }
    return keys;
  }

  auto make_container(const std::vector<std::string>& keys)
    -> criteria::criteria_container<std::shared_ptr<std::string>>
  {
    auto container =
      criteria::criteria_container<std::shared_ptr<std::string>>::create(keys.size());
    for (const auto& key : keys) {
      container.put(key, std::make_shared<std::string>(key));
    }
    return container;
  }
} // namespace

/**
 * @brief Baseline: unordered lookup with the predicate applied by hand.
 */
static void BM_FlatMap_Lookup(benchmark::State& state)
{
  const auto count = static_cast<std::size_t>(state.range(0));
  const auto keys  = make_keys(count);

  boost::unordered_flat_map<std::string, std::shared_ptr<std::string>> map;
  for (const auto& key : keys) {
    map.emplace(key, std::make_shared<std::string>(key));
  }

  auto i = 0uz;
  for (auto _ : state) {
    const auto& key = keys[i++ % count];

    auto  it  = map.find(key);
    auto* ptr = (it != map.end() && it->second != nullptr && !it->second->empty())
                ? std::addressof(it->second)
                : nullptr;

    benchmark::DoNotOptimize(ptr);
    benchmark::ClobberMemory();
  }
}

static void BM_Container_Get(benchmark::State& state)
{
  const auto count     = static_cast<std::size_t>(state.range(0));
  const auto keys      = make_keys(count);
  const auto container = make_container(keys);

  auto i = 0uz;
  for (auto _ : state) {
    const auto* ptr = container.find(keys[i++ % count]);

    benchmark::DoNotOptimize(ptr);
    benchmark::ClobberMemory();
  }
}

/**
 * @brief Lookup gated by statically bound predicates.
 */
static void BM_Container_GetIf(benchmark::State& state)
{
  const auto count     = static_cast<std::size_t>(state.range(0));
  const auto keys      = make_keys(count);
  const auto container = make_container(keys);

  auto i = 0uz;
  for (auto _ : state) {
    auto value =
      container.get_if(keys[i++ % count], criteria::string_not_null_not_empty);

    benchmark::DoNotOptimize(value);
    benchmark::ClobberMemory();
  }
}

/**
 * @brief Lookup gated by a runtime list of type-erased predicates.
 */
static void BM_Container_GetIf_Erased(benchmark::State& state)
{
  const auto count     = static_cast<std::size_t>(state.range(0));
  const auto keys      = make_keys(count);
  const auto container = make_container(keys);

  const auto rules =
    std::vector<criteria::predicate<std::shared_ptr<std::string>>>{
      criteria::is_not_null, criteria::string_not_empty};

  auto i = 0uz;
  for (auto _ : state) {
    auto value = container.get_if(keys[i++ % count], rules);

    benchmark::DoNotOptimize(value);
    benchmark::ClobberMemory();
  }
}

static void BM_Container_PutIf(benchmark::State& state)
{
  const auto count = static_cast<std::size_t>(state.range(0));
  const auto keys  = make_keys(count);

  auto container = make_container(keys);
  auto payload   = std::make_shared<std::string>("payload");

  auto i = 0uz;
  for (auto _ : state) {
    auto stored = container.put_if(
      keys[i++ % count], payload, criteria::is_not_null, criteria::string_not_empty);

    benchmark::DoNotOptimize(stored);
    benchmark::ClobberMemory();
  }
}

BENCHMARK(BM_FlatMap_Lookup)->Arg(1000)->Arg(100000)->Unit(benchmark::kNanosecond);
BENCHMARK(BM_Container_Get)->Arg(1000)->Arg(100000)->Unit(benchmark::kNanosecond);
BENCHMARK(BM_Container_GetIf)->Arg(1000)->Arg(100000)->Unit(benchmark::kNanosecond);
BENCHMARK(BM_Container_GetIf_Erased)
  ->Arg(1000)
  ->Arg(100000)
  ->Unit(benchmark::kNanosecond);
BENCHMARK(BM_Container_PutIf)->Arg(1000)->Arg(100000)->Unit(benchmark::kNanosecond);

BENCHMARK_MAIN();

#include <nanobench.h>
#include <freezer_engine/engine.h>
#include <freezer_runtime_type/binding_table.h>
#include <freezer_runtime_type/bindings.h>
#include <freezer_serializable_fn/codec_cache.h>
#include <freezer_serializable_fn/extension.h>
#include <cstdio>
#include <format>
#include <memory>

using namespace freezer;
using namespace freezer::ext;

namespace bench
{
  struct Square final : Fn
  {
    Value invoke(std::span<const Value> args) const override
    {
      auto x = *args[0].as_int();
      return x * x;
    }
  };

  struct Adder final : Fn
  {
    int64_t y;
    explicit Adder(int64_t y)
        : y(y)
    {
    }
    Value invoke(std::span<const Value> args) const override
    {
      return *args[0].as_int() + y;
    }
  };

  struct Label final : Fn
  {
    std::string prefix;
    std::string suffix;
    FnPtr next;
    Label(std::string prefix, std::string suffix, FnPtr next)
        : prefix(std::move(prefix))
        , suffix(std::move(suffix))
        , next(std::move(next))
    {
    }
    Value invoke(std::span<const Value>) const override { return prefix + suffix; }
  };
} // namespace bench

namespace
{
  using namespace bench;

  void bench_value(
      ankerl::nanobench::Bench& bench, const Engine& engine, std::string_view tag,
      const Value& value)
  {
    bench.run(
        std::format("freeze {}", tag),
        [&]
        {
          auto bytes = engine.freeze(value);
          ankerl::nanobench::doNotOptimizeAway(bytes);
        });

    auto bytes = engine.freeze(value).value_or_abort();
    bench.run(
        std::format("thaw {}", tag),
        [&]
        {
          auto thawed = engine.thaw(bytes);
          ankerl::nanobench::doNotOptimizeAway(thawed);
        });
  }
} // namespace

void benchmark_freeze()
{
  Engine engine;
  rt::BindingTable bindings;
  rt::TypeRegistry types;
  fn::CodecCache cache;
  const fn::Environment env{&bindings, &types, &cache};
  if (auto res = fn::install(engine, env); res.is_error())
  {
    std::fputs(res.error().message.c_str(), stderr);
    return;
  }

  rt::bind_closure<Adder>(types, "bench::Adder", FREEZER_RT_FIELD(Adder, y, "y", ""));
  rt::bind_closure<Label>(
      types, "bench::Label", FREEZER_RT_FIELD(Label, prefix, "prefix", ""),
      FREEZER_RT_FIELD(Label, suffix, "suffix", ""),
      FREEZER_RT_FIELD(Label, next, "next", ""));

  auto square = std::make_shared<const Square>();
  bindings.def(Symbol{"bench", "Square"}, square);

  ankerl::nanobench::Bench bench;
  bench.title("freezer::ext::fn").performanceCounters(false).minEpochIterations(1000);

  bench_value(bench, engine, "named", Value{square});
  bench_value(bench, engine, "closure", Value{std::make_shared<const Adder>(2)});
  bench_value(
      bench, engine, "nested closure",
      Value{std::make_shared<const Label>(
          "pre", "post", std::make_shared<const Adder>(3))});
  bench_value(
      bench, engine, "metadata", Value{with_meta(square, Map{{"doc", "squares"}})});

  bench.run(
      "freeze closure (cold cache)",
      [&]
      {
        cache.clear();
        auto bytes = engine.freeze(Value{std::make_shared<const Adder>(2)});
        ankerl::nanobench::doNotOptimizeAway(bytes);
      });
}

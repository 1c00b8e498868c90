#include <doctest/doctest.h>
#include <freezer_engine/engine.h>
#include <freezer_runtime_type/binding_table.h>
#include <freezer_runtime_type/bindings.h>
#include <freezer_runtime_type/interface.h>
#include <freezer_serializable_fn/codec_cache.h>
#include <freezer_serializable_fn/extension.h>
#include <freezer_value/fn.h>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace freezer;
using namespace freezer::ext;
using namespace freezer::ext::fn;

static bool g_reject_construction = false;

namespace demo
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
    const int64_t y;
    explicit Adder(int64_t y)
        : y(y)
    {
    }
    Value invoke(std::span<const Value> args) const override
    {
      return *args[0].as_int() + y;
    }
  };

  struct Pair final : Fn
  {
    int64_t a;
    int64_t b;
    Pair(int64_t a, int64_t b)
        : a(a)
        , b(b)
    {
    }
    Value invoke(std::span<const Value>) const override { return a + b; }
  };

  struct Greeter final : Fn
  {
    std::string greeting;
    std::string name;
    Greeter(std::string greeting, std::string name)
        : greeting(std::move(greeting))
        , name(std::move(name))
    {
    }
    Value invoke(std::span<const Value>) const override
    {
      return greeting + ", " + name;
    }
  };

  struct Answer final : Fn
  {
    Value invoke(std::span<const Value>) const override { return 42; }
  };

  struct Compose final : Fn
  {
    FnPtr f;
    FnPtr g;
    Compose(FnPtr f, FnPtr g)
        : f(std::move(f))
        , g(std::move(g))
    {
    }
    Value invoke(std::span<const Value> args) const override
    {
      Value inner = (*g)(args[0]);
      return (*f)(inner);
    }
  };

  struct Holder final : Fn
  {
    Value held;
    explicit Holder(Value held)
        : held(std::move(held))
    {
    }
    Value invoke(std::span<const Value>) const override { return held; }
  };

  struct Counter final : Fn
  {
    int64_t start;
    explicit Counter(int64_t start)
        : start(start)
    {
    }
    Value invoke(std::span<const Value> args) const override
    {
      return start + *args[0].as_int();
    }
  };

  struct Fragile final : Fn
  {
    int64_t n;
    explicit Fragile(int64_t n)
        : n(n)
    {
      if (g_reject_construction)
        throw std::runtime_error("construction rejected");
    }
    Value invoke(std::span<const Value>) const override { return n; }
  };

  struct Unregistered final : Fn
  {
    Value invoke(std::span<const Value>) const override { return {}; }
  };

  struct Handle final : Opaque
  {
  };

  FnPtr make_adder(int64_t y)
  {
    return std::make_shared<const Adder>(y);
  }
} // namespace demo

/// @brief Engine and environment isolated from the process-wide ones
struct Freezer
{
  Engine engine;
  rt::BindingTable bindings;
  rt::TypeRegistry types;
  CodecCache cache;
  Environment env{&bindings, &types, &cache};

  Freezer()
  {
    REQUIRE(install(engine, env).is_expect());
    rt::bind_closure<demo::Adder>(
        types, "demo::Adder", FREEZER_RT_FIELD(demo::Adder, y, "y", "the addend"));
    rt::bind_closure<demo::Greeter>(
        types, "demo::Greeter",
        FREEZER_RT_FIELD(demo::Greeter, greeting, "greeting", ""),
        FREEZER_RT_FIELD(demo::Greeter, name, "name", ""));
    rt::bind_closure<demo::Answer>(types, "demo::Answer");
    rt::bind_closure<demo::Compose>(
        types, "demo::Compose", FREEZER_RT_FIELD(demo::Compose, f, "f", ""),
        FREEZER_RT_FIELD(demo::Compose, g, "g", ""));
    rt::bind_closure<demo::Holder>(
        types, "demo::Holder", FREEZER_RT_FIELD(demo::Holder, held, "held", ""));
    rt::bind_closure<demo::Counter>(
        types, "demo::Counter", FREEZER_RT_FIELD(demo::Counter, start, "start", ""));
    rt::bind_closure<demo::Fragile>(
        types, "demo::Fragile", FREEZER_RT_FIELD(demo::Fragile, n, "n", ""));
  }

  Bytes freeze(const Value& value)
  {
    auto bytes = engine.freeze(value);
    REQUIRE(bytes.is_expect());
    return *std::move(bytes);
  }

  Value round_trip(const Value& value)
  {
    auto back = engine.thaw(freeze(value));
    REQUIRE(back.is_expect());
    return *std::move(back);
  }

  FnPtr round_trip_fn(const FnPtr& fn)
  {
    auto back = round_trip(Value{fn});
    REQUIRE(back.as_fn() != nullptr);
    return *back.as_fn();
  }
};

TEST_CASE("freezer/extensions/serializable_fn: named bindings")
{
  Freezer fz;

  SUBCASE("identity")
  {
    auto square = std::make_shared<const demo::Square>();
    fz.bindings.def(Symbol{"demo", "Square"}, square);
    auto back = fz.round_trip(Value{square});
    CHECK(back == Value{square});
    CHECK((*back.as_fn())->invoke(std::vector<Value>{7}) == Value{49});
  }
  SUBCASE("only the name is written")
  {
    auto square = std::make_shared<const demo::Square>();
    fz.bindings.def(Symbol{"demo", "Square"}, square);
    OutputStream expected;
    REQUIRE(fz.engine.freeze_to_stream(Value{Symbol{"demo", "Square"}}, expected).is_expect());

    auto bytes = fz.freeze(Value{square});
    // header, byte order flag, extension tag and id (each stream has its own flag)
    REQUIRE(bytes.size() == 4 + 1 + 1 + 2 + expected.size() - 1);
    CHECK(std::equal(expected.bytes().begin() + 1, expected.bytes().end(), bytes.begin() + 8));
  }
  SUBCASE("thaw reads the current value of the binding")
  {
    auto first  = std::make_shared<const demo::Square>();
    auto second = std::make_shared<const demo::Square>();
    fz.bindings.def(Symbol{"demo", "Square"}, first);
    auto bytes = fz.freeze(Value{first});
    fz.bindings.def(Symbol{"demo", "Square"}, second);

    auto back = fz.engine.thaw(bytes);
    REQUIRE(back.is_expect());
    CHECK(*back == Value{second});
  }
  SUBCASE("interface methods")
  {
    auto shape =
        rt::define_interface(fz.bindings, Symbol{"demo", "Shape"}, {"method1", "method2"});
    auto method1 = shape.method("method1");
    auto method2 = shape.method("method2");
    method1->extend(ValueKind::KIND_INT, std::make_shared<const demo::Square>());
    method2->extend(ValueKind::KIND_INT, demo::make_adder(1));

    auto back1 = fz.round_trip(Value{method1});
    CHECK(back1 == Value{method1});
    CHECK((*back1.as_fn())->invoke(std::vector<Value>{3}) == Value{9});

    // both methods share one runtime type, and so one cached encoder
    auto back2 = fz.round_trip(Value{method2});
    CHECK(back2 == Value{method2});
    CHECK((*back2.as_fn())->invoke(std::vector<Value>{3}) == Value{4});
    CHECK(fz.cache.stats().encoders_built == 1);

    CHECK(fz.round_trip(Value{method1}) == Value{method1});
  }
  SUBCASE("bound instance after a warm cache")
  {
    auto counter = std::make_shared<const demo::Counter>(10);
    fz.bindings.def(Symbol{"demo", "Counter"}, counter);

    // the first instance frozen is not the bound one
    auto other = fz.round_trip_fn(std::make_shared<const demo::Counter>(5));
    CHECK((*other)(1) == Value{6});
    CHECK(fz.round_trip(Value{counter}) == Value{counter});
    CHECK(fz.cache.stats().encoders_built == 1);
  }
  SUBCASE("non callable binding")
  {
    rt::define_interface(fz.bindings, Symbol{"demo", "Shape"}, {"method1"});
    REQUIRE(fz.bindings.find(Symbol{"demo", "Shape"}) != nullptr);
    REQUIRE(fz.bindings.find(Symbol{"demo", "Shape"})->get().as_fn() == nullptr);

    OutputStream out{Bytes{'F', 'R', 'Z', FORMAT_VERSION}};
    out.write_u8(static_cast<uint8_t>(WireTag::TAG_EXTENSION));
    out.write_u16(Engine::extension_id(FN_TAG));
    REQUIRE(fz.engine.freeze_to_stream(Value{Symbol{"demo", "Shape"}}, out).is_expect());
    auto back = fz.engine.thaw(out.bytes());
    REQUIRE(back.is_error());
    CHECK(back.error().kind == ErrorKind::ERROR_UNRESOLVABLE_BINDING);
  }
  SUBCASE("named binding with captured fields")
  {
    auto counter = std::make_shared<const demo::Counter>(10);
    fz.bindings.def(Symbol{"demo", "Counter"}, counter);
    CHECK(fz.round_trip(Value{counter}) == Value{counter});

    // other instances of the type are frozen as closures
    auto other = std::make_shared<const demo::Counter>(20);
    auto back  = fz.round_trip_fn(other);
    CHECK(back != other);
    CHECK(typeid(*back) == typeid(demo::Counter));
    CHECK((*back)(1) == Value{21});
    // and the bound instance is still frozen by name
    CHECK(fz.round_trip(Value{counter}) == Value{counter});
  }
  SUBCASE("unresolvable instance without closure type")
  {
    auto bound = std::make_shared<const demo::Square>();
    auto other = std::make_shared<const demo::Square>();
    fz.bindings.def(Symbol{"demo", "Square"}, bound);
    auto res = fz.engine.freeze(Value{other});
    REQUIRE(res.is_error());
    CHECK(res.error().kind == ErrorKind::ERROR_UNRESOLVABLE_BINDING);
  }
  SUBCASE("units are loaded on thaw")
  {
    auto square = std::make_shared<const demo::Square>();
    fz.bindings.def(Symbol{"demo", "Square"}, square);
    auto bytes = fz.freeze(Value{square});

    Freezer consumer;
    auto loaded = std::make_shared<const demo::Square>();
    int loads   = 0;
    consumer.bindings.register_unit(
        "demo",
        [&](rt::BindingTable& table)
        {
          ++loads;
          table.def(Symbol{"demo", "Square"}, loaded);
        });
    auto back = consumer.engine.thaw(bytes);
    REQUIRE(back.is_expect());
    CHECK(*back == Value{loaded});
    CHECK(consumer.bindings.is_loaded("demo"));
    CHECK(consumer.engine.thaw(bytes).is_expect());
    CHECK(loads == 1);
  }
  SUBCASE("unknown binding")
  {
    auto square = std::make_shared<const demo::Square>();
    fz.bindings.def(Symbol{"demo", "Square"}, square);
    auto bytes = fz.freeze(Value{square});

    Freezer consumer;
    auto back = consumer.engine.thaw(bytes);
    REQUIRE(back.is_error());
    CHECK(back.error().kind == ErrorKind::ERROR_UNRESOLVABLE_BINDING);
    CHECK(consumer.cache.size() == 0);

    // failures are not cached
    consumer.bindings.def(Symbol{"demo", "Square"}, square);
    back = consumer.engine.thaw(bytes);
    REQUIRE(back.is_expect());
    CHECK(*back == Value{square});
  }
  SUBCASE("failing unit")
  {
    auto square = std::make_shared<const demo::Square>();
    fz.bindings.def(Symbol{"demo", "Square"}, square);
    auto bytes = fz.freeze(Value{square});

    Freezer consumer;
    consumer.bindings.register_unit(
        "demo", [](rt::BindingTable&) { throw std::runtime_error("unit is broken"); });
    auto back = consumer.engine.thaw(bytes);
    REQUIRE(back.is_error());
    CHECK(back.error().kind == ErrorKind::ERROR_UNRESOLVABLE_BINDING);
  }
}

TEST_CASE("freezer/extensions/serializable_fn: anonymous closures")
{
  Freezer fz;

  SUBCASE("make_adder")
  {
    auto a    = demo::make_adder(2);
    auto back = fz.round_trip_fn(a);
    CHECK(back != a);
    CHECK((*back)(3) == Value{5});
  }
  SUBCASE("no captured value")
  {
    auto back = fz.round_trip_fn(std::make_shared<const demo::Answer>());
    CHECK((*back)() == Value{42});
  }
  SUBCASE("several captured values")
  {
    std::string name = "world";
    auto back = fz.round_trip_fn(std::make_shared<const demo::Greeter>("hello", name));
    CHECK((*back)() == Value{"hello, world"});
  }
  SUBCASE("captured callables")
  {
    auto square = std::make_shared<const demo::Square>();
    fz.bindings.def(Symbol{"demo", "Square"}, square);
    auto composed = std::make_shared<const demo::Compose>(square, demo::make_adder(1));

    auto back = fz.round_trip_fn(composed);
    CHECK((*back)(2) == Value{9});
    auto& thawed = dynamic_cast<const demo::Compose&>(*back);
    // named captures thaw to the binding
    CHECK(thawed.f == square);
  }
  SUBCASE("captured data")
  {
    auto holder = std::make_shared<const demo::Holder>(
        Value{Map{{"xs", Vector{1, 2.5, "three"}}, {Symbol{"k", "w"}, nullptr}}});
    auto back = fz.round_trip_fn(holder);
    CHECK((*back)() == holder->held);
  }
  SUBCASE("unfreezable captured value")
  {
    auto holder =
        std::make_shared<const demo::Holder>(Value{std::make_shared<const demo::Handle>()});
    auto res = fz.engine.freeze(Value{holder});
    REQUIRE(res.is_error());
    CHECK(res.error().kind == ErrorKind::ERROR_UNFREEZABLE_VALUE);
  }
  SUBCASE("unregistered type")
  {
    auto res = fz.engine.freeze(Value{std::make_shared<const demo::Unregistered>()});
    REQUIRE(res.is_error());
    CHECK(res.error().kind == ErrorKind::ERROR_INTROSPECTION_FAILURE);
    CHECK(fz.cache.stats().encoders_built == 0);

    // failures are not cached
    rt::bind_closure<demo::Unregistered>(fz.types, "demo::Unregistered");
    CHECK(fz.engine.freeze(Value{std::make_shared<const demo::Unregistered>()}).is_expect());
  }
  SUBCASE("throwing constructor")
  {
    auto bytes = fz.freeze(Value{std::make_shared<const demo::Fragile>(1)});
    g_reject_construction = true;
    auto back             = fz.engine.thaw(bytes);
    g_reject_construction = false;
    REQUIRE(back.is_error());
    CHECK(back.error().kind == ErrorKind::ERROR_INTROSPECTION_FAILURE);
  }
  SUBCASE("type rebound with other fields")
  {
    auto bytes = fz.freeze(Value{demo::make_adder(2)});

    rt::bind_closure<demo::Adder>(
        fz.types, "demo::Adder", FREEZER_RT_FIELD(demo::Adder, y, "addend", ""));
    fz.cache.clear();
    auto renamed = fz.engine.thaw(bytes);
    REQUIRE(renamed.is_error());
    CHECK(renamed.error().kind == ErrorKind::ERROR_SHAPE_MISMATCH);

    rt::bind_closure<demo::Pair>(
        fz.types, "demo::Adder", FREEZER_RT_FIELD(demo::Pair, a, "a", ""),
        FREEZER_RT_FIELD(demo::Pair, b, "b", ""));
    fz.cache.clear();
    auto resized = fz.engine.thaw(bytes);
    REQUIRE(resized.is_error());
    CHECK(resized.error().kind == ErrorKind::ERROR_SHAPE_MISMATCH);
  }
  SUBCASE("type no longer registered")
  {
    auto bytes = fz.freeze(Value{demo::make_adder(2)});
    fz.types.unbind("demo::Adder");
    auto back = fz.engine.thaw(bytes);
    REQUIRE(back.is_error());
    CHECK(back.error().kind == ErrorKind::ERROR_INTROSPECTION_FAILURE);
  }
  SUBCASE("malformed head")
  {
    OutputStream out{Bytes{'F', 'R', 'Z', FORMAT_VERSION}};
    out.write_u8(static_cast<uint8_t>(WireTag::TAG_EXTENSION));
    out.write_u16(Engine::extension_id(FN_TAG));
    REQUIRE(fz.engine.freeze_to_stream(Value{1}, out).is_expect());
    auto back = fz.engine.thaw(out.bytes());
    REQUIRE(back.is_error());
    CHECK(back.error().kind == ErrorKind::ERROR_MALFORMED_INPUT);
  }
}

TEST_CASE("freezer/extensions/serializable_fn: wrappers")
{
  Freezer fz;
  auto square = std::make_shared<const demo::Square>();
  fz.bindings.def(Symbol{"demo", "Square"}, square);
  const Map doc = {{"doc", "squares a number"}, {"since", 2}};

  SUBCASE("metadata on a named binding")
  {
    auto back = fz.round_trip_fn(with_meta(square, doc));
    REQUIRE(meta(back) != nullptr);
    CHECK(*meta(back) == doc);
    CHECK(dynamic_cast<const MetaFn&>(*back).inner() == square);
    CHECK((*back)(5) == Value{25});
  }
  SUBCASE("metadata on a closure")
  {
    auto back = fz.round_trip_fn(with_meta(demo::make_adder(2), doc));
    REQUIRE(meta(back) != nullptr);
    CHECK(*meta(back) == doc);
    CHECK((*back)(3) == Value{5});
  }
  SUBCASE("enclosing callable")
  {
    auto back = fz.round_trip_fn(bind_enclosing(Value{square}));
    CHECK(dynamic_cast<const EnclosingFn&>(*back).enclosing() == Value{square});
    CHECK((*back)(4) == Value{16});
  }
  SUBCASE("enclosing map and vector")
  {
    auto map = fz.round_trip_fn(bind_enclosing(Value{Map{{"a", 1}}}));
    CHECK((*map)("a") == Value{1});
    CHECK((*map)("b", 0) == Value{0});

    auto vec = fz.round_trip_fn(bind_enclosing(Value{Vector{"x", "y"}}));
    CHECK((*vec)(1) == Value{"y"});
  }
  SUBCASE("unfreezable enclosing value")
  {
    auto handle = Value{std::make_shared<const demo::Handle>()};
    auto res    = fz.engine.freeze(Value{bind_enclosing(Value{Vector{handle}})});
    REQUIRE(res.is_error());
    CHECK(res.error().kind == ErrorKind::ERROR_UNFREEZABLE_VALUE);
  }
}

TEST_CASE("freezer/extensions/serializable_fn: codec cache")
{
  Freezer fz;
  auto a = demo::make_adder(2);

  SUBCASE("idempotence")
  {
    auto first  = fz.freeze(Value{a});
    auto second = fz.freeze(Value{a});
    CHECK(first == second);
    CHECK(fz.cache.stats().encoders_built == 1);
  }
  SUBCASE("clear forces a rebuild")
  {
    auto first = fz.freeze(Value{a});
    REQUIRE(fz.engine.thaw(first).is_expect());
    CHECK(fz.cache.size() == 2);

    fz.cache.clear();
    CHECK(fz.cache.size() == 0);
    CHECK(fz.cache.stats().clears == 1);

    auto second = fz.freeze(Value{a});
    CHECK(fz.cache.stats().encoders_built == 2);
    CHECK(first == second);
    auto back = fz.engine.thaw(second);
    REQUIRE(back.is_expect());
    CHECK((*back->as_fn())->invoke(std::vector<Value>{3}) == Value{5});
    CHECK(fz.cache.stats().decoders_built == 2);
  }
  SUBCASE("one encoder per runtime type")
  {
    (void)fz.freeze(Value{demo::make_adder(1)});
    (void)fz.freeze(Value{demo::make_adder(5)});
    (void)fz.freeze(Value{std::make_shared<const demo::Answer>()});
    CHECK(fz.cache.stats().encoders_built == 2);
  }
  SUBCASE("concurrent freezes")
  {
    std::vector<Bytes> outputs(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < outputs.size(); i++)
    {
      threads.emplace_back(
          [&, i]
          {
            auto bytes = fz.engine.freeze(Value{a});
            if (bytes.is_expect())
              outputs[i] = *std::move(bytes);
          });
    }
    for (auto& thread : threads)
      thread.join();

    auto expected = fz.freeze(Value{a});
    for (auto& bytes : outputs)
      CHECK(bytes == expected);
    CHECK(fz.cache.size() == 1);
  }
}

TEST_CASE("freezer/extensions/serializable_fn: process-wide install")
{
  REQUIRE(install().is_expect());
  CHECK(default_engine().has_extension(FN_TAG));
  CHECK(default_engine().has_extension(FN_META_TAG));
  CHECK(default_engine().has_extension(FN_ENCLOSING_TAG));
  // installing twice replaces the hooks
  CHECK(install().is_expect());

  auto square = std::make_shared<const demo::Square>();
  rt::binding_table().def(Symbol{"demo", "Square"}, square);
  auto bytes = freezer::freeze(Value{square});
  REQUIRE(bytes.is_expect());
  auto back = freezer::thaw(*bytes);
  REQUIRE(back.is_expect());
  CHECK(*back == Value{square});

  clear_codec_cache();
  CHECK(codec_cache().size() == 0);
  rt::binding_table().unbind(Symbol{"demo", "Square"});
}

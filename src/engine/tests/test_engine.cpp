#include <doctest/doctest.h>
#include <freezer_engine/engine.h>
#include <freezer_engine/stream.h>
#include <limits>

using namespace freezer;

namespace demo
{
  struct Port final : Opaque
  {
    int64_t number;
    explicit Port(int64_t n)
        : number(n)
    {
    }
  };

  struct Mutex final : Opaque
  {
  };

  struct Identity final : Fn
  {
    Value invoke(std::span<const Value> args) const override { return args[0]; }
  };
} // namespace demo

static Value roundtrip(const Engine& engine, const Value& value)
{
  auto bytes = engine.freeze(value);
  REQUIRE(bytes.is_expect());
  auto ret = engine.thaw(*bytes);
  REQUIRE(ret.is_expect());
  return *ret;
}

static Result<Value> thaw_raw(const Engine& engine, const OutputStream& payload)
{
  Bytes bytes = {'F', 'R', 'Z', FORMAT_VERSION};
  bytes.insert(bytes.end(), payload.bytes().begin(), payload.bytes().end());
  return engine.thaw(bytes);
}

TEST_CASE("freezer/engine: streams")
{
  SUBCASE("integers")
  {
    OutputStream out;
    out.write_size(0);
    out.write_size(300);
    out.write_int(-1);
    out.write_int(std::numeric_limits<int64_t>::min());
    out.write_int(std::numeric_limits<int64_t>::max());
    out.write_u16(0xBEEF);
    out.write_double(-2.5);
    out.write_string("abc");

    InputStream in{out.bytes()};
    CHECK(*in.read_size() == 0);
    CHECK(*in.read_size() == 300);
    CHECK(*in.read_int() == -1);
    CHECK(*in.read_int() == std::numeric_limits<int64_t>::min());
    CHECK(*in.read_int() == std::numeric_limits<int64_t>::max());
    CHECK(*in.read_u16() == 0xBEEF);
    CHECK(*in.read_double() == -2.5);
    CHECK(*in.read_string() == "abc");
    CHECK(in.at_end());
  }
  SUBCASE("encodings")
  {
    OutputStream out{Bytes{0xAA}};
    out.write_u16(0x0102);
    out.write_int(-2);
    // prefix, little endian flag, then fixed width little endian values
    Bytes expected = {0xAA, 0x01, 0x02, 0x01, 0xFE, 0xFF, 0xFF, 0xFF,
                      0xFF, 0xFF, 0xFF, 0xFF};
    CHECK(Bytes(out.bytes().begin(), out.bytes().end()) == expected);
    CHECK(out.size() == expected.size());
  }
  SUBCASE("big endian input is converted")
  {
    Bytes bytes = {0x00, 0x01, 0x02};
    InputStream in{bytes};
    CHECK(*in.read_u16() == 0x0102);
  }
  SUBCASE("reads past the end")
  {
    Bytes bytes = {0x01, 0x80};
    InputStream in{bytes};
    auto res = in.read_size();
    REQUIRE(res.is_error());
    CHECK(res.error().kind == ErrorKind::ERROR_MALFORMED_INPUT);

    OutputStream str;
    str.write_size(5);
    str.write_u8('a');
    InputStream in_str{str.bytes()};
    CHECK(in_str.read_string().is_error());

    InputStream empty{std::span<const uint8_t>{}};
    CHECK(empty.read_u8().is_error());
    CHECK(empty.read_double().is_error());
  }
  SUBCASE("invalid byte order flag")
  {
    Bytes bytes = {0x07, 0x00};
    InputStream in{bytes};
    auto res = in.read_u8();
    REQUIRE(res.is_error());
    CHECK(res.error().kind == ErrorKind::ERROR_MALFORMED_INPUT);
  }
  SUBCASE("depth guard")
  {
    OutputStream out;
    {
      DepthGuard a{out, 2};
      DepthGuard b{out, 2};
      DepthGuard c{out, 2};
      CHECK(static_cast<bool>(a));
      CHECK(static_cast<bool>(b));
      CHECK_FALSE(static_cast<bool>(c));
      CHECK(out.depth() == 2);
    }
    CHECK(out.depth() == 0);
  }
}

TEST_CASE("freezer/engine: plain values")
{
  Engine engine;

  SUBCASE("wire layout")
  {
    auto bytes = engine.freeze(Value{1});
    REQUIRE(bytes.is_expect());
    Bytes expected = {'F', 'R', 'Z', FORMAT_VERSION, 0x01,
                      static_cast<uint8_t>(WireTag::TAG_INT), 0x01, 0x00, 0x00, 0x00,
                      0x00, 0x00, 0x00, 0x00};
    CHECK(*bytes == expected);
  }
  SUBCASE("round trip of every kind")
  {
    CHECK(roundtrip(engine, Value{}).is_nil());
    CHECK(roundtrip(engine, true) == Value{true});
    CHECK(roundtrip(engine, false) == Value{false});
    CHECK(roundtrip(engine, -123456789) == Value{-123456789});
    CHECK(roundtrip(engine, 0.125) == Value{0.125});
    const double nan = std::numeric_limits<double>::quiet_NaN();
    CHECK(roundtrip(engine, Vector{nan}) == Value{Vector{nan}});
    CHECK(roundtrip(engine, Map{{nan, 1}, {1.0, 2}}) == Value{Map{{nan, 1}, {1.0, 2}}});
    CHECK(roundtrip(engine, "") == Value{""});
    CHECK(roundtrip(engine, "freezer") == Value{"freezer"});
    CHECK(roundtrip(engine, Symbol{"demo", "square"}) == Value{Symbol{"demo", "square"}});

    Value nested = Vector{
        1, "two", Map{{"k", Vector{3.0, nullptr}}, {Symbol{"", "s"}, false}}, Vector{}};
    CHECK(roundtrip(engine, nested) == nested);
  }
  SUBCASE("nesting limit")
  {
    Engine shallow{EngineOptions{.max_depth = 4}};
    Value deep = Vector{};
    for (int i = 0; i < 5; i++)
      deep = Vector{deep};
    auto frozen = shallow.freeze(deep);
    REQUIRE(frozen.is_error());
    CHECK(frozen.error().kind == ErrorKind::ERROR_UNFREEZABLE_VALUE);

    auto bytes = engine.freeze(deep);
    REQUIRE(bytes.is_expect());
    auto thawed = shallow.thaw(*bytes);
    REQUIRE(thawed.is_error());
    CHECK(thawed.error().kind == ErrorKind::ERROR_MALFORMED_INPUT);
  }
}

TEST_CASE("freezer/engine: malformed input")
{
  Engine engine;

  SUBCASE("header")
  {
    Bytes no_header = {'F', 'R'};
    CHECK(engine.thaw(no_header).error().kind == ErrorKind::ERROR_MALFORMED_INPUT);
    Bytes bad_magic = {'F', 'R', 'X', FORMAT_VERSION, 0};
    CHECK(engine.thaw(bad_magic).error().kind == ErrorKind::ERROR_MALFORMED_INPUT);
    Bytes bad_version = {'F', 'R', 'Z', 99, 0};
    CHECK(engine.thaw(bad_version).error().kind == ErrorKind::ERROR_MALFORMED_INPUT);
  }
  SUBCASE("truncated")
  {
    auto bytes = engine.freeze(Vector{"abc", 1});
    REQUIRE(bytes.is_expect());
    for (size_t size = 4; size < bytes->size(); size++)
    {
      auto res = engine.thaw(std::span<const uint8_t>{bytes->data(), size});
      REQUIRE(res.is_error());
      CHECK(res.error().kind == ErrorKind::ERROR_MALFORMED_INPUT);
    }
  }
  SUBCASE("trailing bytes")
  {
    auto bytes = engine.freeze(1);
    REQUIRE(bytes.is_expect());
    bytes->push_back(0);
    auto res = engine.thaw(*bytes);
    REQUIRE(res.is_error());
    CHECK(res.error().kind == ErrorKind::ERROR_MALFORMED_INPUT);
  }
  SUBCASE("unknown tag and oversized containers")
  {
    OutputStream unknown;
    unknown.write_u8(0xEE);
    CHECK(thaw_raw(engine, unknown).error().kind == ErrorKind::ERROR_MALFORMED_INPUT);

    OutputStream vector;
    vector.write_u8(static_cast<uint8_t>(WireTag::TAG_VECTOR));
    vector.write_size(0x7F);
    CHECK(thaw_raw(engine, vector).error().kind == ErrorKind::ERROR_MALFORMED_INPUT);

    OutputStream map;
    map.write_u8(static_cast<uint8_t>(WireTag::TAG_MAP));
    map.write_size(2);
    for (int i = 0; i < 4; i++)
      map.write_u8(static_cast<uint8_t>(WireTag::TAG_NIL));
    CHECK(thaw_raw(engine, map).error().kind == ErrorKind::ERROR_MALFORMED_INPUT);
  }
  SUBCASE("unknown extension id")
  {
    OutputStream out;
    out.write_u8(static_cast<uint8_t>(WireTag::TAG_EXTENSION));
    out.write_u16(0x1234);
    auto res = thaw_raw(engine, out);
    REQUIRE(res.is_error());
    CHECK(res.error().kind == ErrorKind::ERROR_UNKNOWN_EXTENSION);
  }
}

TEST_CASE("freezer/engine: extensions")
{
  Engine engine;

  SUBCASE("values without extension are unfreezable")
  {
    auto res = engine.freeze(Vector{1, std::make_shared<demo::Mutex>()});
    REQUIRE(res.is_error());
    CHECK(res.error().kind == ErrorKind::ERROR_UNFREEZABLE_VALUE);
    CHECK(res.error().message.find("demo::Mutex") != std::string::npos);

    auto fn = engine.freeze(std::make_shared<demo::Identity>());
    REQUIRE(fn.is_error());
    CHECK(fn.error().kind == ErrorKind::ERROR_UNFREEZABLE_VALUE);
  }
  SUBCASE("exact runtime type")
  {
    auto id = engine.register_extension(
        "test/port", {ValueKind::KIND_OPAQUE, typeid(demo::Port)},
        [](const Engine&, const Value& value, OutputStream& out) -> Result<void>
        {
          auto& port = static_cast<const demo::Port&>(**value.as_opaque());
          out.write_int(port.number);
          return {};
        },
        [](const Engine&, InputStream& in) -> Result<Value>
        {
          auto number = in.read_int();
          if (number.is_error())
            return {unexpected, std::move(number).error()};
          return Value{std::make_shared<const demo::Port>(*number)};
        });
    REQUIRE(id.is_expect());
    CHECK(*id == Engine::extension_id("test/port"));
    CHECK(engine.has_extension("test/port"));
    CHECK_FALSE(engine.has_extension("test/other"));

    auto thawed = roundtrip(engine, Vector{std::make_shared<demo::Port>(8080)});
    auto& port  = static_cast<const demo::Port&>(**(*thawed.as_vector())[0].as_opaque());
    CHECK(port.number == 8080);

    // only the exact type is covered
    auto res = engine.freeze(std::make_shared<demo::Mutex>());
    REQUIRE(res.is_error());
    CHECK(res.error().kind == ErrorKind::ERROR_UNFREEZABLE_VALUE);
  }
  SUBCASE("exact type wins over the kind-wide extension")
  {
    int fallback_calls = 0;
    int exact_calls    = 0;
    auto identity      = std::make_shared<const demo::Identity>();
    auto decode = [identity](const Engine&, InputStream&) -> Result<Value>
    { return Value{identity}; };

    REQUIRE(engine
                .register_extension(
                    "test/any-fn", {ValueKind::KIND_FN},
                    [&](const Engine&, const Value&, OutputStream&) -> Result<void>
                    {
                      ++fallback_calls;
                      return {};
                    },
                    decode)
                .is_expect());
    REQUIRE(engine
                .register_extension(
                    "test/identity", {ValueKind::KIND_FN, typeid(demo::Identity)},
                    [&](const Engine&, const Value&, OutputStream&) -> Result<void>
                    {
                      ++exact_calls;
                      return {};
                    },
                    decode)
                .is_expect());

    struct Other final : Fn
    {
      Value invoke(std::span<const Value>) const override { return {}; }
    };
    REQUIRE(engine.freeze(identity).is_expect());
    REQUIRE(engine.freeze(std::make_shared<Other>()).is_expect());
    CHECK(exact_calls == 1);
    CHECK(fallback_calls == 1);
  }
  SUBCASE("hook errors are propagated unchanged")
  {
    REQUIRE(engine
                .register_extension(
                    "test/failing", {ValueKind::KIND_FN},
                    [](const Engine&, const Value&, OutputStream&) -> Result<void>
                    {
                      return {
                          unexpected,
                          make_error(ErrorKind::ERROR_SHAPE_MISMATCH, "from the hook")};
                    },
                    [](const Engine&, InputStream&) -> Result<Value> { return Value{}; })
                .is_expect());
    auto res = engine.freeze(Map{{"f", std::make_shared<demo::Identity>()}});
    REQUIRE(res.is_error());
    CHECK(res.error().kind == ErrorKind::ERROR_SHAPE_MISMATCH);
    CHECK(res.error().message == "from the hook");
  }
  SUBCASE("id conflicts")
  {
    REQUIRE(Engine::extension_id("test/ext-123") == Engine::extension_id("test/ext-208"));
    auto encode = [](const Engine&, const Value&, OutputStream&) -> Result<void>
    { return {}; };
    auto decode = [](const Engine&, InputStream&) -> Result<Value> { return Value{}; };

    REQUIRE(engine.register_extension("test/ext-123", {ValueKind::KIND_OPAQUE}, encode, decode)
                .is_expect());
    // re-registering the same name replaces the hooks
    REQUIRE(engine.register_extension("test/ext-123", {ValueKind::KIND_OPAQUE}, encode, decode)
                .is_expect());
    auto res =
        engine.register_extension("test/ext-208", {ValueKind::KIND_OPAQUE}, encode, decode);
    REQUIRE(res.is_error());
    CHECK(res.error().kind == ErrorKind::ERROR_EXTENSION_CONFLICT);
    CHECK_FALSE(engine.has_extension("test/ext-208"));
  }
}

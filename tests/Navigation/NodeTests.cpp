#include <JNAV/Navigation/Document.hpp>
#include <JNAV/Navigation/Node.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

using namespace JNAV::Navigation;

namespace
{
    constexpr std::string_view kDocument = R"({
        "int": 42,
        "fraction": -3.9,
        "huge": 1e20,
        "flag": false,
        "text": "hello",
        "list": [10, "x", [true]],
        "nested": {"inner": {"value": 7}}
    })";

    Node ParseRoot(Construction construction)
    {
        NavigationOptions options;
        options.construction = construction;

        auto parsed = Document::Parse(kDocument, options);
        REQUIRE(parsed.HasValue());
        return parsed.ValueUnsafe();
    }
}// namespace

TEST_CASE("Node predicates match exactly one variant", "[Navigation][Node]")
{
    const Node root = ParseRoot(GENERATE(Construction::Eager, Construction::Lazy));

    const Node map = root.ByKey("nested");
    CHECK(map.Kind() == NodeKind::Map);
    CHECK(map.IsMap());
    CHECK_FALSE(map.IsArray());

    const Node array = root.ByKey("list");
    CHECK(array.Kind() == NodeKind::Array);
    CHECK(array.IsArray());
    CHECK_FALSE(array.IsMap());

    const Node number = root.ByKey("int");
    CHECK(number.IsNumber());
    CHECK_FALSE(number.IsString());

    const Node boolean = root.ByKey("flag");
    CHECK(boolean.IsBoolean());
    CHECK_FALSE(boolean.IsNumber());

    const Node string = root.ByKey("text");
    CHECK(string.IsString());
    CHECK_FALSE(string.IsBoolean());

    const Node error = root.ByKey("missing");
    CHECK(error.Kind() == NodeKind::Error);
    CHECK(error.IsError());
    CHECK_FALSE(error.IsMap());
    CHECK_FALSE(error.IsArray());
    CHECK_FALSE(error.IsNumber());
    CHECK_FALSE(error.IsBoolean());
    CHECK_FALSE(error.IsString());
}

TEST_CASE("Node navigation on the wrong variant yields an Error node", "[Navigation][Node]")
{
    const Node root = ParseRoot(GENERATE(Construction::Eager, Construction::Lazy));

    const Node byKeyOnArray = root.ByKey("list").ByKey("a");
    REQUIRE(byKeyOnArray.IsError());
    CHECK(byKeyOnArray.GetError().category == ErrorCategory::Navigation);
    CHECK(byKeyOnArray.GetError().code == ErrorCode::NotMap);
    CHECK(byKeyOnArray.GetError().message == "node is not map");

    const Node byIndexOnMap = root.ByIndex(0);
    REQUIRE(byIndexOnMap.IsError());
    CHECK(byIndexOnMap.GetError().code == ErrorCode::NotArray);
    CHECK(byIndexOnMap.GetError().message == "node is not array");

    const Node byKeyOnScalar = root.ByKey("text").ByKey("a");
    REQUIRE(byKeyOnScalar.IsError());
    CHECK(byKeyOnScalar.GetError().code == ErrorCode::NotMap);
}

TEST_CASE("Node Error variant absorbs navigation and coercion", "[Navigation][Node]")
{
    const Node root  = ParseRoot(GENERATE(Construction::Eager, Construction::Lazy));
    const Node error = root.ByKey("missing");
    REQUIRE(error.IsError());

    const Error& captured = error.GetError();
    CHECK(captured.code == ErrorCode::KeyNotFound);

    CHECK(error.ByKey("anything").IsSameAs(error));
    CHECK(error.ByIndex(3).IsSameAs(error));
    CHECK(error.ByIndex(-1).ByKey("x").GetError() == captured);

    CHECK(error.AsMap().Error() == captured);
    CHECK(error.AsArray().Error() == captured);
    CHECK(error.AsInt().Error() == captured);
    CHECK(error.AsInt64().Error() == captured);
    CHECK(error.AsFloat64().Error() == captured);
    CHECK(error.AsBool().Error() == captured);
    CHECK(error.AsString().Error() == captured);
    CHECK(error.AsStringView().Error() == captured);

    CHECK(error.Size() == 0);
    CHECK_FALSE(error.HasKey("missing"));
}

TEST_CASE("Node navigation is idempotent", "[Navigation][Node]")
{
    const Node root = ParseRoot(GENERATE(Construction::Eager, Construction::Lazy));

    CHECK(root.ByKey("nested").IsSameAs(root.ByKey("nested")));
    CHECK(root.ByKey("list").ByIndex(2).IsSameAs(root.ByKey("list").ByIndex(2)));

    const Node first  = root.ByKey("missing");
    const Node second = root.ByKey("missing");
    CHECK(first.GetError() == second.GetError());
}

TEST_CASE("Node AsMap returns the same children as ByKey", "[Navigation][Node]")
{
    const Node root = ParseRoot(GENERATE(Construction::Eager, Construction::Lazy));

    auto map = root.AsMap();
    REQUIRE(map.HasValue());

    std::vector<std::string> keys;
    for (const auto& [key, child]: map.ValueUnsafe())
    {
        keys.push_back(key);
        CHECK(child.IsSameAs(root.ByKey(key)));
    }
    CHECK(keys == std::vector<std::string> {"flag", "fraction", "huge", "int", "list", "nested", "text"});
    CHECK(root.Size() == keys.size());
}

TEST_CASE("Node AsArray keeps element order", "[Navigation][Node]")
{
    const Node root = ParseRoot(GENERATE(Construction::Eager, Construction::Lazy));
    const Node list = root.ByKey("list");

    auto array = list.AsArray();
    REQUIRE(array.HasValue());
    REQUIRE(array.ValueUnsafe().size() == 3);
    CHECK(array.ValueUnsafe()[0].AsInt().ValueOr(0) == 10);
    CHECK(array.ValueUnsafe()[1].AsString().ValueOr("") == "x");
    CHECK(array.ValueUnsafe()[2].IsSameAs(list.ByIndex(2)));

    auto notArray = root.AsArray();
    REQUIRE_FALSE(notArray.HasValue());
    CHECK(notArray.ErrorUnsafe().category == ErrorCategory::Coercion);
    CHECK(notArray.ErrorUnsafe().code == ErrorCode::NotArray);

    auto notMap = list.AsMap();
    REQUIRE_FALSE(notMap.HasValue());
    CHECK(notMap.ErrorUnsafe().category == ErrorCategory::Coercion);
    CHECK(notMap.ErrorUnsafe().code == ErrorCode::NotMap);
}

TEST_CASE("Node numeric coercions truncate toward zero", "[Navigation][Node]")
{
    const Node root = ParseRoot(GENERATE(Construction::Eager, Construction::Lazy));

    CHECK(root.ByKey("int").AsInt().Value() == 42);
    CHECK(root.ByKey("int").AsInt64().Value() == 42);
    CHECK(root.ByKey("fraction").AsInt().Value() == -3);
    CHECK(root.ByKey("fraction").AsInt64().Value() == -3);
    CHECK(root.ByKey("fraction").AsFloat64().Value() == -3.9);
    CHECK(root.ByKey("huge").AsFloat64().Value() == 1e20);
}

TEST_CASE("Node integer coercions reject out of range numbers", "[Navigation][Node]")
{
    const Node huge = ParseRoot(GENERATE(Construction::Eager, Construction::Lazy)).ByKey("huge");

    auto asInt = huge.AsInt();
    REQUIRE_FALSE(asInt.HasValue());
    CHECK(asInt.ErrorUnsafe().category == ErrorCategory::Coercion);
    CHECK(asInt.ErrorUnsafe().code == ErrorCode::NumberOutOfRange);
    CHECK(asInt.ErrorUnsafe().message == "number `1e+20` out of range for Int");

    auto asInt64 = huge.AsInt64();
    REQUIRE_FALSE(asInt64.HasValue());
    CHECK(asInt64.ErrorUnsafe().message == "number `1e+20` out of range for Int64");
}

TEST_CASE("Node scalar coercions fail on the wrong kind", "[Navigation][Node]")
{
    const Node root = ParseRoot(GENERATE(Construction::Eager, Construction::Lazy));

    CHECK(root.ByKey("flag").AsBool().Value() == false);
    CHECK(root.ByKey("text").AsString().Value() == "hello");
    CHECK(root.ByKey("text").AsStringView().Value() == "hello");

    auto notBoolean = root.ByKey("int").AsBool();
    REQUIRE_FALSE(notBoolean.HasValue());
    CHECK(notBoolean.ErrorUnsafe().code == ErrorCode::NotBoolean);
    CHECK(notBoolean.ErrorUnsafe().message == "node is not boolean");

    auto notString = root.ByKey("flag").AsString();
    REQUIRE_FALSE(notString.HasValue());
    CHECK(notString.ErrorUnsafe().code == ErrorCode::NotString);
    CHECK(notString.ErrorUnsafe().message == "node is not string");

    CHECK(root.ByKey("text").AsFloat64().ErrorUnsafe().code == ErrorCode::NotNumber);
    CHECK(root.ByKey("nested").AsInt64().ErrorUnsafe().code == ErrorCode::NotNumber);
    CHECK(root.ByKey("list").AsStringView().ErrorUnsafe().code == ErrorCode::NotString);
}

TEST_CASE("Node Size and HasKey", "[Navigation][Node]")
{
    const Node root = ParseRoot(GENERATE(Construction::Eager, Construction::Lazy));

    CHECK(root.Size() == 7);
    CHECK(root.HasKey("nested"));
    CHECK_FALSE(root.HasKey("absent"));
    CHECK(root.ByKey("list").Size() == 3);
    CHECK_FALSE(root.ByKey("list").HasKey("0"));
    CHECK(root.ByKey("text").Size() == 0);
    CHECK(root.GetError().IsNone());
}

TEST_CASE("Node At walks a path of keys and indices", "[Navigation][Node]")
{
    const Node root = ParseRoot(GENERATE(Construction::Eager, Construction::Lazy));

    CHECK(root.At({"nested", "inner", "value"}).AsInt().ValueOr(0) == 7);
    CHECK(root.At({"list", 2, 0}).AsBool().ValueOr(false));
    CHECK(root.At(std::span<const PathSegment> {}).IsSameAs(root));

    const Node missing = root.At({"list", 9, "deeper"});
    REQUIRE(missing.IsError());
    CHECK(missing.GetError().code == ErrorCode::IndexOutOfRange);
    CHECK(missing.GetError().message == "index `9` out of range");

    const std::vector<PathSegment> path {PathSegment {"nested"}, PathSegment {"inner"}};
    CHECK(root.At(path).IsMap());
}

TEST_CASE("NodeKind names", "[Navigation][Node]")
{
    CHECK(ToString(NodeKind::Map) == "Map");
    CHECK(ToString(NodeKind::Array) == "Array");
    CHECK(ToString(NodeKind::Number) == "Number");
    CHECK(ToString(NodeKind::Boolean) == "Boolean");
    CHECK(ToString(NodeKind::String) == "String");
    CHECK(ToString(NodeKind::Error) == "Error");
}

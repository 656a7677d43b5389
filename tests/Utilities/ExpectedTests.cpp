#include <JNAV/Utilities/Expected.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <variant>

namespace
{
    struct MoveOnly
    {
        int value {0};

        explicit MoveOnly(int v) noexcept
            : value {v}
        {
        }

        MoveOnly(const MoveOnly&)            = delete;
        MoveOnly& operator=(const MoveOnly&) = delete;

        MoveOnly(MoveOnly&& other) noexcept
            : value {other.value}
        {
            other.value = -1;
        }

        MoveOnly& operator=(MoveOnly&& other) noexcept
        {
            value       = other.value;
            other.value = -1;
            return *this;
        }
    };

    struct CountingError
    {
        inline static int s_destructCount = 0;

        int value {0};

        explicit CountingError(int v) noexcept
            : value {v}
        {
        }

        CountingError(const CountingError& other) noexcept
            : value {other.value}
        {
        }

        CountingError(CountingError&& other) noexcept
            : value {other.value}
        {
            other.value = -1;
        }

        CountingError& operator=(const CountingError&) = default;
        CountingError& operator=(CountingError&&)      = default;

        ~CountingError() { ++s_destructCount; }

        static void Reset() { s_destructCount = 0; }
    };
}// namespace

TEST_CASE("Expected<T,E> basic value construction", "[Utilities][Expected]")
{
    using Expected = JNAV::Utilities::Expected<int, std::string>;

    Expected a {42};
    REQUIRE(a.HasValue());
    REQUIRE(static_cast<bool>(a));
    REQUIRE(a.Value() == 42);
    REQUIRE(a.ValueUnsafe() == 42);
}

TEST_CASE("Expected<T,E> basic error construction", "[Utilities][Expected]")
{
    using Expected = JNAV::Utilities::Expected<int, std::string>;

    Expected e {JNAV::Utilities::Unexpected<std::string> {"broken"}};
    REQUIRE_FALSE(e.HasValue());
    REQUIRE_FALSE(static_cast<bool>(e));
    REQUIRE(e.Error() == "broken");
    REQUIRE(e.ErrorUnsafe() == "broken");
}

TEST_CASE("Expected<T,E> checked accessors throw on the wrong alternative", "[Utilities][Expected]")
{
    using Expected = JNAV::Utilities::Expected<int, std::string>;

    Expected value {1};
    REQUIRE_THROWS_AS(value.Error(), std::bad_variant_access);

    Expected error {JNAV::Utilities::Unexpected<std::string> {"x"}};
    REQUIRE_THROWS_AS(error.Value(), std::bad_variant_access);
}

TEST_CASE("Expected<T,E> move-only value", "[Utilities][Expected]")
{
    using Expected = JNAV::Utilities::Expected<MoveOnly, int>;

    Expected a {MoveOnly {5}};
    REQUIRE(a.HasValue());
    REQUIRE(a.Value().value == 5);

    Expected b {std::move(a)};
    REQUIRE(b.HasValue());
    REQUIRE(b.Value().value == 5);
}

TEST_CASE("Expected<T,E> ValueOr", "[Utilities][Expected]")
{
    using Expected = JNAV::Utilities::Expected<int, std::string>;

    const Expected hasValue {3};
    const Expected hasError {JNAV::Utilities::Unexpected<std::string> {"e"}};

    REQUIRE(hasValue.ValueOr(99) == 3);
    REQUIRE(hasError.ValueOr(99) == 99);

    Expected rvalueHasValue {4};
    REQUIRE(std::move(rvalueHasValue).ValueOr(77) == 4);

    Expected rvalueHasError {JNAV::Utilities::Unexpected<std::string> {"e"}};
    REQUIRE(std::move(rvalueHasError).ValueOr(77) == 77);
}

TEST_CASE("Expected<T,E> ErrorOr", "[Utilities][Expected]")
{
    using Expected = JNAV::Utilities::Expected<int, std::string>;

    const Expected hasValue {3};
    const Expected hasError {JNAV::Utilities::Unexpected<std::string> {"e"}};

    REQUIRE(hasValue.ErrorOr("fallback") == "fallback");
    REQUIRE(hasError.ErrorOr("fallback") == "e");
}

TEST_CASE("Expected<T,E> rvalue Value/Error accessors move", "[Utilities][Expected]")
{
    using ExpectedValue = JNAV::Utilities::Expected<MoveOnly, int>;
    ExpectedValue a {MoveOnly {42}};

    MoveOnly extracted = std::move(a).Value();
    REQUIRE(extracted.value == 42);
    REQUIRE(a.HasValue());
    REQUIRE(a.ValueUnsafe().value == -1);

    using ExpectedError = JNAV::Utilities::Expected<int, CountingError>;
    ExpectedError b {JNAV::Utilities::Unexpected<CountingError> {CountingError {7}}};
    CountingError extractedError = std::move(b).Error();
    REQUIRE(extractedError.value == 7);
    REQUIRE_FALSE(b.HasValue());
    REQUIRE(b.ErrorUnsafe().value == -1);
}

TEST_CASE("Expected<T,E> Swap", "[Utilities][Expected]")
{
    using Expected = JNAV::Utilities::Expected<int, std::string>;

    // value/value
    {
        Expected a {1};
        Expected b {2};
        a.Swap(b);
        REQUIRE(a.Value() == 2);
        REQUIRE(b.Value() == 1);
    }

    // value/error
    {
        Expected a {7};
        Expected b {JNAV::Utilities::Unexpected<std::string> {"nine"}};
        a.Swap(b);
        REQUIRE_FALSE(a.HasValue());
        REQUIRE(a.Error() == "nine");
        REQUIRE(b.HasValue());
        REQUIRE(b.Value() == 7);
    }
}

TEST_CASE("Expected<void,E> success and error", "[Utilities][Expected]")
{
    using Expected = JNAV::Utilities::Expected<void, int>;

    Expected ok;
    REQUIRE(ok.HasValue());
    REQUIRE(ok.ErrorOr(9) == 9);

    Expected err {JNAV::Utilities::Unexpected<int> {8}};
    REQUIRE_FALSE(err.HasValue());
    REQUIRE(err.Error() == 8);
    REQUIRE(err.ErrorOr(9) == 8);
}

TEST_CASE("Expected<void,E> Swap", "[Utilities][Expected]")
{
    using Expected = JNAV::Utilities::Expected<void, int>;

    Expected a;
    Expected b {JNAV::Utilities::Unexpected<int> {3}};
    a.Swap(b);
    REQUIRE_FALSE(a.HasValue());
    REQUIRE(a.Error() == 3);
    REQUIRE(b.HasValue());
}

TEST_CASE("Expected<void,E> destroys its error once", "[Utilities][Expected]")
{
    using Expected = JNAV::Utilities::Expected<void, CountingError>;

    CountingError::Reset();
    {
        Expected e {JNAV::Utilities::Unexpected<CountingError> {CountingError {17}}};
        REQUIRE_FALSE(e.HasValue());
        CountingError::Reset();
    }
    REQUIRE(CountingError::s_destructCount == 1);
}

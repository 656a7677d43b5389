/// @file INode.hpp
/// @brief Polymorphic interface behind `Node`, implemented by every node variant.
#pragma once

#include <JNAV/Defines.hpp>
#include <JNAV/Navigation/Error.hpp>
#include <JNAV/Navigation/Node.hpp>
#include <JNAV/Primitives.hpp>

#include <string>
#include <string_view>

namespace JNAV::Navigation
{
    /// @brief Navigation and coercion contract implemented by every node variant.
    ///
    /// Every variant implements every operation; operations that do not apply to a variant
    /// report a typed error instead of being absent.
    class JNAV_API INode
    {
    public:
        virtual ~INode() = default;

        [[nodiscard]] virtual NodeKind Kind() const noexcept = 0;

        [[nodiscard]] virtual Node ByKey(std::string_view key) const = 0;
        [[nodiscard]] virtual Node ByIndex(Int64 index) const        = 0;

        [[nodiscard]] virtual UIntSize     Size() const noexcept                      = 0;
        [[nodiscard]] virtual bool         HasKey(std::string_view key) const noexcept = 0;
        [[nodiscard]] virtual const Error* CapturedError() const noexcept             = 0;

        [[nodiscard]] virtual NodeExpected<NodeMap>          AsMap() const        = 0;
        [[nodiscard]] virtual NodeExpected<NodeArray>        AsArray() const      = 0;
        [[nodiscard]] virtual NodeExpected<Int>              AsInt() const        = 0;
        [[nodiscard]] virtual NodeExpected<Int64>            AsInt64() const      = 0;
        [[nodiscard]] virtual NodeExpected<F64>              AsFloat64() const    = 0;
        [[nodiscard]] virtual NodeExpected<bool>             AsBool() const       = 0;
        [[nodiscard]] virtual NodeExpected<std::string>      AsString() const     = 0;
        [[nodiscard]] virtual NodeExpected<std::string_view> AsStringView() const = 0;

        [[nodiscard]] bool IsMap() const noexcept { return Kind() == NodeKind::Map; }
        [[nodiscard]] bool IsArray() const noexcept { return Kind() == NodeKind::Array; }
        [[nodiscard]] bool IsNumber() const noexcept { return Kind() == NodeKind::Number; }
        [[nodiscard]] bool IsBoolean() const noexcept { return Kind() == NodeKind::Boolean; }
        [[nodiscard]] bool IsString() const noexcept { return Kind() == NodeKind::String; }
        [[nodiscard]] bool IsError() const noexcept { return Kind() == NodeKind::Error; }
    };
}// namespace JNAV::Navigation

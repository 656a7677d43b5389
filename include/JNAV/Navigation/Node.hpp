/// @file Node.hpp
/// @brief `JNAV::Navigation::Node`: chainable, type-checked handle over one JSON value.
#pragma once

#include <JNAV/Defines.hpp>
#include <JNAV/Navigation/Error.hpp>
#include <JNAV/Primitives.hpp>
#include <JNAV/Utilities/Expected.hpp>

#include <concepts>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace JNAV::Navigation
{
    class INode;
    class Node;

    /// @brief The fixed set of node variants.
    enum class NodeKind : UInt8
    {
        Map,
        Array,
        Number,
        Boolean,
        String,
        Error,
    };

    [[nodiscard]] JNAV_API std::string_view ToString(NodeKind kind) noexcept;

    using NodeMap   = std::map<std::string, Node, std::less<>>;
    using NodeArray = std::vector<Node>;

    template<class T>
    using NodeExpected = JNAV::Utilities::Expected<T, Error>;

    /// @brief One step of a navigation path: a map key or an array index.
    class PathSegment
    {
    public:
        PathSegment(std::string_view key)
            : m_value(std::in_place_index<0>, key)
        {
        }

        PathSegment(const char* key)
            : m_value(std::in_place_index<0>, key)
        {
        }

        template<std::integral TIndex>
        PathSegment(TIndex index) noexcept
            : m_value(std::in_place_index<1>, static_cast<Int64>(index))
        {
        }

        [[nodiscard]] bool IsKey() const noexcept { return m_value.index() == 0; }
        [[nodiscard]] bool IsIndex() const noexcept { return m_value.index() == 1; }

        [[nodiscard]] std::string_view Key() const noexcept { return *std::get_if<0>(&m_value); }
        [[nodiscard]] Int64            Index() const noexcept { return *std::get_if<1>(&m_value); }

    private:
        std::variant<std::string, Int64> m_value;
    };

    /// @brief Value handle over a node of any variant.
    ///
    /// Navigation never fails eagerly: `ByKey`/`ByIndex` on a mismatched variant, or with a missing
    /// key/index, return an Error node. An Error node returns itself from every navigation call and
    /// its captured error from every `As*` call, so a chain such as
    /// `root.ByKey("a").ByIndex(1).AsInt()` reports the first failure without intermediate checks.
    ///
    /// Copies share the underlying node. Handles keep the node (and, for lazily built trees, the
    /// decoded document) alive.
    class JNAV_API Node
    {
    public:
        /// @brief Wraps a node implementation. `impl` must not be null.
        explicit Node(std::shared_ptr<const INode> impl) noexcept;

        /// @brief Creates an Error node carrying `error`.
        [[nodiscard]] static Node FromError(Error error);

        [[nodiscard]] Node ByKey(std::string_view key) const;
        [[nodiscard]] Node ByIndex(Int64 index) const;

        /// @brief Applies `ByKey`/`ByIndex` for each segment in order.
        [[nodiscard]] Node At(std::span<const PathSegment> path) const;
        [[nodiscard]] Node At(std::initializer_list<PathSegment> path) const;

        [[nodiscard]] NodeKind Kind() const noexcept;

        [[nodiscard]] bool IsMap() const noexcept;
        [[nodiscard]] bool IsArray() const noexcept;
        [[nodiscard]] bool IsNumber() const noexcept;
        [[nodiscard]] bool IsBoolean() const noexcept;
        [[nodiscard]] bool IsString() const noexcept;
        [[nodiscard]] bool IsError() const noexcept;

        /// @brief Captured error of an Error node; an empty `Error` for every other variant.
        [[nodiscard]] const Error& GetError() const noexcept;

        /// @brief Member count of a Map, element count of an Array, 0 otherwise.
        [[nodiscard]] UIntSize Size() const noexcept;

        /// @brief True when this is a Map containing `key`. Does not build the child.
        [[nodiscard]] bool HasKey(std::string_view key) const noexcept;

        [[nodiscard]] NodeExpected<NodeMap>          AsMap() const;
        [[nodiscard]] NodeExpected<NodeArray>        AsArray() const;
        [[nodiscard]] NodeExpected<Int>              AsInt() const;
        [[nodiscard]] NodeExpected<Int64>            AsInt64() const;
        [[nodiscard]] NodeExpected<F64>              AsFloat64() const;
        [[nodiscard]] NodeExpected<bool>             AsBool() const;
        [[nodiscard]] NodeExpected<std::string>      AsString() const;
        /// @brief View into the stored string; valid while any handle to this node exists.
        [[nodiscard]] NodeExpected<std::string_view> AsStringView() const;

        /// @brief True when both handles refer to the same node instance.
        [[nodiscard]] bool IsSameAs(const Node& other) const noexcept { return m_impl == other.m_impl; }

    private:
        std::shared_ptr<const INode> m_impl;
    };
}// namespace JNAV::Navigation

/// @file Nodes.hpp
/// @brief Internal node variants: Map, Array (eager and lazy), Scalar, Error.
#pragma once

#include <JNAV/Defines.hpp>
#include <JNAV/Navigation/INode.hpp>
#include <JNAV/Serialization/JSON/JsonTypes.hpp>
#include <JNAV/Sync/SpinLock.hpp>

#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace JNAV::Navigation::detail
{
    /// @brief Shared default for every operation a variant does not support: each one reports its mismatch error.
    class JNAV_LOCAL NodeBase : public INode
    {
    public:
        [[nodiscard]] Node ByKey(std::string_view key) const override;
        [[nodiscard]] Node ByIndex(Int64 index) const override;

        [[nodiscard]] UIntSize     Size() const noexcept override { return 0; }
        [[nodiscard]] bool         HasKey(std::string_view) const noexcept override { return false; }
        [[nodiscard]] const Error* CapturedError() const noexcept override { return nullptr; }

        [[nodiscard]] NodeExpected<NodeMap>          AsMap() const override;
        [[nodiscard]] NodeExpected<NodeArray>        AsArray() const override;
        [[nodiscard]] NodeExpected<Int>              AsInt() const override;
        [[nodiscard]] NodeExpected<Int64>            AsInt64() const override;
        [[nodiscard]] NodeExpected<F64>              AsFloat64() const override;
        [[nodiscard]] NodeExpected<bool>             AsBool() const override;
        [[nodiscard]] NodeExpected<std::string>      AsString() const override;
        [[nodiscard]] NodeExpected<std::string_view> AsStringView() const override;
    };

    /// @brief Eagerly built object: every child exists from construction.
    class JNAV_LOCAL MapNode final : public NodeBase
    {
    public:
        explicit MapNode(NodeMap children) noexcept
            : m_children(std::move(children))
        {
        }

        [[nodiscard]] NodeKind Kind() const noexcept override { return NodeKind::Map; }

        [[nodiscard]] Node ByKey(std::string_view key) const override;

        [[nodiscard]] UIntSize Size() const noexcept override { return m_children.size(); }
        [[nodiscard]] bool     HasKey(std::string_view key) const noexcept override;

        [[nodiscard]] NodeExpected<NodeMap> AsMap() const override;

    private:
        NodeMap m_children;
    };

    /// @brief Eagerly built array.
    class JNAV_LOCAL ArrayNode final : public NodeBase
    {
    public:
        explicit ArrayNode(NodeArray children) noexcept
            : m_children(std::move(children))
        {
        }

        [[nodiscard]] NodeKind Kind() const noexcept override { return NodeKind::Array; }

        [[nodiscard]] Node ByIndex(Int64 index) const override;

        [[nodiscard]] UIntSize Size() const noexcept override { return m_children.size(); }

        [[nodiscard]] NodeExpected<NodeArray> AsArray() const override;

    private:
        NodeArray m_children;
    };

    /// @brief Object whose children are built on first visit and cached.
    ///
    /// The cache only grows; a cached child is returned for every later visit. Cache access is
    /// serialized by a spin lock, so first visits from several threads still yield one instance.
    class JNAV_LOCAL LazyMapNode final : public NodeBase
    {
    public:
        LazyMapNode(std::shared_ptr<const JNAV::Serialization::JsonDocument> document,
                    const JNAV::Serialization::JsonObject&                    object) noexcept
            : m_document(std::move(document)), m_object(&object)
        {
        }

        [[nodiscard]] NodeKind Kind() const noexcept override { return NodeKind::Map; }

        [[nodiscard]] Node ByKey(std::string_view key) const override;

        [[nodiscard]] UIntSize Size() const noexcept override { return m_object->Size(); }
        [[nodiscard]] bool     HasKey(std::string_view key) const noexcept override { return m_object->Contains(key); }

        [[nodiscard]] NodeExpected<NodeMap> AsMap() const override;

    private:
        struct KeyHash
        {
            using is_transparent = void;

            [[nodiscard]] UIntSize operator()(std::string_view key) const noexcept
            {
                return std::hash<std::string_view> {}(key);
            }
        };

        [[nodiscard]] Node ChildFor(std::string_view key, const JNAV::Serialization::JsonValue& value) const;

        std::shared_ptr<const JNAV::Serialization::JsonDocument>               m_document;
        const JNAV::Serialization::JsonObject*                                 m_object {nullptr};
        mutable JNAV::Sync::SpinLock                                           m_lock;
        mutable std::unordered_map<std::string, Node, KeyHash, std::equal_to<>> m_cache;
    };

    /// @brief Array whose elements are built on first visit and cached.
    class JNAV_LOCAL LazyArrayNode final : public NodeBase
    {
    public:
        LazyArrayNode(std::shared_ptr<const JNAV::Serialization::JsonDocument> document,
                      const JNAV::Serialization::JsonArray&                     array) noexcept
            : m_document(std::move(document)), m_array(&array)
        {
        }

        [[nodiscard]] NodeKind Kind() const noexcept override { return NodeKind::Array; }

        [[nodiscard]] Node ByIndex(Int64 index) const override;

        [[nodiscard]] UIntSize Size() const noexcept override { return m_array->Size(); }

        [[nodiscard]] NodeExpected<NodeArray> AsArray() const override;

    private:
        [[nodiscard]] Node ChildAt(UIntSize index) const;

        std::shared_ptr<const JNAV::Serialization::JsonDocument> m_document;
        const JNAV::Serialization::JsonArray*                    m_array {nullptr};
        mutable JNAV::Sync::SpinLock                             m_lock;
        mutable std::unordered_map<UIntSize, Node>               m_cache;
    };

    /// @brief Number, Boolean, or String leaf.
    class JNAV_LOCAL ScalarNode final : public NodeBase
    {
    public:
        explicit ScalarNode(F64 number) noexcept
            : m_value(std::in_place_index<0>, number)
        {
        }

        explicit ScalarNode(bool boolean) noexcept
            : m_value(std::in_place_index<1>, boolean)
        {
        }

        explicit ScalarNode(std::string string) noexcept
            : m_value(std::in_place_index<2>, std::move(string))
        {
        }

        [[nodiscard]] NodeKind Kind() const noexcept override;

        [[nodiscard]] NodeExpected<Int>              AsInt() const override;
        [[nodiscard]] NodeExpected<Int64>            AsInt64() const override;
        [[nodiscard]] NodeExpected<F64>              AsFloat64() const override;
        [[nodiscard]] NodeExpected<bool>             AsBool() const override;
        [[nodiscard]] NodeExpected<std::string>      AsString() const override;
        [[nodiscard]] NodeExpected<std::string_view> AsStringView() const override;

    private:
        std::variant<F64, bool, std::string> m_value;
    };

    /// @brief Terminal node capturing one error. Navigation returns the node itself.
    class JNAV_LOCAL ErrorNode final : public INode, public std::enable_shared_from_this<ErrorNode>
    {
    public:
        explicit ErrorNode(Error error) noexcept
            : m_error(std::move(error))
        {
        }

        [[nodiscard]] NodeKind Kind() const noexcept override { return NodeKind::Error; }

        [[nodiscard]] Node ByKey(std::string_view key) const override;
        [[nodiscard]] Node ByIndex(Int64 index) const override;

        [[nodiscard]] UIntSize     Size() const noexcept override { return 0; }
        [[nodiscard]] bool         HasKey(std::string_view) const noexcept override { return false; }
        [[nodiscard]] const Error* CapturedError() const noexcept override { return &m_error; }

        [[nodiscard]] NodeExpected<NodeMap>          AsMap() const override;
        [[nodiscard]] NodeExpected<NodeArray>        AsArray() const override;
        [[nodiscard]] NodeExpected<Int>              AsInt() const override;
        [[nodiscard]] NodeExpected<Int64>            AsInt64() const override;
        [[nodiscard]] NodeExpected<F64>              AsFloat64() const override;
        [[nodiscard]] NodeExpected<bool>             AsBool() const override;
        [[nodiscard]] NodeExpected<std::string>      AsString() const override;
        [[nodiscard]] NodeExpected<std::string_view> AsStringView() const override;

    private:
        template<class T>
        [[nodiscard]] NodeExpected<T> Propagate() const
        {
            return NodeExpected<T>(JNAV::Utilities::Unexpected<Error>(m_error));
        }

        Error m_error;
    };
}// namespace JNAV::Navigation::detail

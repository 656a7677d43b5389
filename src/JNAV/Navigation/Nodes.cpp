#include "Nodes.hpp"

#include <cmath>
#include <limits>

namespace JNAV::Navigation::detail
{
    namespace
    {
        template<class T>
        [[nodiscard]] NodeExpected<T> Failure(Error error)
        {
            return NodeExpected<T>(JNAV::Utilities::Unexpected<Error>(std::move(error)));
        }

        /// Truncates toward zero. Values whose truncation does not fit `TInt` are rejected.
        template<class TInt>
        [[nodiscard]] NodeExpected<TInt> TruncateToInteger(F64 value, std::string_view target)
        {
            constexpr F64 lower = static_cast<F64>(std::numeric_limits<TInt>::min());
            constexpr F64 upper = -lower;

            const F64 truncated = std::trunc(value);
            if (std::isnan(truncated) || truncated < lower || truncated >= upper)
                return Failure<TInt>(Error::NumberOutOfRange(value, target));
            return NodeExpected<TInt>(static_cast<TInt>(truncated));
        }
    }// namespace

    // NodeBase

    Node NodeBase::ByKey(std::string_view) const
    {
        return Node::FromError(Error::NotMap(ErrorCategory::Navigation));
    }

    Node NodeBase::ByIndex(Int64) const
    {
        return Node::FromError(Error::NotArray(ErrorCategory::Navigation));
    }

    NodeExpected<NodeMap> NodeBase::AsMap() const
    {
        return Failure<NodeMap>(Error::NotMap(ErrorCategory::Coercion));
    }

    NodeExpected<NodeArray> NodeBase::AsArray() const
    {
        return Failure<NodeArray>(Error::NotArray(ErrorCategory::Coercion));
    }

    NodeExpected<Int> NodeBase::AsInt() const
    {
        return Failure<Int>(Error::NotNumber());
    }

    NodeExpected<Int64> NodeBase::AsInt64() const
    {
        return Failure<Int64>(Error::NotNumber());
    }

    NodeExpected<F64> NodeBase::AsFloat64() const
    {
        return Failure<F64>(Error::NotNumber());
    }

    NodeExpected<bool> NodeBase::AsBool() const
    {
        return Failure<bool>(Error::NotBoolean());
    }

    NodeExpected<std::string> NodeBase::AsString() const
    {
        return Failure<std::string>(Error::NotString());
    }

    NodeExpected<std::string_view> NodeBase::AsStringView() const
    {
        return Failure<std::string_view>(Error::NotString());
    }

    // MapNode

    Node MapNode::ByKey(std::string_view key) const
    {
        const auto it = m_children.find(key);
        if (it == m_children.end())
            return Node::FromError(Error::KeyNotFound(key));
        return it->second;
    }

    bool MapNode::HasKey(std::string_view key) const noexcept
    {
        return m_children.find(key) != m_children.end();
    }

    NodeExpected<NodeMap> MapNode::AsMap() const
    {
        return NodeExpected<NodeMap>(m_children);
    }

    // ArrayNode

    Node ArrayNode::ByIndex(Int64 index) const
    {
        if (index < 0 || static_cast<UInt64>(index) >= m_children.size())
            return Node::FromError(Error::IndexOutOfRange(index));
        return m_children[static_cast<UIntSize>(index)];
    }

    NodeExpected<NodeArray> ArrayNode::AsArray() const
    {
        return NodeExpected<NodeArray>(m_children);
    }

    // ScalarNode

    NodeKind ScalarNode::Kind() const noexcept
    {
        switch (m_value.index())
        {
            case 0: return NodeKind::Number;
            case 1: return NodeKind::Boolean;
            default: return NodeKind::String;
        }
    }

    NodeExpected<Int> ScalarNode::AsInt() const
    {
        if (const F64* number = std::get_if<F64>(&m_value))
            return TruncateToInteger<Int>(*number, "Int");
        return NodeBase::AsInt();
    }

    NodeExpected<Int64> ScalarNode::AsInt64() const
    {
        if (const F64* number = std::get_if<F64>(&m_value))
            return TruncateToInteger<Int64>(*number, "Int64");
        return NodeBase::AsInt64();
    }

    NodeExpected<F64> ScalarNode::AsFloat64() const
    {
        if (const F64* number = std::get_if<F64>(&m_value))
            return NodeExpected<F64>(*number);
        return NodeBase::AsFloat64();
    }

    NodeExpected<bool> ScalarNode::AsBool() const
    {
        if (const bool* boolean = std::get_if<bool>(&m_value))
            return NodeExpected<bool>(*boolean);
        return NodeBase::AsBool();
    }

    NodeExpected<std::string> ScalarNode::AsString() const
    {
        if (const std::string* string = std::get_if<std::string>(&m_value))
            return NodeExpected<std::string>(*string);
        return NodeBase::AsString();
    }

    NodeExpected<std::string_view> ScalarNode::AsStringView() const
    {
        if (const std::string* string = std::get_if<std::string>(&m_value))
            return NodeExpected<std::string_view>(std::string_view {*string});
        return NodeBase::AsStringView();
    }

    // ErrorNode

    Node ErrorNode::ByKey(std::string_view) const
    {
        return Node(shared_from_this());
    }

    Node ErrorNode::ByIndex(Int64) const
    {
        return Node(shared_from_this());
    }

    NodeExpected<NodeMap> ErrorNode::AsMap() const { return Propagate<NodeMap>(); }
    NodeExpected<NodeArray> ErrorNode::AsArray() const { return Propagate<NodeArray>(); }
    NodeExpected<Int> ErrorNode::AsInt() const { return Propagate<Int>(); }
    NodeExpected<Int64> ErrorNode::AsInt64() const { return Propagate<Int64>(); }
    NodeExpected<F64> ErrorNode::AsFloat64() const { return Propagate<F64>(); }
    NodeExpected<bool> ErrorNode::AsBool() const { return Propagate<bool>(); }
    NodeExpected<std::string> ErrorNode::AsString() const { return Propagate<std::string>(); }
    NodeExpected<std::string_view> ErrorNode::AsStringView() const { return Propagate<std::string_view>(); }
}// namespace JNAV::Navigation::detail

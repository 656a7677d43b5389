#include "Nodes.hpp"

#include <JNAV/Navigation/NodeBuilder.hpp>
#include <JNAV/Sync/LockGuard.hpp>

namespace JNAV::Navigation::detail
{
    namespace
    {
        [[nodiscard]] Node BuildChild(const std::shared_ptr<const JNAV::Serialization::JsonDocument>& document,
                                      const JNAV::Serialization::JsonValue&                           value)
        {
            auto result = NodeBuilder::BuildLazy(document, value);
            if (!result.HasValue())
                return Node::FromError(std::move(result).ErrorUnsafe());
            return std::move(result).ValueUnsafe();
        }
    }// namespace

    // LazyMapNode

    Node LazyMapNode::ByKey(std::string_view key) const
    {
        const JNAV::Serialization::JsonValue* value = m_object->Find(key);
        if (!value)
            return Node::FromError(Error::KeyNotFound(key));
        return ChildFor(key, *value);
    }

    Node LazyMapNode::ChildFor(std::string_view key, const JNAV::Serialization::JsonValue& value) const
    {
        JNAV::Sync::LockGuard<JNAV::Sync::SpinLock> guard(m_lock);

        const auto it = m_cache.find(key);
        if (it != m_cache.end())
            return it->second;

        Node child = BuildChild(m_document, value);
        m_cache.emplace(std::string(key), child);
        return child;
    }

    NodeExpected<NodeMap> LazyMapNode::AsMap() const
    {
        NodeMap children;
        for (const auto& member : m_object->Members())
        {
            Node child = ChildFor(member.name, member.value);
            if (child.IsError())
                return NodeExpected<NodeMap>(JNAV::Utilities::Unexpected<Error>(child.GetError()));
            children.emplace(member.name, std::move(child));
        }
        return NodeExpected<NodeMap>(std::move(children));
    }

    // LazyArrayNode

    Node LazyArrayNode::ByIndex(Int64 index) const
    {
        if (index < 0 || static_cast<UInt64>(index) >= m_array->Size())
            return Node::FromError(Error::IndexOutOfRange(index));
        return ChildAt(static_cast<UIntSize>(index));
    }

    Node LazyArrayNode::ChildAt(UIntSize index) const
    {
        JNAV::Sync::LockGuard<JNAV::Sync::SpinLock> guard(m_lock);

        const auto it = m_cache.find(index);
        if (it != m_cache.end())
            return it->second;

        Node child = BuildChild(m_document, m_array->values[index]);
        m_cache.emplace(index, child);
        return child;
    }

    NodeExpected<NodeArray> LazyArrayNode::AsArray() const
    {
        NodeArray children;
        children.reserve(m_array->Size());
        for (UIntSize i = 0; i < m_array->Size(); ++i)
        {
            Node child = ChildAt(i);
            if (child.IsError())
                return NodeExpected<NodeArray>(JNAV::Utilities::Unexpected<Error>(child.GetError()));
            children.push_back(std::move(child));
        }
        return NodeExpected<NodeArray>(std::move(children));
    }
}// namespace JNAV::Navigation::detail

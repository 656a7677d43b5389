#include <JNAV/Navigation/Node.hpp>

#include <JNAV/Navigation/INode.hpp>

#include "Nodes.hpp"

namespace JNAV::Navigation
{
    std::string_view ToString(NodeKind kind) noexcept
    {
        switch (kind)
        {
            case NodeKind::Map: return "Map";
            case NodeKind::Array: return "Array";
            case NodeKind::Number: return "Number";
            case NodeKind::Boolean: return "Boolean";
            case NodeKind::String: return "String";
            case NodeKind::Error: return "Error";
        }
        Unreachable();
    }

    Node::Node(std::shared_ptr<const INode> impl) noexcept
        : m_impl(std::move(impl))
    {
    }

    Node Node::FromError(Error error)
    {
        return Node(std::make_shared<detail::ErrorNode>(std::move(error)));
    }

    Node Node::ByKey(std::string_view key) const
    {
        return m_impl->ByKey(key);
    }

    Node Node::ByIndex(Int64 index) const
    {
        return m_impl->ByIndex(index);
    }

    Node Node::At(std::span<const PathSegment> path) const
    {
        Node current = *this;
        for (const auto& segment : path)
        {
            if (current.IsError())
                break;
            current = segment.IsKey() ? current.ByKey(segment.Key()) : current.ByIndex(segment.Index());
        }
        return current;
    }

    Node Node::At(std::initializer_list<PathSegment> path) const
    {
        return At(std::span<const PathSegment> {path.begin(), path.size()});
    }

    NodeKind Node::Kind() const noexcept { return m_impl->Kind(); }

    bool Node::IsMap() const noexcept { return m_impl->IsMap(); }
    bool Node::IsArray() const noexcept { return m_impl->IsArray(); }
    bool Node::IsNumber() const noexcept { return m_impl->IsNumber(); }
    bool Node::IsBoolean() const noexcept { return m_impl->IsBoolean(); }
    bool Node::IsString() const noexcept { return m_impl->IsString(); }
    bool Node::IsError() const noexcept { return m_impl->IsError(); }

    const Error& Node::GetError() const noexcept
    {
        static const Error kNoError {};
        const Error*       captured = m_impl->CapturedError();
        return captured ? *captured : kNoError;
    }

    UIntSize Node::Size() const noexcept { return m_impl->Size(); }

    bool Node::HasKey(std::string_view key) const noexcept { return m_impl->HasKey(key); }

    NodeExpected<NodeMap> Node::AsMap() const { return m_impl->AsMap(); }
    NodeExpected<NodeArray> Node::AsArray() const { return m_impl->AsArray(); }
    NodeExpected<Int> Node::AsInt() const { return m_impl->AsInt(); }
    NodeExpected<Int64> Node::AsInt64() const { return m_impl->AsInt64(); }
    NodeExpected<F64> Node::AsFloat64() const { return m_impl->AsFloat64(); }
    NodeExpected<bool> Node::AsBool() const { return m_impl->AsBool(); }
    NodeExpected<std::string> Node::AsString() const { return m_impl->AsString(); }
    NodeExpected<std::string_view> Node::AsStringView() const { return m_impl->AsStringView(); }
}// namespace JNAV::Navigation

#include <JNAV/Navigation/NodeBuilder.hpp>

#include "Nodes.hpp"

namespace JNAV::Navigation
{
    using JNAV::Serialization::JsonDocument;
    using JNAV::Serialization::JsonValue;

    namespace
    {
        template<class TNode, class... Args>
        [[nodiscard]] NodeExpected<Node> Make(Args&&... args)
        {
            return NodeExpected<Node>(Node(std::make_shared<TNode>(std::forward<Args>(args)...)));
        }

        [[nodiscard]] NodeExpected<Node> Unsupported()
        {
            return NodeExpected<Node>(JNAV::Utilities::Unexpected<Error>(Error::UnsupportedType()));
        }

        /// Scalars are built identically in both modes.
        [[nodiscard]] NodeExpected<Node> BuildScalar(const JsonValue& value)
        {
            switch (value.GetType())
            {
                case JsonValue::Type::Number: return Make<detail::ScalarNode>(value.AsNumber());
                case JsonValue::Type::Bool: return Make<detail::ScalarNode>(value.AsBool());
                case JsonValue::Type::String: return Make<detail::ScalarNode>(std::string(value.AsString()));
                default: return Unsupported();
            }
        }
    }// namespace

    NodeExpected<Node> NodeBuilder::Build(const JsonValue& value)
    {
        switch (value.GetType())
        {
            case JsonValue::Type::Object: {
                NodeMap children;
                for (const auto& member : value.AsObject().Members())
                {
                    auto child = Build(member.value);
                    if (!child.HasValue())
                        return child;
                    children.insert_or_assign(member.name, std::move(child).ValueUnsafe());
                }
                return Make<detail::MapNode>(std::move(children));
            }
            case JsonValue::Type::Array: {
                NodeArray children;
                children.reserve(value.AsArray().Size());
                for (const auto& element : value.AsArray().values)
                {
                    auto child = Build(element);
                    if (!child.HasValue())
                        return child;
                    children.push_back(std::move(child).ValueUnsafe());
                }
                return Make<detail::ArrayNode>(std::move(children));
            }
            default:
                return BuildScalar(value);
        }
    }

    NodeExpected<Node> NodeBuilder::BuildLazy(std::shared_ptr<const JsonDocument> document, const JsonValue& value)
    {
        switch (value.GetType())
        {
            case JsonValue::Type::Object:
                return Make<detail::LazyMapNode>(std::move(document), value.AsObject());
            case JsonValue::Type::Array:
                return Make<detail::LazyArrayNode>(std::move(document), value.AsArray());
            default:
                return BuildScalar(value);
        }
    }

    NodeExpected<Node> NodeBuilder::BuildLazy(std::shared_ptr<const JsonDocument> document)
    {
        const JsonValue& root = document->Root();
        return BuildLazy(std::move(document), root);
    }
}// namespace JNAV::Navigation

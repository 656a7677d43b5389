#include <JNAV/Navigation/Document.hpp>

#include <JNAV/Navigation/NodeBuilder.hpp>

#include <memory>

namespace JNAV::Navigation
{
    namespace
    {
        constexpr bool IsAsciiSpace(char c) noexcept
        {
            return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
        }

        std::string_view Trim(std::string_view input) noexcept
        {
            while (!input.empty() && IsAsciiSpace(input.front()))
                input.remove_prefix(1);
            while (!input.empty() && IsAsciiSpace(input.back()))
                input.remove_suffix(1);
            return input;
        }

        [[nodiscard]] NodeExpected<Node> Failure(Error error)
        {
            return NodeExpected<Node>(JNAV::Utilities::Unexpected<Error>(std::move(error)));
        }
    }// namespace

    NodeExpected<Node> Document::Parse(std::string_view input, const NavigationOptions& options)
    {
        const std::string_view text = Trim(input);
        if (text.empty() || (text.front() != '{' && text.front() != '['))
            return Failure(Error::Format());

        auto decoded = JNAV::Serialization::JsonParser::Parse(text, options.parse);
        if (!decoded.HasValue())
            return Failure(Error::Decode(std::move(decoded).ErrorUnsafe()));

        if (options.construction == Construction::Eager)
            return NodeBuilder::Build(decoded.ValueUnsafe().Root());

        auto document = std::make_shared<const JNAV::Serialization::JsonDocument>(std::move(decoded).ValueUnsafe());
        return NodeBuilder::BuildLazy(std::move(document));
    }

    NodeExpected<Node> Document::Parse(std::span<const JNAV::Byte> input, const NavigationOptions& options)
    {
        const std::string_view text {reinterpret_cast<const char*>(input.data()), input.size()};
        return Parse(text, options);
    }
}// namespace JNAV::Navigation

/// @file Document.hpp
/// @brief Entry point: parse JSON text into a navigable root node.
#pragma once

#include <JNAV/Defines.hpp>
#include <JNAV/Navigation/Error.hpp>
#include <JNAV/Navigation/Node.hpp>
#include <JNAV/Primitives.hpp>
#include <JNAV/Serialization/JSON/JsonParser.hpp>

#include <span>
#include <string_view>

namespace JNAV::Navigation
{
    /// @brief How the node tree is built from the decoded document.
    enum class Construction : UInt8
    {
        /// Build every node before `Parse` returns. `null` anywhere fails the parse.
        Eager,
        /// Build the root only; children are built and cached on first visit.
        Lazy,
    };

    struct NavigationOptions
    {
        Construction                          construction {Construction::Eager};
        JNAV::Serialization::JsonParseOptions parse {};
    };

    /// @brief Parses a JSON object or array into a root node.
    ///
    /// Leading and trailing ASCII whitespace is ignored. The first remaining byte must be `{` or
    /// `[`; otherwise the input is rejected with a Format error before decoding. Decoder failures
    /// are reported as Decode errors carrying the decoder's `ParseError`.
    class JNAV_API Document
    {
    public:
        [[nodiscard]] static NodeExpected<Node> Parse(std::string_view input, const NavigationOptions& options = {});
        [[nodiscard]] static NodeExpected<Node> Parse(std::span<const JNAV::Byte> input, const NavigationOptions& options = {});
    };
}// namespace JNAV::Navigation

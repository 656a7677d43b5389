/// @file NodeBuilder.hpp
/// @brief Eager and lazy conversion of decoded `JsonValue`s into nodes.
#pragma once

#include <JNAV/Defines.hpp>
#include <JNAV/Navigation/Error.hpp>
#include <JNAV/Navigation/Node.hpp>
#include <JNAV/Serialization/JSON/JsonTypes.hpp>

#include <memory>

namespace JNAV::Navigation
{
    /// @brief Converts decoded `JsonValue`s into navigable nodes.
    ///
    /// Objects become Map nodes, arrays Array nodes, numbers/booleans/strings Scalar nodes.
    /// `null` has no node variant and fails with `ErrorCode::UnsupportedType`.
    class JNAV_API NodeBuilder
    {
    public:
        /// @brief Builds the whole tree below `value` in one pass.
        ///
        /// The first unsupported value anywhere in the tree fails the build; no partial tree is returned.
        /// The result does not reference `value` afterwards.
        static NodeExpected<Node> Build(const JNAV::Serialization::JsonValue& value);

        /// @brief Builds only the node for `value`; container children are built on first visit.
        ///
        /// `value` must be owned by `document`. The returned node (and every child built from it)
        /// shares ownership of `document`.
        static NodeExpected<Node> BuildLazy(std::shared_ptr<const JNAV::Serialization::JsonDocument> document,
                                            const JNAV::Serialization::JsonValue&                    value);

        /// @brief Lazy build of the document root.
        static NodeExpected<Node> BuildLazy(std::shared_ptr<const JNAV::Serialization::JsonDocument> document);
    };
}// namespace JNAV::Navigation

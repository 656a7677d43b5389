#pragma once
#include <JNAV/Defines.hpp>
#include <JNAV/Navigation/Document.hpp>
#include <JNAV/Navigation/Error.hpp>
#include <JNAV/Navigation/Node.hpp>
#include <JNAV/Navigation/NodeBuilder.hpp>
#include <JNAV/Primitives.hpp>
#include <JNAV/Serialization/Core/InputCursor.hpp>
#include <JNAV/Serialization/Core/ParseError.hpp>
#include <JNAV/Serialization/JSON/JsonParser.hpp>
#include <JNAV/Serialization/JSON/JsonTypes.hpp>
#include <JNAV/Sync/Concepts.hpp>
#include <JNAV/Sync/LockGuard.hpp>
#include <JNAV/Sync/SpinLock.hpp>
#include <JNAV/Utilities/Expected.hpp>

#pragma once

#include "toolgov/core/types.hpp"

#include <string>

namespace toolgov::inspection {

using namespace toolgov::core;

// Normal form of a tool argument payload. Object keys are ordered, null is
// the empty object, and floats holding an exact integer become integers, so
// payloads that differ only in encoding compare equal.
Json canonicalize(const Json& value);

// Compact dump of canonicalize(value)
std::string canonical_encoding(const Json& value);

}  // namespace toolgov::inspection

#pragma once

#include "triple/runtime/result.hpp"
#include "triple/runtime/serialization/hessian.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace triple
{

/**
 * JSON objects with a "$class" member become hessian objects of that class,
 * {"$date": millis} a date and {"$bytes": [..]} a binary value. Any other
 * object is an untyped map with string keys.
 */
runtime::Result<runtime::hessian::Value> from_json(const nlohmann::json& node);

// An array is the argument list, anything else a single argument.
runtime::Result<std::vector<runtime::hessian::Value>> arguments_from_json(const nlohmann::json& node);

nlohmann::json to_json(const runtime::hessian::Value& value);

}  // namespace triple

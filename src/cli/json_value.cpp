#include "cli/json_value.hpp"

#include <limits>

namespace triple
{
namespace
{

using nlohmann::json;
namespace hessian = runtime::hessian;

runtime::Result<hessian::Value> bytes_from_json(const json& array)
{
    if (!array.is_array()) {
        return runtime::unexpected_result<hessian::Value>(runtime::ErrorCode::CodecError,
                                                          "\"$bytes\" must be an array of bytes");
    }
    hessian::Bytes bytes;
    for (const auto& item : array) {
        if (!item.is_number_unsigned() || item.get<std::uint64_t>() > 0xFF) {
            return runtime::unexpected_result<hessian::Value>(runtime::ErrorCode::CodecError,
                                                              "\"$bytes\" must be an array of bytes");
        }
        bytes.push_back(item.get<std::uint8_t>());
    }
    return hessian::Value{std::move(bytes)};
}

runtime::Result<hessian::Value> object_from_json(const json& object)
{
    if (auto it = object.find("$date"); it != object.end() && object.size() == 1) {
        if (!it->is_number_integer()) {
            return runtime::unexpected_result<hessian::Value>(runtime::ErrorCode::CodecError,
                                                              "\"$date\" must be milliseconds since the epoch");
        }
        return hessian::Value{hessian::Date{it->get<std::int64_t>()}};
    }
    if (auto it = object.find("$bytes"); it != object.end() && object.size() == 1) {
        return bytes_from_json(*it);
    }
    if (auto it = object.find("$class"); it != object.end()) {
        if (!it->is_string()) {
            return runtime::unexpected_result<hessian::Value>(runtime::ErrorCode::CodecError,
                                                              "\"$class\" must be a string");
        }
        hessian::Object result;
        result.class_name = it->get<std::string>();
        for (const auto& [key, item] : object.items()) {
            if (key == "$class") {
                continue;
            }
            auto value = from_json(item);
            if (!value) {
                return value;
            }
            result.set(key, std::move(*value));
        }
        return hessian::Value{std::move(result)};
    }

    hessian::Map result;
    for (const auto& [key, item] : object.items()) {
        auto value = from_json(item);
        if (!value) {
            return value;
        }
        result.entries.emplace_back(hessian::Value{key}, std::move(*value));
    }
    return hessian::Value{std::move(result)};
}

hessian::Value integer_value(std::int64_t value)
{
    if (value >= std::numeric_limits<std::int32_t>::min() && value <= std::numeric_limits<std::int32_t>::max()) {
        return hessian::Value{static_cast<std::int32_t>(value)};
    }
    return hessian::Value{value};
}

struct JsonVisitor : boost::static_visitor<json> {
    json operator()(const hessian::Null&) const
    {
        return nullptr;
    }

    json operator()(bool value) const
    {
        return value;
    }

    json operator()(std::int32_t value) const
    {
        return value;
    }

    json operator()(std::int64_t value) const
    {
        return value;
    }

    json operator()(double value) const
    {
        return value;
    }

    json operator()(const std::string& value) const
    {
        return value;
    }

    json operator()(const hessian::Bytes& value) const
    {
        json bytes = json::array();
        for (auto byte : value) {
            bytes.push_back(byte);
        }
        return json{{"$bytes", std::move(bytes)}};
    }

    json operator()(const hessian::Date& value) const
    {
        return json{{"$date", value.millis}};
    }

    json operator()(const hessian::List& value) const
    {
        json items = json::array();
        for (const auto& item : value.items) {
            items.push_back(boost::apply_visitor(*this, item));
        }
        return items;
    }

    json operator()(const hessian::Map& value) const
    {
        bool string_keys = true;
        for (const auto& [key, item] : value.entries) {
            string_keys = string_keys && boost::get<std::string>(&key) != nullptr;
        }
        if (string_keys) {
            json object = json::object();
            for (const auto& [key, item] : value.entries) {
                object[boost::get<std::string>(key)] = boost::apply_visitor(*this, item);
            }
            return object;
        }
        // [[key, value], ...] when keys are not all strings
        json pairs = json::array();
        for (const auto& [key, item] : value.entries) {
            pairs.push_back(json::array({boost::apply_visitor(*this, key), boost::apply_visitor(*this, item)}));
        }
        return pairs;
    }

    json operator()(const hessian::Object& value) const
    {
        json object = json::object();
        object["$class"] = value.class_name;
        for (const auto& [name, item] : value.fields) {
            object[name] = boost::apply_visitor(*this, item);
        }
        return object;
    }
};

}  // namespace

runtime::Result<hessian::Value> from_json(const json& node)
{
    switch (node.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            return hessian::Value{hessian::Null{}};
        case json::value_t::boolean:
            return hessian::Value{node.get<bool>()};
        case json::value_t::number_integer:
            return integer_value(node.get<std::int64_t>());
        case json::value_t::number_unsigned: {
            auto value = node.get<std::uint64_t>();
            if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return runtime::unexpected_result<hessian::Value>(runtime::ErrorCode::CodecError,
                                                                  "integer does not fit a long");
            }
            return integer_value(static_cast<std::int64_t>(value));
        }
        case json::value_t::number_float:
            return hessian::Value{node.get<double>()};
        case json::value_t::string:
            return hessian::Value{node.get<std::string>()};
        case json::value_t::binary: {
            const auto& binary = node.get_binary();
            return hessian::Value{hessian::Bytes(binary.begin(), binary.end())};
        }
        case json::value_t::array: {
            hessian::List list;
            for (const auto& item : node) {
                auto value = from_json(item);
                if (!value) {
                    return value;
                }
                list.items.push_back(std::move(*value));
            }
            return hessian::Value{std::move(list)};
        }
        case json::value_t::object:
            return object_from_json(node);
    }
    return runtime::unexpected_result<hessian::Value>(runtime::ErrorCode::CodecError, "unsupported JSON value");
}

runtime::Result<std::vector<hessian::Value>> arguments_from_json(const json& node)
{
    std::vector<hessian::Value> arguments;
    if (!node.is_array()) {
        auto value = from_json(node);
        if (!value) {
            return std::unexpected(value.error());
        }
        arguments.push_back(std::move(*value));
        return arguments;
    }
    for (const auto& item : node) {
        auto value = from_json(item);
        if (!value) {
            return std::unexpected(value.error());
        }
        arguments.push_back(std::move(*value));
    }
    return arguments;
}

json to_json(const hessian::Value& value)
{
    JsonVisitor visitor;
    return boost::apply_visitor(visitor, value);
}

}  // namespace triple

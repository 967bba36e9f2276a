#pragma once

#include "triple/runtime/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace triple::runtime::wrapper
{

// Envelope carrying object-graph arguments inside a schema-encoded message.
struct RequestWrapper {
    std::string serialize_type;
    std::vector<std::vector<std::uint8_t>> args;
    std::vector<std::string> arg_types;
};

struct ResponseWrapper {
    std::string serialize_type;
    std::vector<std::uint8_t> data;
    std::string type;
};

Result<std::vector<std::uint8_t>> encode(const RequestWrapper& request);
Result<std::vector<std::uint8_t>> encode(const ResponseWrapper& response);

Result<RequestWrapper> decode_request(std::span<const std::uint8_t> bytes);
Result<ResponseWrapper> decode_response(std::span<const std::uint8_t> bytes);

}  // namespace triple::runtime::wrapper

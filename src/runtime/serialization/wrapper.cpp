#include "triple/runtime/serialization/wrapper.hpp"

#include "triple_wrapper.pb.h"

#include <string>

namespace triple::runtime::wrapper
{
namespace
{

template <typename Proto>
Result<std::vector<std::uint8_t>> serialize(const Proto& proto)
{
    std::string bytes;
    if (!proto.SerializeToString(&bytes)) {
        return unexpected_result<std::vector<std::uint8_t>>(ErrorCode::CodecError,
                                                            "failed to serialize " + proto.GetTypeName());
    }
    return std::vector<std::uint8_t>(bytes.begin(), bytes.end());
}

template <typename Proto>
Result<Proto> parse(std::span<const std::uint8_t> bytes)
{
    Proto proto;
    if (!proto.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return unexpected_result<Proto>(ErrorCode::CodecError, "failed to parse " + proto.GetTypeName());
    }
    return proto;
}

}  // namespace

Result<std::vector<std::uint8_t>> encode(const RequestWrapper& request)
{
    if (request.args.size() != request.arg_types.size()) {
        return unexpected_result<std::vector<std::uint8_t>>(ErrorCode::CodecError,
                                                            "argument and argument type counts differ");
    }
    pb::TripleRequestWrapper proto;
    proto.set_serializetype(request.serialize_type);
    for (const auto& arg : request.args) {
        proto.add_args(arg.data(), arg.size());
    }
    for (const auto& type : request.arg_types) {
        proto.add_argtypes(type);
    }
    return serialize(proto);
}

Result<std::vector<std::uint8_t>> encode(const ResponseWrapper& response)
{
    pb::TripleResponseWrapper proto;
    proto.set_serializetype(response.serialize_type);
    proto.set_data(response.data.data(), response.data.size());
    proto.set_type(response.type);
    return serialize(proto);
}

Result<RequestWrapper> decode_request(std::span<const std::uint8_t> bytes)
{
    auto proto = parse<pb::TripleRequestWrapper>(bytes);
    if (!proto) {
        return std::unexpected(proto.error());
    }
    RequestWrapper out;
    out.serialize_type = proto->serializetype();
    for (const auto& arg : proto->args()) {
        out.args.emplace_back(arg.begin(), arg.end());
    }
    out.arg_types.assign(proto->argtypes().begin(), proto->argtypes().end());
    return out;
}

Result<ResponseWrapper> decode_response(std::span<const std::uint8_t> bytes)
{
    auto proto = parse<pb::TripleResponseWrapper>(bytes);
    if (!proto) {
        return std::unexpected(proto.error());
    }
    ResponseWrapper out;
    out.serialize_type = proto->serializetype();
    out.data.assign(proto->data().begin(), proto->data().end());
    out.type = proto->type();
    return out;
}

}  // namespace triple::runtime::wrapper

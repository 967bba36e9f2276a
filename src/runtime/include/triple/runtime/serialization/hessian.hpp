#pragma once

#include "triple/runtime/result.hpp"

#include <boost/variant.hpp>
#include <boost/variant/recursive_wrapper.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace triple::runtime::hessian
{

struct Null {
};

inline bool operator==(const Null&, const Null&)
{
    return true;
}

using Bytes = std::vector<std::uint8_t>;

// Milliseconds since the epoch, UTC.
struct Date {
    std::int64_t millis = 0;
};

inline bool operator==(const Date& lhs, const Date& rhs)
{
    return lhs.millis == rhs.millis;
}

struct List;
struct Map;
struct Object;

// clang-format off
using Value = boost::variant<
    Null,
    bool,
    std::int32_t,
    std::int64_t,
    double,
    std::string,
    Bytes,
    Date,
    boost::recursive_wrapper<List>,
    boost::recursive_wrapper<Map>,
    boost::recursive_wrapper<Object>
>;
// clang-format on

// An empty `type` is an untyped list.
struct List {
    std::string type;
    std::vector<Value> items;
};

struct Map {
    std::string type;
    std::vector<std::pair<Value, Value>> entries;

    const Value* find(const Value& key) const;
};

// Field order follows the class definition.
struct Object {
    std::string class_name;
    std::vector<std::pair<std::string, Value>> fields;

    const Value* field(const std::string& name) const;
    void set(std::string name, Value value);
};

bool operator==(const List& lhs, const List& rhs);
bool operator==(const Map& lhs, const Map& rhs);
bool operator==(const Object& lhs, const Object& rhs);

/**
 * @brief Hessian 2.0 writer.
 *
 * Class definitions and list/map type names are emitted once per encoder and
 * referenced by index afterwards. Values form a tree, so no `Q` back-references
 * are produced.
 */
class Encoder
{
public:
    explicit Encoder(std::vector<std::uint8_t>& out);

    Result<void> write(const Value& value);

    void write_null();
    void write_bool(bool value);
    void write_int(std::int32_t value);
    void write_long(std::int64_t value);
    void write_double(double value);
    void write_date(std::int64_t millis);
    Result<void> write_string(const std::string& value);
    void write_binary(std::span<const std::uint8_t> value);
    Result<void> write_list(const List& list);
    Result<void> write_map(const Map& map);
    Result<void> write_object(const Object& object);

private:
    Result<void> write_type(const std::string& type);
    void put(std::uint8_t byte);
    void put_be(std::uint64_t value, int bytes);

    std::vector<std::uint8_t>& out_;
    std::map<std::string, std::size_t> types_;
    std::map<std::string, std::size_t> classes_;
};

class Decoder
{
public:
    explicit Decoder(std::span<const std::uint8_t> data);

    Result<Value> read();
    bool at_end() const { return offset_ >= data_.size(); }

private:
    struct ClassDef {
        std::string name;
        std::vector<std::string> fields;
    };

    Result<Value> read_value(std::uint8_t tag);
    Result<std::uint8_t> next_byte();
    Result<std::uint64_t> read_be(int bytes);
    Result<std::int32_t> read_int();
    Result<std::string> read_string_value();
    Result<std::string> read_string_chunks(std::uint8_t tag);
    Result<void> read_utf16_units(std::size_t units, std::string& out);
    Result<Bytes> read_binary_chunks(std::uint8_t tag);
    Result<std::string> read_type();
    Result<Value> read_list(std::optional<std::string> type, std::optional<std::size_t> length);
    Result<Value> read_map(std::string type);
    Result<void> read_class_def();
    Result<Value> read_object(std::size_t def_index);
    Result<Value> read_ref();

    std::size_t reserve_ref();

    std::span<const std::uint8_t> data_;
    std::size_t offset_ = 0;
    std::size_t depth_ = 0;
    std::vector<std::string> types_;
    std::vector<ClassDef> classes_;
    // Filled once the referenced list/map/object has been fully decoded.
    std::vector<std::optional<Value>> refs_;
};

Result<std::vector<std::uint8_t>> encode(const Value& value);

// Decodes exactly one value; trailing bytes are an error.
Result<Value> decode(std::span<const std::uint8_t> data);

// Java type name advertised for an argument in the request wrapper.
std::string java_type_name(const Value& value);

std::string kind_name(const Value& value);

}  // namespace triple::runtime::hessian

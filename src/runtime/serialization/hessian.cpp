#include "triple/runtime/serialization/hessian.hpp"

#include <bit>
#include <cmath>
#include <limits>

namespace triple::runtime::hessian
{
namespace
{

constexpr std::size_t kMaxDepth = 512;
constexpr std::size_t kStringChunkUnits = 0x8000;
constexpr std::size_t kBinaryChunkBytes = 0x8000;

bool is_string_tag(std::uint8_t tag)
{
    return tag <= 0x1F || (tag >= 0x30 && tag <= 0x33) || tag == 'R' || tag == 'S';
}

bool is_binary_tag(std::uint8_t tag)
{
    return (tag >= 0x20 && tag <= 0x2F) || (tag >= 0x34 && tag <= 0x37) || tag == 'A' || tag == 'B';
}

void append_utf8(std::string& out, std::uint32_t cp)
{
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// One UTF-8 encoded code point of the source string and its UTF-16 width.
struct CodePoint {
    std::size_t offset;
    std::size_t size;
    std::size_t units;
};

Result<std::vector<CodePoint>> split_utf8(const std::string& text)
{
    std::vector<CodePoint> points;
    points.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<std::uint8_t>(text[i]);
        std::size_t size = 0;
        if (lead < 0x80) {
            size = 1;
        } else if ((lead & 0xE0) == 0xC0) {
            size = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            size = 3;
        } else if ((lead & 0xF8) == 0xF0) {
            size = 4;
        } else {
            return unexpected_result<std::vector<CodePoint>>(ErrorCode::CodecError, "invalid UTF-8 in string");
        }
        if (i + size > text.size()) {
            return unexpected_result<std::vector<CodePoint>>(ErrorCode::CodecError, "truncated UTF-8 in string");
        }
        for (std::size_t k = 1; k < size; ++k) {
            if ((static_cast<std::uint8_t>(text[i + k]) & 0xC0) != 0x80) {
                return unexpected_result<std::vector<CodePoint>>(ErrorCode::CodecError, "invalid UTF-8 in string");
            }
        }
        points.push_back(CodePoint{i, size, size == 4 ? 2U : 1U});
        i += size;
    }
    return points;
}

struct WriteVisitor : boost::static_visitor<Result<void>> {
    explicit WriteVisitor(Encoder& encoder)
        : encoder(encoder)
    {
    }

    Result<void> operator()(const Null&) const
    {
        encoder.write_null();
        return {};
    }
    Result<void> operator()(bool value) const
    {
        encoder.write_bool(value);
        return {};
    }
    Result<void> operator()(std::int32_t value) const
    {
        encoder.write_int(value);
        return {};
    }
    Result<void> operator()(std::int64_t value) const
    {
        encoder.write_long(value);
        return {};
    }
    Result<void> operator()(double value) const
    {
        encoder.write_double(value);
        return {};
    }
    Result<void> operator()(const std::string& value) const { return encoder.write_string(value); }
    Result<void> operator()(const Bytes& value) const
    {
        encoder.write_binary(value);
        return {};
    }
    Result<void> operator()(const Date& value) const
    {
        encoder.write_date(value.millis);
        return {};
    }
    Result<void> operator()(const List& value) const { return encoder.write_list(value); }
    Result<void> operator()(const Map& value) const { return encoder.write_map(value); }
    Result<void> operator()(const Object& value) const { return encoder.write_object(value); }

    Encoder& encoder;
};

}  // namespace

const Value* Map::find(const Value& key) const
{
    for (const auto& [k, v] : entries) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

const Value* Object::field(const std::string& name) const
{
    for (const auto& [k, v] : fields) {
        if (k == name) {
            return &v;
        }
    }
    return nullptr;
}

void Object::set(std::string name, Value value)
{
    for (auto& [k, v] : fields) {
        if (k == name) {
            v = std::move(value);
            return;
        }
    }
    fields.emplace_back(std::move(name), std::move(value));
}

bool operator==(const List& lhs, const List& rhs)
{
    return lhs.type == rhs.type && lhs.items == rhs.items;
}

bool operator==(const Map& lhs, const Map& rhs)
{
    return lhs.type == rhs.type && lhs.entries == rhs.entries;
}

bool operator==(const Object& lhs, const Object& rhs)
{
    return lhs.class_name == rhs.class_name && lhs.fields == rhs.fields;
}

// ---------- encoder ----------

Encoder::Encoder(std::vector<std::uint8_t>& out)
    : out_(out)
{
}

void Encoder::put(std::uint8_t byte)
{
    out_.push_back(byte);
}

void Encoder::put_be(std::uint64_t value, int bytes)
{
    for (int i = bytes - 1; i >= 0; --i) {
        out_.push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

Result<void> Encoder::write(const Value& value)
{
    return boost::apply_visitor(WriteVisitor(*this), value);
}

void Encoder::write_null()
{
    put('N');
}

void Encoder::write_bool(bool value)
{
    put(value ? 'T' : 'F');
}

void Encoder::write_int(std::int32_t value)
{
    if (value >= -16 && value <= 47) {
        put(static_cast<std::uint8_t>(0x90 + value));
    } else if (value >= -2048 && value <= 2047) {
        put(static_cast<std::uint8_t>(0xC8 + (value >> 8)));
        put(static_cast<std::uint8_t>(value & 0xFF));
    } else if (value >= -262144 && value <= 262143) {
        put(static_cast<std::uint8_t>(0xD4 + (value >> 16)));
        put_be(static_cast<std::uint32_t>(value), 2);
    } else {
        put('I');
        put_be(static_cast<std::uint32_t>(value), 4);
    }
}

void Encoder::write_long(std::int64_t value)
{
    if (value >= -8 && value <= 15) {
        put(static_cast<std::uint8_t>(0xE0 + value));
    } else if (value >= -2048 && value <= 2047) {
        put(static_cast<std::uint8_t>(0xF8 + (value >> 8)));
        put(static_cast<std::uint8_t>(value & 0xFF));
    } else if (value >= -262144 && value <= 262143) {
        put(static_cast<std::uint8_t>(0x3C + (value >> 16)));
        put_be(static_cast<std::uint64_t>(value), 2);
    } else if (value >= std::numeric_limits<std::int32_t>::min() && value <= std::numeric_limits<std::int32_t>::max()) {
        put(0x59);
        put_be(static_cast<std::uint64_t>(value), 4);
    } else {
        put('L');
        put_be(static_cast<std::uint64_t>(value), 8);
    }
}

void Encoder::write_double(double value)
{
    if (value == 0.0 && !std::signbit(value)) {
        put(0x5B);
        return;
    }
    if (value == 1.0) {
        put(0x5C);
        return;
    }
    // -0.0 falls through to the full form to keep its sign.
    if (value != 0.0 && std::isfinite(value) && std::trunc(value) == value) {
        if (value >= -128.0 && value <= 127.0) {
            put(0x5D);
            put(static_cast<std::uint8_t>(static_cast<std::int8_t>(value)));
            return;
        }
        if (value >= -32768.0 && value <= 32767.0) {
            put(0x5E);
            put_be(static_cast<std::uint16_t>(static_cast<std::int16_t>(value)), 2);
            return;
        }
    }
    put('D');
    put_be(std::bit_cast<std::uint64_t>(value), 8);
}

void Encoder::write_date(std::int64_t millis)
{
    if (millis % 60000 == 0) {
        auto minutes = millis / 60000;
        if (minutes >= std::numeric_limits<std::int32_t>::min() && minutes <= std::numeric_limits<std::int32_t>::max()) {
            put(0x4B);
            put_be(static_cast<std::uint64_t>(minutes), 4);
            return;
        }
    }
    put(0x4A);
    put_be(static_cast<std::uint64_t>(millis), 8);
}

Result<void> Encoder::write_string(const std::string& value)
{
    auto points = split_utf8(value);
    if (!points) {
        return std::unexpected(points.error());
    }

    std::size_t units = 0;
    for (const auto& p : *points) {
        units += p.units;
    }

    auto append_range = [&](std::size_t first, std::size_t last) {
        if (first == last) {
            return;
        }
        auto begin = (*points)[first].offset;
        auto end = (*points)[last - 1].offset + (*points)[last - 1].size;
        out_.insert(out_.end(), value.begin() + static_cast<std::ptrdiff_t>(begin),
                    value.begin() + static_cast<std::ptrdiff_t>(end));
    };

    if (units <= 31) {
        put(static_cast<std::uint8_t>(units));
        append_range(0, points->size());
        return {};
    }
    if (units <= 1023) {
        put(static_cast<std::uint8_t>(0x30 + (units >> 8)));
        put(static_cast<std::uint8_t>(units & 0xFF));
        append_range(0, points->size());
        return {};
    }

    std::size_t index = 0;
    while (index < points->size()) {
        std::size_t first = index;
        std::size_t chunk_units = 0;
        while (index < points->size() && chunk_units + (*points)[index].units <= kStringChunkUnits) {
            chunk_units += (*points)[index].units;
            ++index;
        }
        put(index < points->size() ? 'R' : 'S');
        put_be(chunk_units, 2);
        append_range(first, index);
    }
    return {};
}

void Encoder::write_binary(std::span<const std::uint8_t> value)
{
    if (value.size() <= 15) {
        put(static_cast<std::uint8_t>(0x20 + value.size()));
        out_.insert(out_.end(), value.begin(), value.end());
        return;
    }
    if (value.size() <= 1023) {
        put(static_cast<std::uint8_t>(0x34 + (value.size() >> 8)));
        put(static_cast<std::uint8_t>(value.size() & 0xFF));
        out_.insert(out_.end(), value.begin(), value.end());
        return;
    }
    while (value.size() > kBinaryChunkBytes) {
        put('A');
        put_be(kBinaryChunkBytes, 2);
        out_.insert(out_.end(), value.begin(), value.begin() + kBinaryChunkBytes);
        value = value.subspan(kBinaryChunkBytes);
    }
    put('B');
    put_be(value.size(), 2);
    out_.insert(out_.end(), value.begin(), value.end());
}

Result<void> Encoder::write_type(const std::string& type)
{
    auto it = types_.find(type);
    if (it != types_.end()) {
        write_int(static_cast<std::int32_t>(it->second));
        return {};
    }
    auto index = types_.size();
    types_.emplace(type, index);
    return write_string(type);
}

Result<void> Encoder::write_list(const List& list)
{
    auto size = list.items.size();
    if (list.type.empty()) {
        if (size < 8) {
            put(static_cast<std::uint8_t>(0x78 + size));
        } else {
            put(0x58);
            write_int(static_cast<std::int32_t>(size));
        }
    } else {
        if (size < 8) {
            put(static_cast<std::uint8_t>(0x70 + size));
            if (auto res = write_type(list.type); !res) {
                return res;
            }
        } else {
            put('V');
            if (auto res = write_type(list.type); !res) {
                return res;
            }
            write_int(static_cast<std::int32_t>(size));
        }
    }
    for (const auto& item : list.items) {
        if (auto res = write(item); !res) {
            return res;
        }
    }
    return {};
}

Result<void> Encoder::write_map(const Map& map)
{
    if (map.type.empty()) {
        put('H');
    } else {
        put('M');
        if (auto res = write_type(map.type); !res) {
            return res;
        }
    }
    for (const auto& [key, value] : map.entries) {
        if (auto res = write(key); !res) {
            return res;
        }
        if (auto res = write(value); !res) {
            return res;
        }
    }
    put('Z');
    return {};
}

Result<void> Encoder::write_object(const Object& object)
{
    if (object.class_name.empty()) {
        return unexpected_result(ErrorCode::CodecError, "object without class name");
    }
    // Objects of one class share a definition, keyed by name and field layout.
    std::string key = object.class_name;
    for (const auto& [name, value] : object.fields) {
        key += '\0';
        key += name;
    }

    std::size_t index = 0;
    auto it = classes_.find(key);
    if (it == classes_.end()) {
        index = classes_.size();
        classes_.emplace(key, index);
        put('C');
        if (auto res = write_string(object.class_name); !res) {
            return res;
        }
        write_int(static_cast<std::int32_t>(object.fields.size()));
        for (const auto& [name, value] : object.fields) {
            if (auto res = write_string(name); !res) {
                return res;
            }
        }
    } else {
        index = it->second;
    }

    if (index < 16) {
        put(static_cast<std::uint8_t>(0x60 + index));
    } else {
        put('O');
        write_int(static_cast<std::int32_t>(index));
    }
    for (const auto& [name, value] : object.fields) {
        if (auto res = write(value); !res) {
            return res;
        }
    }
    return {};
}

// ---------- decoder ----------

Decoder::Decoder(std::span<const std::uint8_t> data)
    : data_(data)
{
}

Result<std::uint8_t> Decoder::next_byte()
{
    if (offset_ >= data_.size()) {
        return unexpected_result<std::uint8_t>(ErrorCode::CodecError, "unexpected end of hessian data");
    }
    return data_[offset_++];
}

Result<std::uint64_t> Decoder::read_be(int bytes)
{
    if (data_.size() - offset_ < static_cast<std::size_t>(bytes)) {
        return unexpected_result<std::uint64_t>(ErrorCode::CodecError, "unexpected end of hessian data");
    }
    std::uint64_t value = 0;
    for (int i = 0; i < bytes; ++i) {
        value = (value << 8) | data_[offset_++];
    }
    return value;
}

Result<Value> Decoder::read()
{
    if (depth_ >= kMaxDepth) {
        return unexpected_result<Value>(ErrorCode::CodecError, "hessian nesting too deep");
    }
    auto tag = next_byte();
    if (!tag) {
        return std::unexpected(tag.error());
    }
    ++depth_;
    auto value = read_value(*tag);
    --depth_;
    return value;
}

Result<std::int32_t> Decoder::read_int()
{
    auto tag = next_byte();
    if (!tag) {
        return std::unexpected(tag.error());
    }
    auto b = *tag;
    if (b >= 0x80 && b <= 0xBF) {
        return static_cast<std::int32_t>(b) - 0x90;
    }
    if (b >= 0xC0 && b <= 0xCF) {
        auto low = next_byte();
        if (!low) {
            return std::unexpected(low.error());
        }
        return (static_cast<std::int32_t>(b) - 0xC8) * 256 + *low;
    }
    if (b >= 0xD0 && b <= 0xD7) {
        auto low = read_be(2);
        if (!low) {
            return std::unexpected(low.error());
        }
        return (static_cast<std::int32_t>(b) - 0xD4) * 65536 + static_cast<std::int32_t>(*low);
    }
    if (b == 'I') {
        auto raw = read_be(4);
        if (!raw) {
            return std::unexpected(raw.error());
        }
        return static_cast<std::int32_t>(static_cast<std::uint32_t>(*raw));
    }
    return unexpected_result<std::int32_t>(ErrorCode::CodecError, "expected int, got tag " + std::to_string(b));
}

Result<void> Decoder::read_utf16_units(std::size_t units, std::string& out)
{
    auto continuation = [this](std::uint32_t& cp) -> Result<void> {
        auto b = next_byte();
        if (!b) {
            return std::unexpected(b.error());
        }
        if ((*b & 0xC0) != 0x80) {
            return unexpected_result(ErrorCode::CodecError, "invalid UTF-8 in hessian string");
        }
        cp = (cp << 6) | (*b & 0x3F);
        return {};
    };

    auto read_point = [&](std::uint32_t& cp, std::size_t& width) -> Result<void> {
        auto lead = next_byte();
        if (!lead) {
            return std::unexpected(lead.error());
        }
        std::size_t extra = 0;
        if (*lead < 0x80) {
            cp = *lead;
        } else if ((*lead & 0xE0) == 0xC0) {
            cp = *lead & 0x1F;
            extra = 1;
        } else if ((*lead & 0xF0) == 0xE0) {
            cp = *lead & 0x0F;
            extra = 2;
        } else if ((*lead & 0xF8) == 0xF0) {
            cp = *lead & 0x07;
            extra = 3;
        } else {
            return unexpected_result(ErrorCode::CodecError, "invalid UTF-8 in hessian string");
        }
        for (std::size_t k = 0; k < extra; ++k) {
            if (auto res = continuation(cp); !res) {
                return res;
            }
        }
        width = cp >= 0x10000 ? 2 : 1;
        return {};
    };

    while (units > 0) {
        std::uint32_t cp = 0;
        std::size_t width = 0;
        if (auto res = read_point(cp, width); !res) {
            return res;
        }
        if (width > units) {
            return unexpected_result(ErrorCode::CodecError, "string length mismatch");
        }
        units -= width;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            // Surrogate pairs written as two 3-byte sequences.
            if (units == 0) {
                return unexpected_result(ErrorCode::CodecError, "unpaired surrogate in hessian string");
            }
            std::uint32_t low = 0;
            if (auto res = read_point(low, width); !res) {
                return res;
            }
            if (low < 0xDC00 || low > 0xDFFF) {
                return unexpected_result(ErrorCode::CodecError, "unpaired surrogate in hessian string");
            }
            units -= 1;
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            return unexpected_result(ErrorCode::CodecError, "unpaired surrogate in hessian string");
        }
        append_utf8(out, cp);
    }
    return {};
}

Result<std::string> Decoder::read_string_chunks(std::uint8_t tag)
{
    std::string out;
    while (true) {
        std::size_t units = 0;
        bool final_chunk = true;
        if (tag <= 0x1F) {
            units = tag;
        } else if (tag >= 0x30 && tag <= 0x33) {
            auto low = next_byte();
            if (!low) {
                return std::unexpected(low.error());
            }
            units = (static_cast<std::size_t>(tag - 0x30) << 8) | *low;
        } else if (tag == 'R' || tag == 'S') {
            auto len = read_be(2);
            if (!len) {
                return std::unexpected(len.error());
            }
            units = static_cast<std::size_t>(*len);
            final_chunk = tag == 'S';
        } else {
            return unexpected_result<std::string>(ErrorCode::CodecError, "expected string chunk");
        }
        if (auto res = read_utf16_units(units, out); !res) {
            return std::unexpected(res.error());
        }
        if (final_chunk) {
            return out;
        }
        auto next = next_byte();
        if (!next) {
            return std::unexpected(next.error());
        }
        tag = *next;
    }
}

Result<std::string> Decoder::read_string_value()
{
    auto tag = next_byte();
    if (!tag) {
        return std::unexpected(tag.error());
    }
    if (!is_string_tag(*tag)) {
        return unexpected_result<std::string>(ErrorCode::CodecError, "expected string, got tag " + std::to_string(*tag));
    }
    return read_string_chunks(*tag);
}

Result<Bytes> Decoder::read_binary_chunks(std::uint8_t tag)
{
    Bytes out;
    while (true) {
        std::size_t size = 0;
        bool final_chunk = true;
        if (tag >= 0x20 && tag <= 0x2F) {
            size = tag - 0x20U;
        } else if (tag >= 0x34 && tag <= 0x37) {
            auto low = next_byte();
            if (!low) {
                return std::unexpected(low.error());
            }
            size = (static_cast<std::size_t>(tag - 0x34) << 8) | *low;
        } else if (tag == 'A' || tag == 'B') {
            auto len = read_be(2);
            if (!len) {
                return std::unexpected(len.error());
            }
            size = static_cast<std::size_t>(*len);
            final_chunk = tag == 'B';
        } else {
            return unexpected_result<Bytes>(ErrorCode::CodecError, "expected binary chunk");
        }
        if (data_.size() - offset_ < size) {
            return unexpected_result<Bytes>(ErrorCode::CodecError, "unexpected end of hessian data");
        }
        out.insert(out.end(), data_.begin() + static_cast<std::ptrdiff_t>(offset_),
                   data_.begin() + static_cast<std::ptrdiff_t>(offset_ + size));
        offset_ += size;
        if (final_chunk) {
            return out;
        }
        auto next = next_byte();
        if (!next) {
            return std::unexpected(next.error());
        }
        if (!is_binary_tag(*next)) {
            return unexpected_result<Bytes>(ErrorCode::CodecError, "expected binary chunk");
        }
        tag = *next;
    }
}

Result<std::string> Decoder::read_type()
{
    if (at_end()) {
        return unexpected_result<std::string>(ErrorCode::CodecError, "unexpected end of hessian data");
    }
    if (is_string_tag(data_[offset_])) {
        auto type = read_string_value();
        if (!type) {
            return type;
        }
        types_.push_back(*type);
        return type;
    }
    auto index = read_int();
    if (!index) {
        return std::unexpected(index.error());
    }
    if (*index < 0 || static_cast<std::size_t>(*index) >= types_.size()) {
        return unexpected_result<std::string>(ErrorCode::CodecError, "type reference out of range");
    }
    return types_[static_cast<std::size_t>(*index)];
}

std::size_t Decoder::reserve_ref()
{
    refs_.emplace_back();
    return refs_.size() - 1;
}

Result<Value> Decoder::read_list(std::optional<std::string> type, std::optional<std::size_t> length)
{
    auto ref = reserve_ref();
    List list;
    if (type) {
        list.type = std::move(*type);
    }
    if (length) {
        if (*length > data_.size() - offset_) {
            return unexpected_result<Value>(ErrorCode::CodecError, "list length exceeds payload");
        }
        list.items.reserve(*length);
        for (std::size_t i = 0; i < *length; ++i) {
            auto item = read();
            if (!item) {
                return item;
            }
            list.items.push_back(std::move(*item));
        }
    } else {
        while (true) {
            if (at_end()) {
                return unexpected_result<Value>(ErrorCode::CodecError, "unterminated list");
            }
            if (data_[offset_] == 'Z') {
                ++offset_;
                break;
            }
            auto item = read();
            if (!item) {
                return item;
            }
            list.items.push_back(std::move(*item));
        }
    }
    Value value = std::move(list);
    refs_[ref] = value;
    return value;
}

Result<Value> Decoder::read_map(std::string type)
{
    auto ref = reserve_ref();
    Map map;
    map.type = std::move(type);
    while (true) {
        if (at_end()) {
            return unexpected_result<Value>(ErrorCode::CodecError, "unterminated map");
        }
        if (data_[offset_] == 'Z') {
            ++offset_;
            break;
        }
        auto key = read();
        if (!key) {
            return key;
        }
        auto value = read();
        if (!value) {
            return value;
        }
        map.entries.emplace_back(std::move(*key), std::move(*value));
    }
    Value value = std::move(map);
    refs_[ref] = value;
    return value;
}

Result<void> Decoder::read_class_def()
{
    ClassDef def;
    auto name = read_string_value();
    if (!name) {
        return std::unexpected(name.error());
    }
    def.name = std::move(*name);
    auto count = read_int();
    if (!count) {
        return std::unexpected(count.error());
    }
    if (*count < 0 || static_cast<std::size_t>(*count) > data_.size() - offset_) {
        return unexpected_result(ErrorCode::CodecError, "invalid class definition field count");
    }
    for (std::int32_t i = 0; i < *count; ++i) {
        auto field = read_string_value();
        if (!field) {
            return std::unexpected(field.error());
        }
        def.fields.push_back(std::move(*field));
    }
    classes_.push_back(std::move(def));
    return {};
}

Result<Value> Decoder::read_object(std::size_t def_index)
{
    if (def_index >= classes_.size()) {
        return unexpected_result<Value>(ErrorCode::CodecError, "class definition reference out of range");
    }
    auto ref = reserve_ref();
    const auto def = classes_[def_index];
    Object object;
    object.class_name = def.name;
    for (const auto& field : def.fields) {
        auto value = read();
        if (!value) {
            return value;
        }
        object.fields.emplace_back(field, std::move(*value));
    }
    Value value = std::move(object);
    refs_[ref] = value;
    return value;
}

Result<Value> Decoder::read_ref()
{
    auto index = read_int();
    if (!index) {
        return std::unexpected(index.error());
    }
    if (*index < 0 || static_cast<std::size_t>(*index) >= refs_.size()) {
        return unexpected_result<Value>(ErrorCode::CodecError, "back-reference out of range");
    }
    const auto& target = refs_[static_cast<std::size_t>(*index)];
    if (!target) {
        return unexpected_result<Value>(ErrorCode::CodecError, "cyclic back-reference is not supported");
    }
    return *target;
}

Result<Value> Decoder::read_value(std::uint8_t tag)
{
    // int
    if ((tag >= 0x80 && tag <= 0xD7) || tag == 'I') {
        --offset_;
        auto v = read_int();
        if (!v) {
            return std::unexpected(v.error());
        }
        return Value{*v};
    }
    // long
    if (tag >= 0xD8 && tag <= 0xEF) {
        return Value{static_cast<std::int64_t>(tag) - 0xE0};
    }
    if (tag >= 0xF0) {
        auto low = next_byte();
        if (!low) {
            return std::unexpected(low.error());
        }
        return Value{(static_cast<std::int64_t>(tag) - 0xF8) * 256 + *low};
    }
    if (tag >= 0x38 && tag <= 0x3F) {
        auto low = read_be(2);
        if (!low) {
            return std::unexpected(low.error());
        }
        return Value{(static_cast<std::int64_t>(tag) - 0x3C) * 65536 + static_cast<std::int64_t>(*low)};
    }
    if (is_string_tag(tag)) {
        auto s = read_string_chunks(tag);
        if (!s) {
            return std::unexpected(s.error());
        }
        return Value{std::move(*s)};
    }
    if (is_binary_tag(tag)) {
        auto b = read_binary_chunks(tag);
        if (!b) {
            return std::unexpected(b.error());
        }
        return Value{std::move(*b)};
    }
    if (tag >= 0x60 && tag <= 0x6F) {
        return read_object(tag - 0x60U);
    }
    if (tag >= 0x70 && tag <= 0x77) {
        auto type = read_type();
        if (!type) {
            return std::unexpected(type.error());
        }
        return read_list(std::move(*type), static_cast<std::size_t>(tag - 0x70));
    }
    if (tag >= 0x78 && tag <= 0x7F) {
        return read_list(std::nullopt, static_cast<std::size_t>(tag - 0x78));
    }

    switch (tag) {
        case 'N':
            return Value{Null{}};
        case 'T':
            return Value{true};
        case 'F':
            return Value{false};
        case 0x59: {
            auto raw = read_be(4);
            if (!raw) {
                return std::unexpected(raw.error());
            }
            return Value{static_cast<std::int64_t>(static_cast<std::int32_t>(static_cast<std::uint32_t>(*raw)))};
        }
        case 'L': {
            auto raw = read_be(8);
            if (!raw) {
                return std::unexpected(raw.error());
            }
            return Value{static_cast<std::int64_t>(*raw)};
        }
        case 0x5B:
            return Value{0.0};
        case 0x5C:
            return Value{1.0};
        case 0x5D: {
            auto raw = next_byte();
            if (!raw) {
                return std::unexpected(raw.error());
            }
            return Value{static_cast<double>(static_cast<std::int8_t>(*raw))};
        }
        case 0x5E: {
            auto raw = read_be(2);
            if (!raw) {
                return std::unexpected(raw.error());
            }
            return Value{static_cast<double>(static_cast<std::int16_t>(static_cast<std::uint16_t>(*raw)))};
        }
        case 0x5F: {
            auto raw = read_be(4);
            if (!raw) {
                return std::unexpected(raw.error());
            }
            return Value{static_cast<double>(static_cast<std::int32_t>(static_cast<std::uint32_t>(*raw))) * 0.001};
        }
        case 'D': {
            auto raw = read_be(8);
            if (!raw) {
                return std::unexpected(raw.error());
            }
            return Value{std::bit_cast<double>(*raw)};
        }
        case 0x4A: {
            auto raw = read_be(8);
            if (!raw) {
                return std::unexpected(raw.error());
            }
            return Value{Date{static_cast<std::int64_t>(*raw)}};
        }
        case 0x4B: {
            auto raw = read_be(4);
            if (!raw) {
                return std::unexpected(raw.error());
            }
            auto minutes = static_cast<std::int32_t>(static_cast<std::uint32_t>(*raw));
            return Value{Date{static_cast<std::int64_t>(minutes) * 60000}};
        }
        case 'V': {
            auto type = read_type();
            if (!type) {
                return std::unexpected(type.error());
            }
            auto length = read_int();
            if (!length) {
                return std::unexpected(length.error());
            }
            if (*length < 0) {
                return unexpected_result<Value>(ErrorCode::CodecError, "negative list length");
            }
            return read_list(std::move(*type), static_cast<std::size_t>(*length));
        }
        case 0x58: {
            auto length = read_int();
            if (!length) {
                return std::unexpected(length.error());
            }
            if (*length < 0) {
                return unexpected_result<Value>(ErrorCode::CodecError, "negative list length");
            }
            return read_list(std::nullopt, static_cast<std::size_t>(*length));
        }
        case 0x55: {
            auto type = read_type();
            if (!type) {
                return std::unexpected(type.error());
            }
            return read_list(std::move(*type), std::nullopt);
        }
        case 0x57:
            return read_list(std::nullopt, std::nullopt);
        case 'H':
            return read_map({});
        case 'M': {
            auto type = read_type();
            if (!type) {
                return std::unexpected(type.error());
            }
            return read_map(std::move(*type));
        }
        case 'C': {
            if (auto res = read_class_def(); !res) {
                return std::unexpected(res.error());
            }
            return read();
        }
        case 'O': {
            auto index = read_int();
            if (!index) {
                return std::unexpected(index.error());
            }
            if (*index < 0) {
                return unexpected_result<Value>(ErrorCode::CodecError, "class definition reference out of range");
            }
            return read_object(static_cast<std::size_t>(*index));
        }
        case 'Q':
            return read_ref();
        default:
            break;
    }
    return unexpected_result<Value>(ErrorCode::CodecError, "unknown hessian tag " + std::to_string(tag));
}

Result<std::vector<std::uint8_t>> encode(const Value& value)
{
    std::vector<std::uint8_t> out;
    Encoder encoder(out);
    if (auto res = encoder.write(value); !res) {
        return std::unexpected(res.error());
    }
    return out;
}

Result<Value> decode(std::span<const std::uint8_t> data)
{
    Decoder decoder(data);
    auto value = decoder.read();
    if (!value) {
        return value;
    }
    if (!decoder.at_end()) {
        return unexpected_result<Value>(ErrorCode::CodecError, "trailing bytes after hessian value");
    }
    return value;
}

namespace
{

struct JavaTypeVisitor : boost::static_visitor<std::string> {
    std::string operator()(const Null&) const { return "java.lang.Object"; }
    std::string operator()(bool) const { return "boolean"; }
    std::string operator()(std::int32_t) const { return "int"; }
    std::string operator()(std::int64_t) const { return "long"; }
    std::string operator()(double) const { return "double"; }
    std::string operator()(const std::string&) const { return "java.lang.String"; }
    std::string operator()(const Bytes&) const { return "[B"; }
    std::string operator()(const Date&) const { return "java.util.Date"; }
    std::string operator()(const List& list) const { return list.type.empty() ? "java.util.List" : list.type; }
    std::string operator()(const Map& map) const { return map.type.empty() ? "java.util.Map" : map.type; }
    std::string operator()(const Object& object) const { return object.class_name; }
};

struct KindVisitor : boost::static_visitor<std::string> {
    std::string operator()(const Null&) const { return "null"; }
    std::string operator()(bool) const { return "bool"; }
    std::string operator()(std::int32_t) const { return "int"; }
    std::string operator()(std::int64_t) const { return "long"; }
    std::string operator()(double) const { return "double"; }
    std::string operator()(const std::string&) const { return "string"; }
    std::string operator()(const Bytes&) const { return "binary"; }
    std::string operator()(const Date&) const { return "date"; }
    std::string operator()(const List&) const { return "list"; }
    std::string operator()(const Map&) const { return "map"; }
    std::string operator()(const Object&) const { return "object"; }
};

}  // namespace

std::string java_type_name(const Value& value)
{
    JavaTypeVisitor visitor;
    return boost::apply_visitor(visitor, value);
}

std::string kind_name(const Value& value)
{
    KindVisitor visitor;
    return boost::apply_visitor(visitor, value);
}

}  // namespace triple::runtime::hessian

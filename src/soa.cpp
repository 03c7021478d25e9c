#include "bjd/bjd.hpp"
#include "bjd_internal.hpp"

#include <algorithm>
#include <limits>
#include <unordered_map>

namespace bjd {

namespace {

struct OffsetTable {
    std::vector<std::uint64_t> offsets{};
    const std::uint8_t* buffer{nullptr};
    std::size_t buffer_len{0};
};

std::uint8_t dict_index_marker(std::size_t n) {
    // Smallest unsigned type able to hold indices 0..n.
    if (n <= 0xFFu) return marker::kUInt8;
    if (n <= 0xFFFFu) return marker::kUInt16;
    if (static_cast<std::uint64_t>(n) <= 0xFFFFFFFFull) return marker::kUInt32;
    return marker::kUInt64;
}

void collect_offset_fields(const SoaSchema& schema, std::vector<const SoaType*>& out) {
    for (const auto& f : schema) {
        if (f.type.kind == SoaKind::OffsetString) out.push_back(&f.type);
        if (f.type.kind == SoaKind::Struct) collect_offset_fields(f.type.fields, out);
    }
}

// Decodes fixed-width field slices of one SOA payload.
class FieldDecoder {
public:
    FieldDecoder(const MarkerTable& table, const std::uint8_t* payload, std::size_t payload_pos)
        : table_(table), payload_(payload), payload_pos_(payload_pos) {}

    void add_offsets(const SoaType* type, OffsetTable t) { offsets_.emplace(type, std::move(t)); }

    Value decode(const SoaType& type, const std::uint8_t* p) const {
        switch (type.kind) {
            case SoaKind::Fixed:
                return table_.decode(info(type.marker, p), p);
            case SoaKind::Bool:
                return Value::make_bool(!(p[0] == marker::kFalse || p[0] == 0));
            case SoaKind::Null:
                return Value::make_null();
            case SoaKind::FixedString: {
                std::size_t n = type.width;
                while (n > 0 && p[n - 1] == 0) --n;
                std::string s = internal::decode_text(p, n);
                if (type.marker == marker::kHighPrec) return Value::make_highprec(std::move(s));
                return Value::make_string(std::move(s));
            }
            case SoaKind::DictString: {
                std::uint64_t idx = index(type, p);
                if (idx >= type.dict.size()) {
                    throw BjdError(ErrorKind::IndexOutOfRange, at(p),
                                   "dictionary index " + std::to_string(idx) + " out of range (" +
                                       std::to_string(type.dict.size()) + " entries)");
                }
                return Value::make_string(type.dict[static_cast<std::size_t>(idx)]);
            }
            case SoaKind::OffsetString: {
                auto it = offsets_.find(&type);
                if (it == offsets_.end()) {
                    throw BjdError(ErrorKind::MalformedSchema, at(p), "offset string field without offset table");
                }
                const OffsetTable& t = it->second;
                std::uint64_t idx = index(type, p);
                if (idx >= t.offsets.size() - 1) {
                    throw BjdError(ErrorKind::IndexOutOfRange, at(p),
                                   "string offset index " + std::to_string(idx) + " out of range");
                }
                std::uint64_t begin = t.offsets[static_cast<std::size_t>(idx)];
                std::uint64_t end = t.offsets[static_cast<std::size_t>(idx) + 1];
                if (begin > end || end > t.buffer_len) {
                    throw BjdError(ErrorKind::IndexOutOfRange, at(p),
                                   "string offsets [" + std::to_string(begin) + ", " + std::to_string(end) +
                                       ") outside buffer of " + std::to_string(t.buffer_len) + " bytes");
                }
                return Value::make_string(internal::decode_text(t.buffer + begin, static_cast<std::size_t>(end - begin)));
            }
            case SoaKind::FixedArray: {
                Array out;
                out.reserve(type.elements.size());
                std::size_t off = 0;
                for (const auto& el : type.elements) {
                    out.push_back(decode(el, p + off));
                    off += el.width;
                }
                return Value::make_array(std::move(out));
            }
            case SoaKind::Struct: {
                Object out;
                std::size_t off = 0;
                for (const auto& f : type.fields) {
                    out.set(f.name, decode(f.type, p + off));
                    off += f.type.width;
                }
                return Value::make_object(std::move(out));
            }
        }
        return Value::make_null();
    }

private:
    std::size_t at(const std::uint8_t* p) const {
        return payload_pos_ + static_cast<std::size_t>(p - payload_);
    }

    const MarkerInfo& info(std::uint8_t m, const std::uint8_t* p) const {
        const MarkerInfo* i = table_.find(m);
        if (!i) {
            throw BjdError(ErrorKind::MalformedSchema, at(p), "SOA field type " + describe_marker(m) + " is not fixed width");
        }
        return *i;
    }

    std::uint64_t index(const SoaType& type, const std::uint8_t* p) const {
        std::int64_t s = 0;
        std::uint64_t u = 0;
        bool is_unsigned = false;
        if (!table_.decode_integer(info(type.marker, p), p, s, u, is_unsigned)) {
            throw BjdError(ErrorKind::MalformedSchema, at(p), "string index type " + describe_marker(type.marker) + " is not an integer");
        }
        if (is_unsigned) return u;
        if (s < 0) {
            throw BjdError(ErrorKind::IndexOutOfRange, at(p), "negative string index " + std::to_string(s));
        }
        return static_cast<std::uint64_t>(s);
    }

    const MarkerTable& table_;
    const std::uint8_t* payload_;
    std::size_t payload_pos_;
    std::unordered_map<const SoaType*, OffsetTable> offsets_{};
};

} // namespace

// ------------------------------
// Schema
// ------------------------------

SoaSchema Decoder::read_schema() {
    const std::size_t at = cursor_.position();
    if (cursor_.peek() != marker::kObjectBegin) {
        throw BjdError(ErrorKind::MalformedSchema, at, "expected '{' to open SOA schema at " + std::to_string(at));
    }
    cursor_.read_byte();
    trace("schema {");
    SoaSchema schema = read_schema_fields();
    if (schema.empty()) {
        throw BjdError(ErrorKind::MalformedSchema, at, "empty SOA schema at " + std::to_string(at));
    }
    return schema;
}

SoaSchema Decoder::read_schema_fields() {
    internal::DepthGuard guard(depth_, cursor_.position());

    SoaSchema out;
    while (true) {
        const std::size_t at = cursor_.position();
        const int c = cursor_.peek();
        if (c == marker::kObjectEnd) {
            cursor_.read_byte();
            break;
        }
        if (c < 0) {
            throw BjdError(ErrorKind::MalformedSchema, at, "unterminated SOA schema at " + std::to_string(at));
        }
        if (!is_integer_marker(static_cast<std::uint8_t>(c))) {
            throw BjdError(ErrorKind::MalformedSchema, at,
                           "expected field name or '}' in SOA schema, got " +
                               describe_marker(static_cast<std::uint8_t>(c)) + " at " + std::to_string(at));
        }
        SoaField f;
        f.name = read_key();
        f.type = read_schema_type();
        out.push_back(std::move(f));
    }
    return out;
}

SoaType Decoder::read_schema_type() {
    const std::size_t at = cursor_.position();
    if (cursor_.peek() < 0) {
        throw BjdError(ErrorKind::MalformedSchema, at, "SOA schema ends inside a field type");
    }
    const std::uint8_t m = cursor_.read_byte();
    trace("field type: " + describe_marker(m));

    auto scalar_kind = [&](std::uint8_t em, std::size_t em_pos) -> SoaType {
        SoaType t;
        if (em == marker::kTrue || em == marker::kFalse) {
            t.kind = SoaKind::Bool;
            t.marker = em;
            t.width = 1;
            return t;
        }
        if (em == marker::kNull) {
            t.kind = SoaKind::Null;
            t.marker = em;
            return t;
        }
        const MarkerInfo* info = table_->find(em);
        if (!info || em == marker::kNoOp) {
            throw BjdError(ErrorKind::MalformedSchema, em_pos,
                           "unsupported marker " + describe_marker(em) + " in SOA schema at " + std::to_string(em_pos));
        }
        t.kind = SoaKind::Fixed;
        t.marker = em;
        t.width = info->width;
        return t;
    };

    auto skip_close = [&]() {
        if (cursor_.peek() == marker::kArrayEnd) cursor_.read_byte();
    };

    if (m == marker::kString || m == marker::kHighPrec) {
        SoaType t;
        t.kind = SoaKind::FixedString;
        t.marker = m;
        t.width = read_length();
        return t;
    }

    if (m == marker::kObjectBegin) {
        SoaType t;
        t.kind = SoaKind::Struct;
        t.marker = m;
        t.fields = read_schema_fields();
        for (const auto& f : t.fields) {
            if (!internal::checked_add_size(t.width, f.type.width, t.width)) {
                throw BjdError(ErrorKind::MalformedSchema, at, "nested SOA struct width overflows");
            }
        }
        return t;
    }

    if (m == marker::kArrayBegin) {
        if (cursor_.peek() == marker::kType) {
            cursor_.read_byte();
            const std::size_t type_pos = cursor_.position();
            if (cursor_.peek() < 0) {
                throw BjdError(ErrorKind::MalformedSchema, type_pos, "SOA schema ends inside an array field");
            }
            const std::uint8_t elem = cursor_.read_byte();

            if (elem == marker::kString) {
                if (cursor_.peek() != marker::kCount) {
                    throw BjdError(ErrorKind::MalformedSchema, cursor_.position(),
                                   "dictionary string field without a count at " + std::to_string(cursor_.position()));
                }
                cursor_.read_byte();
                const std::size_t n = read_length();
                SoaType t;
                t.kind = SoaKind::DictString;
                t.dict.reserve(std::min(n, cursor_.remaining()));
                for (std::size_t i = 0; i < n; ++i) {
                    std::size_t len = read_length();
                    t.dict.push_back(read_text(len));
                }
                t.marker = dict_index_marker(n);
                t.width = table_->find(t.marker)->width;
                skip_close();
                trace("dict: " + std::to_string(n) + " strings");
                return t;
            }

            if (cursor_.peek() == marker::kCount) {
                cursor_.read_byte();
                const std::size_t n = read_length();
                SoaType el = scalar_kind(elem, type_pos);
                SoaType t;
                t.kind = SoaKind::FixedArray;
                t.marker = elem;
                if (!internal::checked_mul_size(n, el.width, t.width)) {
                    throw BjdError(ErrorKind::MalformedSchema, type_pos, "fixed array field width overflows");
                }
                // A run of zero-width elements would be unbounded.
                if (el.width == 0 && n > cursor_.remaining()) {
                    throw BjdError(ErrorKind::MalformedSchema, type_pos, "fixed array of null elements is too long");
                }
                t.elements.assign(n, el);
                skip_close();
                return t;
            }

            if (is_integer_marker(elem)) {
                SoaType t;
                t.kind = SoaKind::OffsetString;
                t.marker = elem;
                t.width = table_->find(elem)->width;
                skip_close();
                return t;
            }

            throw BjdError(ErrorKind::MalformedSchema, type_pos,
                           "unsupported typed array " + describe_marker(elem) + " in SOA schema at " + std::to_string(type_pos));
        }

        SoaType t;
        t.kind = SoaKind::FixedArray;
        t.marker = m;
        while (true) {
            const std::size_t el_pos = cursor_.position();
            const int c = cursor_.peek();
            if (c < 0) {
                throw BjdError(ErrorKind::MalformedSchema, el_pos, "unterminated array field in SOA schema");
            }
            cursor_.read_byte();
            if (c == marker::kArrayEnd) break;
            SoaType el = scalar_kind(static_cast<std::uint8_t>(c), el_pos);
            t.width += el.width;
            t.elements.push_back(std::move(el));
        }
        return t;
    }

    return scalar_kind(m, at);
}

// ------------------------------
// Records
// ------------------------------

SoaRecordSet Decoder::decode_records(const SoaSchema& schema, std::size_t count, SoaLayout layout,
                                     std::vector<std::size_t> dims) {
    internal::DepthGuard guard(depth_, cursor_.position());

    SoaRecordSet rs;
    rs.layout = layout;
    rs.dims = std::move(dims);
    rs.count = count;
    rs.schema = schema;

    const std::size_t at = cursor_.position();
    std::size_t record_width = 0;
    for (const auto& f : schema) {
        if (!internal::checked_add_size(record_width, f.type.width, record_width)) {
            throw BjdError(ErrorKind::InvalidLength, at, "SOA record width overflows");
        }
    }
    std::size_t payload_bytes = 0;
    if (!internal::checked_mul_size(record_width, count, payload_bytes)) {
        throw BjdError(ErrorKind::InvalidLength, at,
                       "SOA payload of " + std::to_string(count) + " records overflows");
    }
    trace("payload: " + std::to_string(count) + " x " + std::to_string(record_width) + "B");
    const std::uint8_t* payload = cursor_.read(payload_bytes);

    FieldDecoder dec(*table_, payload, at);

    std::vector<const SoaType*> offset_fields;
    collect_offset_fields(schema, offset_fields);
    for (const SoaType* type : offset_fields) {
        const std::size_t table_pos = cursor_.position();
        std::size_t n = 0;
        std::size_t table_bytes = 0;
        if (!internal::checked_add_size(count, 1, n) || !internal::checked_mul_size(n, type->width, table_bytes)) {
            throw BjdError(ErrorKind::InvalidLength, table_pos, "SOA offset table overflows");
        }
        const std::uint8_t* p = cursor_.read(table_bytes);
        const MarkerInfo* info = table_->find(type->marker);

        OffsetTable t;
        t.offsets.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            std::int64_t s = 0;
            std::uint64_t u = 0;
            bool is_unsigned = false;
            if (!table_->decode_integer(*info, p + i * type->width, s, u, is_unsigned)) {
                throw BjdError(ErrorKind::MalformedSchema, table_pos, "offset table type is not an integer");
            }
            if (!is_unsigned) {
                if (s < 0) {
                    throw BjdError(ErrorKind::IndexOutOfRange, table_pos + i * type->width,
                                   "negative string offset " + std::to_string(s));
                }
                u = static_cast<std::uint64_t>(s);
            }
            t.offsets.push_back(u);
        }

        const std::uint64_t buf_len = t.offsets.back();
        if (buf_len > static_cast<std::uint64_t>((std::numeric_limits<std::size_t>::max)())) {
            throw BjdError(ErrorKind::InvalidLength, cursor_.position(), "SOA string buffer length overflows");
        }
        t.buffer_len = static_cast<std::size_t>(buf_len);
        t.buffer = cursor_.read(t.buffer_len);
        trace("string buffer: " + std::to_string(t.buffer_len) + "B");
        dec.add_offsets(type, std::move(t));
    }

    const std::size_t n_decode = count > opts_.max_items ? std::min(internal::kSampleCount, count) : count;
    rs.records.resize(n_decode);

    if (layout == SoaLayout::ColumnMajor) {
        std::size_t column_off = 0;
        for (const auto& f : schema) {
            const std::size_t w = f.type.width;
            std::vector<Value> column;
            column.reserve(n_decode);
            for (std::size_t r = 0; r < n_decode; ++r) {
                column.push_back(dec.decode(f.type, payload + column_off + r * w));
            }
            for (std::size_t r = 0; r < n_decode; ++r) {
                rs.records[r].set(f.name, std::move(column[r]));
            }
            column_off += w * count;
        }
    } else {
        for (std::size_t r = 0; r < n_decode; ++r) {
            const std::uint8_t* rec = payload + r * record_width;
            std::size_t field_off = 0;
            for (const auto& f : schema) {
                rs.records[r].set(f.name, dec.decode(f.type, rec + field_off));
                field_off += f.type.width;
            }
        }
    }
    return rs;
}

} // namespace bjd

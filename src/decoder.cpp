#include "bjd/bjd.hpp"
#include "bjd_internal.hpp"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>

namespace bjd {

namespace {

std::string marker_char(std::uint8_t m) {
    if (m >= 32 && m < 127) return std::string(1, static_cast<char>(m));
    return internal::to_hex(&m, 1);
}

std::string dims_to_string(const std::vector<std::size_t>& dims) {
    std::ostringstream oss;
    oss << '[';
    for (std::size_t i = 0; i < dims.size(); ++i) {
        if (i) oss << ", ";
        oss << dims[i];
    }
    oss << ']';
    return oss.str();
}

} // namespace

// ------------------------------
// Cursor
// ------------------------------

Cursor::Cursor(const std::uint8_t* data, std::size_t size) noexcept : data_(data), size_(size) {}

std::size_t Cursor::position() const noexcept { return pos_; }

std::size_t Cursor::size() const noexcept { return size_; }

std::size_t Cursor::remaining() const noexcept { return size_ - pos_; }

int Cursor::peek() const noexcept { return pos_ < size_ ? static_cast<int>(data_[pos_]) : -1; }

std::uint8_t Cursor::read_byte() { return *read(1); }

const std::uint8_t* Cursor::read(std::size_t n) {
    if (n > size_ - pos_) {
        std::ostringstream oss;
        oss << "EOF at " << pos_ << ", need " << n << ", have " << (size_ - pos_);
        throw BjdError(ErrorKind::UnexpectedEof, pos_, n, size_ - pos_, oss.str());
    }
    const std::uint8_t* p = data_ + pos_;
    pos_ += n;
    return p;
}

void Cursor::skip(std::size_t n) { (void)read(n); }

// ------------------------------
// Decoder
// ------------------------------

Decoder::Decoder(const std::uint8_t* data, std::size_t size, const DecodeOptions& opts)
    : cursor_(data, size), table_(&MarkerTable::get(opts.byte_order)), opts_(opts) {}

Decoder::Decoder(const std::vector<std::uint8_t>& bytes, const DecodeOptions& opts)
    : Decoder(bytes.data(), bytes.size(), opts) {}

std::size_t Decoder::position() const noexcept { return cursor_.position(); }

std::size_t Decoder::remaining() const noexcept { return cursor_.remaining(); }

void Decoder::trace(const std::string& msg) const {
    if (!opts_.trace) return;
    *opts_.trace << "# " << std::setw(6) << cursor_.position() << ": "
                 << std::string(static_cast<std::size_t>(depth_) * 2, ' ') << msg << "\n";
}

Value Decoder::read_value() {
    std::size_t at = cursor_.position();
    std::uint8_t m = cursor_.read_byte();
    trace("marker: " + marker_char(m));
    while (m == marker::kNoOp) {
        at = cursor_.position();
        m = cursor_.read_byte();
        trace("marker: " + marker_char(m));
    }
    return read_typed_value(m, at);
}

Value Decoder::read_typed_value(std::uint8_t m, std::size_t marker_pos) {
    if (const MarkerInfo* info = table_->find(m)) {
        const std::uint8_t* p = cursor_.read(info->width);
        return table_->decode(*info, p);
    }

    switch (m) {
        case marker::kString: {
            std::size_t n = read_length();
            return Value::make_string(read_text(n));
        }
        case marker::kHighPrec: {
            std::size_t n = read_length();
            return Value::make_highprec(read_text(n));
        }
        case marker::kArrayBegin:
            trace("array [");
            return read_array();
        case marker::kObjectBegin:
            trace("object {");
            return read_object();
        default:
            break;
    }

    throw BjdError(ErrorKind::UnknownMarker, marker_pos,
                   "Unknown marker " + describe_marker(m) + " at " + std::to_string(marker_pos));
}

std::size_t Decoder::read_length() {
    const std::size_t at = cursor_.position();
    std::uint8_t m = cursor_.read_byte();
    if (!is_integer_marker(m)) {
        throw BjdError(ErrorKind::UnexpectedMarker, at,
                       "Expected int marker, got " + describe_marker(m) + " at " + std::to_string(at));
    }
    return read_length(m, at);
}

std::size_t Decoder::read_length(std::uint8_t m, std::size_t at_pos) {
    const MarkerInfo* info = table_->find(m);
    if (!info || !is_integer_marker(m)) {
        throw BjdError(ErrorKind::UnexpectedMarker, at_pos,
                       "Expected int marker, got " + describe_marker(m) + " at " + std::to_string(at_pos));
    }
    const std::uint8_t* p = cursor_.read(info->width);

    std::int64_t s = 0;
    std::uint64_t u = 0;
    bool is_unsigned = false;
    if (!table_->decode_integer(*info, p, s, u, is_unsigned)) {
        throw BjdError(ErrorKind::UnexpectedMarker, at_pos, "length marker is not an integer");
    }
    if (!is_unsigned) {
        if (s < 0) {
            throw BjdError(ErrorKind::InvalidLength, at_pos,
                           "negative length " + std::to_string(s) + " at " + std::to_string(at_pos));
        }
        u = static_cast<std::uint64_t>(s);
    }
    if (u > static_cast<std::uint64_t>((std::numeric_limits<std::size_t>::max)())) {
        throw BjdError(ErrorKind::InvalidLength, at_pos, "length " + std::to_string(u) + " exceeds address space");
    }
    return static_cast<std::size_t>(u);
}

std::string Decoder::read_text(std::size_t n) {
    if (n == 0) return {};
    const std::uint8_t* p = cursor_.read(n);
    return internal::decode_text(p, n);
}

std::string Decoder::read_key() {
    std::size_t n = read_length();
    std::string key = read_text(n);
    trace("key: " + key);
    return key;
}

std::vector<std::size_t> Decoder::read_dims() {
    std::vector<std::size_t> dims;
    std::uint8_t elem = 0;
    std::size_t type_pos = 0;
    bool has_count = false;
    std::size_t count = 0;

    if (cursor_.peek() == marker::kType) {
        cursor_.read_byte();
        type_pos = cursor_.position();
        elem = cursor_.read_byte();
    }
    if (cursor_.peek() == marker::kCount) {
        cursor_.read_byte();
        count = read_length();
        has_count = true;
    }

    if (has_count && elem != 0) {
        // Each dimension takes at least one byte, so the reserve is bounded by the buffer.
        dims.reserve(std::min(count, cursor_.remaining()));
        for (std::size_t i = 0; i < count; ++i) dims.push_back(read_length(elem, type_pos));
    } else if (has_count) {
        dims.reserve(std::min(count, cursor_.remaining()));
        for (std::size_t i = 0; i < count; ++i) dims.push_back(read_length());
    } else {
        while (cursor_.peek() != marker::kArrayEnd) {
            const std::size_t at = cursor_.position();
            Value d = read_value();
            std::uint64_t u = 0;
            if (!internal::value_as_u64(d, u) ||
                u > static_cast<std::uint64_t>((std::numeric_limits<std::size_t>::max)())) {
                throw BjdError(ErrorKind::InvalidLength, at, "array dimension is not a non-negative integer");
            }
            dims.push_back(static_cast<std::size_t>(u));
        }
        cursor_.read_byte();
    }
    trace("dims: " + dims_to_string(dims));
    return dims;
}

std::size_t Decoder::total_from_dims(const std::vector<std::size_t>& dims, std::size_t at_pos) const {
    std::size_t total = 1;
    for (auto d : dims) {
        std::size_t tmp = 0;
        if (!internal::checked_mul_size(total, d, tmp)) {
            throw BjdError(ErrorKind::InvalidLength, at_pos, "array shape " + dims_to_string(dims) + " overflows");
        }
        total = tmp;
    }
    return total;
}

Value Decoder::read_array() {
    internal::DepthGuard guard(depth_, cursor_.position());

    std::uint8_t elem = 0;
    std::size_t type_pos = 0;
    if (cursor_.peek() == marker::kType) {
        cursor_.read_byte();
        if (cursor_.peek() == marker::kObjectBegin) {
            return read_soa(SoaLayout::RowMajor);
        }
        type_pos = cursor_.position();
        elem = cursor_.read_byte();
        trace("type: " + marker_char(elem));
    }

    bool has_count = false;
    std::size_t count = 0;
    if (cursor_.peek() == marker::kCount) {
        cursor_.read_byte();
        if (cursor_.peek() == marker::kArrayBegin) {
            cursor_.read_byte();
            bool column_major = false;
            if (cursor_.peek() == marker::kArrayBegin) {
                cursor_.read_byte();
                column_major = true;
            }
            std::vector<std::size_t> dims = read_dims();
            if (column_major && cursor_.peek() == marker::kArrayEnd) cursor_.read_byte();
            return read_shaped(elem, type_pos, std::move(dims), column_major);
        }
        count = read_length();
        has_count = true;
        trace("count: " + std::to_string(count));
    }

    if (has_count && elem != 0) {
        if (const MarkerInfo* info = table_->find(elem)) {
            return read_typed_array(*info, count, false, {}, false);
        }
        Array out;
        for (std::size_t i = 0; i < count; ++i) out.push_back(read_typed_value(elem, type_pos));
        return Value::make_array(std::move(out));
    }

    Array out;
    if (has_count) {
        out.reserve(std::min(count, cursor_.remaining()));
        for (std::size_t i = 0; i < count; ++i) out.push_back(read_value());
        return Value::make_array(std::move(out));
    }

    while (cursor_.peek() != marker::kArrayEnd) {
        out.push_back(read_value());
    }
    cursor_.read_byte();
    trace("array ]");
    return Value::make_array(std::move(out));
}

Value Decoder::read_typed_array(const MarkerInfo& info, std::size_t count, bool nd,
                                std::vector<std::size_t> dims, bool column_major) {
    TypedArray a;
    a.elem_marker = info.marker;
    a.elem_name = info.name;
    a.nd = nd;
    a.dims = std::move(dims);
    a.column_major = column_major;
    a.count = count;

    std::size_t total_bytes = 0;
    if (!internal::checked_mul_size(count, info.width, total_bytes)) {
        total_bytes = (std::numeric_limits<std::size_t>::max)();
    }
    a.total_bytes = total_bytes;

    if (total_bytes > cursor_.remaining()) {
        const std::size_t avail = cursor_.remaining();
        const std::uint8_t* p = cursor_.read(avail);
        a.state = PreviewState::Truncated;
        a.available_bytes = avail;
        a.head.assign(p, p + std::min(avail, internal::kHeadBytes));
        trace("truncated: " + std::to_string(avail) + "B of " + std::to_string(total_bytes) + "B");
        return Value::make_typed(std::move(a));
    }

    if (count > opts_.max_items) {
        const std::size_t n = std::min(internal::kSampleCount, count);
        a.values.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            a.values.push_back(table_->decode(info, cursor_.read(info.width)));
        }
        cursor_.skip((count - n) * info.width);
        a.state = PreviewState::Sampled;
        return Value::make_typed(std::move(a));
    }

    Array values;
    values.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        values.push_back(table_->decode(info, cursor_.read(info.width)));
    }
    if (!nd) return Value::make_array(std::move(values));

    a.values = std::move(values);
    a.state = PreviewState::Full;
    return Value::make_typed(std::move(a));
}

Value Decoder::read_shaped(std::uint8_t elem, std::size_t type_pos, std::vector<std::size_t> dims,
                           bool column_major) {
    const std::size_t total = total_from_dims(dims, cursor_.position());
    if (elem != 0) {
        if (const MarkerInfo* info = table_->find(elem)) {
            return read_typed_array(*info, total, true, std::move(dims), column_major);
        }
    }

    // Variable-width or untyped elements: every element has to be walked to keep the cursor right.
    TypedArray a;
    a.elem_marker = elem;
    a.elem_name = elem == marker::kString ? "string" : elem == marker::kHighPrec ? "highprec" : "any";
    a.nd = true;
    a.dims = std::move(dims);
    a.column_major = column_major;
    a.count = total;
    for (std::size_t i = 0; i < total; ++i) {
        Value v = elem != 0 ? read_typed_value(elem, type_pos) : read_value();
        if (total <= opts_.max_items || a.values.size() < internal::kSampleCount) {
            a.values.push_back(std::move(v));
        }
    }
    a.state = total > opts_.max_items ? PreviewState::Sampled : PreviewState::Full;
    return Value::make_typed(std::move(a));
}

Value Decoder::read_object() {
    internal::DepthGuard guard(depth_, cursor_.position());

    std::uint8_t elem = 0;
    std::size_t type_pos = 0;
    if (cursor_.peek() == marker::kType) {
        cursor_.read_byte();
        if (cursor_.peek() == marker::kObjectBegin) {
            return read_soa(SoaLayout::ColumnMajor);
        }
        type_pos = cursor_.position();
        elem = cursor_.read_byte();
        trace("type: " + marker_char(elem));
    }

    bool has_count = false;
    std::size_t count = 0;
    if (cursor_.peek() == marker::kCount) {
        cursor_.read_byte();
        count = read_length();
        has_count = true;
        trace("count: " + std::to_string(count));
    }

    Object out;
    auto read_entry = [&]() {
        std::string key = read_key();
        if (elem != 0) {
            out.set(std::move(key), read_typed_value(elem, type_pos));
        } else {
            out.set(std::move(key), read_value());
        }
    };

    if (has_count) {
        for (std::size_t i = 0; i < count; ++i) read_entry();
    } else {
        while (cursor_.peek() != marker::kObjectEnd) read_entry();
        cursor_.read_byte();
        trace("object }");
    }
    return Value::make_object(std::move(out));
}

Value Decoder::read_soa(SoaLayout layout) {
    SoaSchema schema = read_schema();

    const std::size_t at = cursor_.position();
    if (cursor_.peek() != marker::kCount) {
        throw BjdError(ErrorKind::MalformedSchema, at,
                       "SOA schema is not followed by a count at " + std::to_string(at));
    }
    cursor_.read_byte();

    std::vector<std::size_t> dims;
    std::size_t count = 0;
    if (cursor_.peek() == marker::kArrayBegin) {
        cursor_.read_byte();
        bool double_bracket = false;
        if (cursor_.peek() == marker::kArrayBegin) {
            cursor_.read_byte();
            double_bracket = true;
        }
        dims = read_dims();
        if (double_bracket && cursor_.peek() == marker::kArrayEnd) cursor_.read_byte();
        count = total_from_dims(dims, at);
    } else {
        count = read_length();
        dims = {count};
    }
    trace("soa: " + std::to_string(count) + " records, " + to_string(layout));
    return Value::make_soa(decode_records(schema, count, layout, std::move(dims)));
}

// ------------------------------
// API
// ------------------------------

Value decode(const std::uint8_t* data, std::size_t size, const DecodeOptions& opts, std::size_t* consumed) {
    Decoder d(data, size, opts);
    Value v = d.read_value();
    if (consumed) *consumed = d.position();
    return v;
}

Value decode(const std::vector<std::uint8_t>& bytes, const DecodeOptions& opts) {
    return decode(bytes.data(), bytes.size(), opts, nullptr);
}

} // namespace bjd

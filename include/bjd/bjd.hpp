#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace bjd {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    UnexpectedEof,
    UnknownMarker,
    UnexpectedMarker,
    InvalidLength,
    MalformedSchema,
    IndexOutOfRange,
    NestingTooDeep,
    JsonParse,
    Io,
};

std::string to_string(ErrorKind k);

class BjdError : public std::runtime_error {
public:
    BjdError(ErrorKind k, std::size_t offset, const std::string& msg);
    BjdError(ErrorKind k, std::size_t offset, std::size_t needed, std::size_t available,
             const std::string& msg);

    ErrorKind kind() const noexcept;
    // Byte offset in the input at which the failing read began.
    std::size_t offset() const noexcept;
    // Only meaningful for ErrorKind::UnexpectedEof.
    std::size_t needed() const noexcept;
    std::size_t available() const noexcept;

private:
    ErrorKind kind_;
    std::size_t offset_;
    std::size_t needed_{0};
    std::size_t available_{0};
};

// ------------------------------
// Markers
// ------------------------------

enum class ByteOrder {
    Little,
    Big, // UBJSON / BJData draft 1
};

namespace marker {
inline constexpr std::uint8_t kNull = 'Z';
inline constexpr std::uint8_t kNoOp = 'N';
inline constexpr std::uint8_t kTrue = 'T';
inline constexpr std::uint8_t kFalse = 'F';
inline constexpr std::uint8_t kInt8 = 'i';
inline constexpr std::uint8_t kUInt8 = 'U';
inline constexpr std::uint8_t kInt16 = 'I';
inline constexpr std::uint8_t kUInt16 = 'u';
inline constexpr std::uint8_t kInt32 = 'l';
inline constexpr std::uint8_t kUInt32 = 'm';
inline constexpr std::uint8_t kInt64 = 'L';
inline constexpr std::uint8_t kUInt64 = 'M';
inline constexpr std::uint8_t kFloat16 = 'h';
inline constexpr std::uint8_t kFloat32 = 'd';
inline constexpr std::uint8_t kFloat64 = 'D';
inline constexpr std::uint8_t kChar = 'C';
inline constexpr std::uint8_t kByte = 'B';
inline constexpr std::uint8_t kString = 'S';
inline constexpr std::uint8_t kHighPrec = 'H';
inline constexpr std::uint8_t kArrayBegin = '[';
inline constexpr std::uint8_t kArrayEnd = ']';
inline constexpr std::uint8_t kObjectBegin = '{';
inline constexpr std::uint8_t kObjectEnd = '}';
inline constexpr std::uint8_t kType = '$';
inline constexpr std::uint8_t kCount = '#';
} // namespace marker

enum class NumericRule {
    Null,
    NoOp,
    True,
    False,
    Int8,
    UInt8,
    Int16,
    UInt16,
    Int32,
    UInt32,
    Int64,
    UInt64,
    Float16,
    Float32,
    Float64,
    Char,
    Byte,
};

struct MarkerInfo {
    std::uint8_t marker{0};
    const char* name{""};
    std::size_t width{0};
    NumericRule rule{NumericRule::Null};
};

bool is_integer_marker(std::uint8_t m) noexcept;
// Printable form used in messages: 'U' for printable bytes, 0x05 otherwise.
std::string describe_marker(std::uint8_t m);

// ------------------------------
// Public data model
// ------------------------------

struct Value;

using Array = std::vector<Value>;

struct Char {
    std::uint8_t code{0};
};

struct Byte {
    std::uint8_t value{0};
};

struct HighPrec {
    std::string digits{};
};

// Insertion-ordered mapping. Re-assigning a key overwrites the value in place.
class Object {
public:
    using Entry = std::pair<std::string, Value>;

    void set(std::string key, Value v);
    const Value* find(std::string_view key) const;

    std::size_t size() const noexcept;
    bool empty() const noexcept;
    const std::vector<Entry>& entries() const noexcept;

private:
    std::vector<Entry> entries_{};
    std::unordered_map<std::string, std::size_t> index_{};
};

enum class PreviewState {
    Full,      // every element decoded
    Sampled,   // count over budget: leading sample kept, rest skipped
    Truncated, // declared bytes exceed the buffer: raw head kept
};

struct TypedArray {
    std::uint8_t elem_marker{0};
    std::string elem_name{};
    bool nd{false};
    std::vector<std::size_t> dims{};
    bool column_major{false};

    std::size_t count{0};
    std::size_t total_bytes{0};
    std::size_t available_bytes{0}; // Truncated only
    PreviewState state{PreviewState::Full};

    // All elements (Full) or the first few (Sampled).
    std::vector<Value> values{};
    // First raw bytes (Truncated).
    std::vector<std::uint8_t> head{};
};

enum class SoaLayout {
    RowMajor,
    ColumnMajor,
};

std::string to_string(SoaLayout layout);

enum class SoaKind {
    Fixed,
    Bool,
    Null,
    FixedString,
    DictString,
    OffsetString,
    FixedArray,
    Struct,
};

struct SoaField;

struct SoaType {
    SoaKind kind{SoaKind::Null};
    // Fixed: element marker. OffsetString: index marker.
    std::uint8_t marker{0};
    // Per-record byte width.
    std::size_t width{0};
    std::vector<std::string> dict{};
    std::vector<SoaType> elements{};
    std::vector<SoaField> fields{};
};

struct SoaField {
    std::string name{};
    SoaType type{};
};

using SoaSchema = std::vector<SoaField>;

struct SoaRecordSet {
    SoaLayout layout{SoaLayout::RowMajor};
    std::vector<std::size_t> dims{};
    // Declared record count; records may hold only a leading sample.
    std::size_t count{0};
    SoaSchema schema{};
    std::vector<Object> records{};
};

struct Value {
    std::variant<
        std::nullptr_t,
        bool,
        std::int64_t,
        std::uint64_t,
        double,
        Char,
        Byte,
        std::string,
        HighPrec,
        Array,
        Object,
        TypedArray,
        SoaRecordSet
    > v;

    static Value make_null();
    static Value make_bool(bool b);
    static Value make_int(std::int64_t i);
    static Value make_uint(std::uint64_t u);
    static Value make_float(double d);
    static Value make_char(std::uint8_t c);
    static Value make_byte(std::uint8_t b);
    static Value make_string(std::string s);
    static Value make_highprec(std::string digits);
    static Value make_array(Array a);
    static Value make_object(Object o);
    static Value make_typed(TypedArray a);
    static Value make_soa(SoaRecordSet s);

    bool is_null() const noexcept;
    bool is_array() const noexcept;
    bool is_object() const noexcept;
    bool is_string() const noexcept;

    const Array& as_array() const;
    const Object& as_object() const;
    const std::string& as_string() const;
    const TypedArray& as_typed() const;
    const SoaRecordSet& as_soa() const;
};

bool operator==(const Char& a, const Char& b) noexcept;
bool operator==(const Byte& a, const Byte& b) noexcept;
bool operator==(const HighPrec& a, const HighPrec& b) noexcept;
bool operator==(const Object& a, const Object& b);
bool operator==(const TypedArray& a, const TypedArray& b);
bool operator==(const SoaRecordSet& a, const SoaRecordSet& b);
bool operator==(const Value& a, const Value& b);
bool operator!=(const Value& a, const Value& b);

// ------------------------------
// Marker table
// ------------------------------

class MarkerTable {
public:
    static const MarkerTable& get(ByteOrder order);

    ByteOrder byte_order() const noexcept;

    /// Fixed-width markers only; variable-width and structural markers return nullptr.
    const MarkerInfo* find(std::uint8_t m) const noexcept;

    /// Decode `info.width` bytes at `p` with this table's byte order.
    Value decode(const MarkerInfo& info, const std::uint8_t* p) const;

    /// Decode an integer marker's bytes. Returns false for non-integer rules.
    bool decode_integer(const MarkerInfo& info, const std::uint8_t* p, std::int64_t& out_signed,
                        std::uint64_t& out_unsigned, bool& is_unsigned) const;

private:
    explicit MarkerTable(ByteOrder order);

    std::uint64_t load_unsigned(const std::uint8_t* p, std::size_t n) const noexcept;

    ByteOrder order_;
    std::vector<MarkerInfo> infos_{};
    std::int16_t slot_[256]{};
};

// ------------------------------
// Options
// ------------------------------

struct DecodeOptions {
    ByteOrder byte_order{ByteOrder::Little};
    // Typed arrays and SOA blocks with more elements are previewed.
    std::size_t max_items{100};
    // Optional per-marker trace sink.
    std::ostream* trace{nullptr};
};

struct RenderOptions {
    std::size_t max_items{100};
    std::size_t max_string{200};
};

// ------------------------------
// Decoder
// ------------------------------

class Cursor {
public:
    Cursor(const std::uint8_t* data, std::size_t size) noexcept;

    std::size_t position() const noexcept;
    std::size_t size() const noexcept;
    std::size_t remaining() const noexcept;

    // -1 at end of buffer. Never consumes.
    int peek() const noexcept;
    std::uint8_t read_byte();
    // Returns a pointer to `n` bytes and advances. Throws UnexpectedEof.
    const std::uint8_t* read(std::size_t n);
    void skip(std::size_t n);

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_{0};
};

class Decoder {
public:
    Decoder(const std::uint8_t* data, std::size_t size, const DecodeOptions& opts = DecodeOptions{});
    explicit Decoder(const std::vector<std::uint8_t>& bytes, const DecodeOptions& opts = DecodeOptions{});

    /// Decode the next complete value at the cursor.
    Value read_value();

    /// Read an SOA schema object (`{ name type ... }`) at the cursor.
    SoaSchema read_schema();

    /// Decode `count` records of `schema` from the payload at the cursor.
    SoaRecordSet decode_records(const SoaSchema& schema, std::size_t count, SoaLayout layout,
                                std::vector<std::size_t> dims = {});

    std::size_t position() const noexcept;
    std::size_t remaining() const noexcept;

private:
    Value read_typed_value(std::uint8_t m, std::size_t marker_pos);
    Value read_array();
    Value read_object();
    Value read_typed_array(const MarkerInfo& info, std::size_t count, bool nd,
                           std::vector<std::size_t> dims, bool column_major);
    Value read_shaped(std::uint8_t elem, std::size_t type_pos, std::vector<std::size_t> dims,
                      bool column_major);
    Value read_soa(SoaLayout layout);
    std::string read_key();
    std::string read_text(std::size_t n);
    std::size_t read_length();
    std::size_t read_length(std::uint8_t m, std::size_t at_pos);
    std::vector<std::size_t> read_dims();
    std::size_t total_from_dims(const std::vector<std::size_t>& dims, std::size_t at_pos) const;

    SoaSchema read_schema_fields();
    SoaType read_schema_type();

    void trace(const std::string& msg) const;

    Cursor cursor_;
    const MarkerTable* table_;
    DecodeOptions opts_;
    int depth_{0};
};

// ------------------------------
// API
// ------------------------------

/// Decode a single value from a byte buffer. `consumed` receives the cursor position afterwards.
Value decode(const std::uint8_t* data, std::size_t size, const DecodeOptions& opts = DecodeOptions{},
             std::size_t* consumed = nullptr);
Value decode(const std::vector<std::uint8_t>& bytes, const DecodeOptions& opts = DecodeOptions{});

/// Render a decoded value as bounded text.
std::string render(const Value& v, const RenderOptions& opts = RenderOptions{}, std::size_t indent = 0);

/// `prefix...suffix (N chars)` when `s` has more than `max_string` code points.
std::string truncate_string(const std::string& s, std::size_t max_string);

/// Shortest round-trip text for a double, with ".0" for integral values.
std::string format_float(double d);

/// Lines of `  <offset, 4 decimal digits>: <hex>  <ascii>`, 16 bytes each, over [begin, end).
void hex_dump(std::ostream& os, const std::uint8_t* data, std::size_t size, std::size_t begin, std::size_t end);

/// True when the first bytes look like textual JSON rather than BJData.
bool looks_like_json(const std::uint8_t* data, std::size_t size);

/// Parse textual JSON into the same value tree (objects keep key order).
Value parse_json_text(std::string_view text);

/// Read a whole file; gzip-compressed files are inflated transparently.
std::vector<std::uint8_t> load_file(const std::filesystem::path& file);

} // namespace bjd

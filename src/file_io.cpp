#include "bjd/bjd.hpp"

#include <zlib.h>

namespace bjd {

// ------------------------------
// File loading
// ------------------------------

// gzread passes plain files through unchanged, so one path serves both.
std::vector<std::uint8_t> load_file(const std::filesystem::path& file) {
    gzFile gz = gzopen(file.string().c_str(), "rb");
    if (!gz) {
        throw BjdError(ErrorKind::Io, 0, "cannot open file: " + file.string());
    }

    std::vector<std::uint8_t> out;
    std::uint8_t buf[1 << 16];
    while (true) {
        int n = gzread(gz, buf, sizeof(buf));
        if (n < 0) {
            int errnum = 0;
            const char* msg = gzerror(gz, &errnum);
            std::string detail = msg ? msg : "read failed";
            gzclose(gz);
            throw BjdError(ErrorKind::Io, out.size(), "cannot read file: " + file.string() + ": " + detail);
        }
        if (n == 0) break;
        out.insert(out.end(), buf, buf + n);
    }
    if (gzclose(gz) != Z_OK) {
        throw BjdError(ErrorKind::Io, out.size(), "cannot read file: " + file.string() + ": bad gzip trailer");
    }
    return out;
}

} // namespace bjd

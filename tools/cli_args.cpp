#include "cli_args.hpp"
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace scrub {
namespace cli {

namespace {

bool parseWide(const char* s, long long& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(s, &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = v;
    return true;
}

} // namespace

bool parseInt(const char* s, i32& out) {
    long long v = 0;
    if (!parseWide(s, v) || v < INT32_MIN || v > INT32_MAX) return false;
    out = i32(v);
    return true;
}

bool parseSeed(const char* s, u32& out) {
    long long v = 0;
    if (!parseWide(s, v) || v < 0 || v > 0xFFFFFFFFLL) return false;
    out = u32(v);
    return true;
}

bool parseFloat(const char* s, f32& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    f32 v = std::strtof(s, &end);
    if (errno != 0 || *end != '\0' || !std::isfinite(v)) return false;
    out = v;
    return true;
}

bool parseRect(const char* s, Selection& out) {
    i32 v[4];
    std::string text(s ? s : "");
    size_t start = 0;
    for (int i = 0; i < 4; ++i) {
        size_t comma = text.find(',', start);
        if ((i < 3) != (comma != std::string::npos)) return false;
        std::string part = text.substr(start, i < 3 ? comma - start : std::string::npos);
        if (!parseInt(part.c_str(), v[i])) return false;
        start = comma + 1;
    }
    out = {v[0], v[1], v[2], v[3]};
    return true;
}

} // namespace cli
} // namespace scrub

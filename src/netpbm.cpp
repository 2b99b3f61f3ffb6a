#include "scrub/netpbm.hpp"
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>

namespace scrub {

namespace {

constexpr i32 kMaxDimension = 1 << 15;
// w * h * 4 stays below 2^31 bytes
constexpr int64_t kMaxPixels = int64_t(1) << 28;

// Cursor over the raw file bytes
struct Reader {
    const std::string& data;
    size_t pos = 0;

    bool atEnd() const { return pos >= data.size(); }

    void skipSpaceAndComments() {
        while (!atEnd()) {
            char c = data[pos];
            if (c == '#') {
                while (!atEnd() && data[pos] != '\n') ++pos;
            } else if (std::isspace(static_cast<unsigned char>(c))) {
                ++pos;
            } else {
                break;
            }
        }
    }

    bool readInt(i32& out) {
        skipSpaceAndComments();
        if (atEnd() || !std::isdigit(static_cast<unsigned char>(data[pos]))) return false;
        int64_t v = 0;
        while (!atEnd() && std::isdigit(static_cast<unsigned char>(data[pos]))) {
            v = v * 10 + (data[pos] - '0');
            if (v > (int64_t(1) << 30)) return false;
            ++pos;
        }
        out = i32(v);
        return true;
    }

    bool readLine(std::string& line) {
        if (atEnd()) return false;
        size_t end = data.find('\n', pos);
        if (end == std::string::npos) end = data.size();
        line = data.substr(pos, end - pos);
        pos = end < data.size() ? end + 1 : end;
        return true;
    }
};

bool readFile(const std::string& path, std::string& out) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return false;
    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    return !f.bad();
}

u8 scaleSample(u8 v, i32 maxval) {
    if (maxval == 255) return v;
    return u8((i32(v) * 255 + maxval / 2) / maxval);
}

// Expand depth-channel tuples into RGBA
Pixmap unpackTuples(const std::string& data, size_t offset, i32 w, i32 h,
                    i32 depth, i32 maxval, const std::string& path) {
    const size_t needed = size_t(w) * size_t(h) * size_t(depth);
    if (data.size() < offset || data.size() - offset < needed) {
        std::fprintf(stderr, "scrub Netpbm: truncated pixel data in %s\n", path.c_str());
        return Pixmap();
    }

    Pixmap pm = Pixmap::Alloc(PixmapInfo::MakeRGBA(w, h));
    if (!pm.valid()) {
        std::fprintf(stderr, "scrub Netpbm: cannot allocate %dx%d for %s\n", w, h, path.c_str());
        return Pixmap();
    }

    const u8* src = reinterpret_cast<const u8*>(data.data()) + offset;
    for (i32 y = 0; y < h; ++y) {
        for (i32 x = 0; x < w; ++x) {
            Color c;
            switch (depth) {
            case 1:
                c.r = c.g = c.b = scaleSample(src[0], maxval);
                break;
            case 2:
                c.r = c.g = c.b = scaleSample(src[0], maxval);
                c.a = scaleSample(src[1], maxval);
                break;
            case 3:
                c = {scaleSample(src[0], maxval), scaleSample(src[1], maxval),
                     scaleSample(src[2], maxval), 255};
                break;
            default:
                c = {scaleSample(src[0], maxval), scaleSample(src[1], maxval),
                     scaleSample(src[2], maxval), scaleSample(src[3], maxval)};
                break;
            }
            pm.setPixel(x, y, c);
            src += depth;
        }
    }
    return pm;
}

bool validHeader(i32 w, i32 h, i32 maxval, const std::string& path) {
    if (w <= 0 || h <= 0 || w > kMaxDimension || h > kMaxDimension) {
        std::fprintf(stderr, "scrub Netpbm: bad dimensions %dx%d in %s\n", w, h, path.c_str());
        return false;
    }
    if (int64_t(w) * int64_t(h) > kMaxPixels) {
        std::fprintf(stderr, "scrub Netpbm: image %dx%d in %s is too large\n", w, h, path.c_str());
        return false;
    }
    if (maxval <= 0 || maxval > 255) {
        std::fprintf(stderr, "scrub Netpbm: unsupported maxval %d in %s\n", maxval, path.c_str());
        return false;
    }
    return true;
}

Pixmap decodePpm(const std::string& data, const std::string& path) {
    Reader r{data};
    r.pos = 2;
    i32 w = 0, h = 0, maxval = 0;
    if (!r.readInt(w) || !r.readInt(h) || !r.readInt(maxval)) {
        std::fprintf(stderr, "scrub Netpbm: malformed PPM header in %s\n", path.c_str());
        return Pixmap();
    }
    if (!validHeader(w, h, maxval, path)) return Pixmap();
    // exactly one whitespace byte separates the header from the raster
    if (r.atEnd() || !std::isspace(static_cast<unsigned char>(data[r.pos]))) {
        std::fprintf(stderr, "scrub Netpbm: malformed PPM header in %s\n", path.c_str());
        return Pixmap();
    }
    return unpackTuples(data, r.pos + 1, w, h, 3, maxval, path);
}

Pixmap decodePam(const std::string& data, const std::string& path) {
    Reader r{data};
    std::string line;
    r.readLine(line);  // "P7"

    i32 w = 0, h = 0, depth = 0, maxval = 0;
    bool ended = false;
    while (r.readLine(line)) {
        if (line.empty() || line[0] == '#') continue;
        std::istringstream fields(line);
        std::string key;
        fields >> key;
        if (key == "ENDHDR") { ended = true; break; }
        if (key == "WIDTH") fields >> w;
        else if (key == "HEIGHT") fields >> h;
        else if (key == "DEPTH") fields >> depth;
        else if (key == "MAXVAL") fields >> maxval;
        // TUPLTYPE is implied by DEPTH for the variants we accept
    }
    if (!ended) {
        std::fprintf(stderr, "scrub Netpbm: PAM header without ENDHDR in %s\n", path.c_str());
        return Pixmap();
    }
    if (!validHeader(w, h, maxval, path)) return Pixmap();
    if (depth < 1 || depth > 4) {
        std::fprintf(stderr, "scrub Netpbm: unsupported PAM depth %d in %s\n", depth, path.c_str());
        return Pixmap();
    }
    return unpackTuples(data, r.pos, w, h, depth, maxval, path);
}

bool endsWith(const std::string& s, const char* suffix) {
    const size_t n = std::char_traits<char>::length(suffix);
    if (s.size() < n) return false;
    for (size_t i = 0; i < n; ++i) {
        if (std::tolower(static_cast<unsigned char>(s[s.size() - n + i])) != suffix[i]) return false;
    }
    return true;
}

} // namespace

Pixmap decodeNetpbm(const std::string& path) {
    std::string data;
    if (!readFile(path, data)) {
        std::fprintf(stderr, "scrub Netpbm: cannot open %s\n", path.c_str());
        return Pixmap();
    }
    if (data.size() >= 2 && data[0] == 'P' && data[1] == '6') return decodePpm(data, path);
    if (data.size() >= 2 && data[0] == 'P' && data[1] == '7') return decodePam(data, path);

    std::fprintf(stderr, "scrub Netpbm: %s is not a binary PPM or PAM file\n", path.c_str());
    return Pixmap();
}

bool encodePpm(const Pixmap& pixmap, const std::string& path) {
    if (!pixmap.valid()) return false;
    std::ofstream f(path, std::ios::binary);
    if (!f) {
        std::fprintf(stderr, "scrub Netpbm: cannot write %s\n", path.c_str());
        return false;
    }
    f << "P6\n" << pixmap.width() << " " << pixmap.height() << "\n255\n";
    for (i32 y = 0; y < pixmap.height(); ++y) {
        for (i32 x = 0; x < pixmap.width(); ++x) {
            Color c = pixmap.getPixel(x, y);
            f.put(char(c.r)); f.put(char(c.g)); f.put(char(c.b));
        }
    }
    return bool(f);
}

bool encodePam(const Pixmap& pixmap, const std::string& path) {
    if (!pixmap.valid()) return false;
    std::ofstream f(path, std::ios::binary);
    if (!f) {
        std::fprintf(stderr, "scrub Netpbm: cannot write %s\n", path.c_str());
        return false;
    }
    f << "P7\nWIDTH " << pixmap.width() << "\nHEIGHT " << pixmap.height()
      << "\nDEPTH 4\nMAXVAL 255\nTUPLTYPE RGB_ALPHA\nENDHDR\n";
    for (i32 y = 0; y < pixmap.height(); ++y) {
        for (i32 x = 0; x < pixmap.width(); ++x) {
            Color c = pixmap.getPixel(x, y);
            f.put(char(c.r)); f.put(char(c.g)); f.put(char(c.b)); f.put(char(c.a));
        }
    }
    return bool(f);
}

bool encodeNetpbm(const Pixmap& pixmap, const std::string& path) {
    if (endsWith(path, ".pam")) return encodePam(pixmap, path);
    return encodePpm(pixmap, path);
}

} // namespace scrub

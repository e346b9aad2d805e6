#include "protocol/wire.hpp"
#include "errors.hpp"

namespace zipline::protocol {

std::array<uint8_t, 8> encode_int64(int64_t value) {
    std::array<uint8_t, 8> buffer;
    uint64_t v = static_cast<uint64_t>(value);
    for (size_t i = 0; i < 8; ++i) {
        buffer[i] = static_cast<uint8_t>(v & 0xFF);
        v >>= 8;
    }
    return buffer;
}

int64_t decode_int64(const std::array<uint8_t, 8>& buffer) {
    uint64_t v = 0;
    for (size_t i = 8; i-- > 0;) {
        v = (v << 8) | buffer[i];
    }
    return static_cast<int64_t>(v);
}

std::vector<uint8_t> encode_session_header(int64_t total_elements, int64_t total_size) {
    std::vector<uint8_t> out;
    out.reserve(16);
    auto n = encode_int64(total_elements);
    auto t = encode_int64(total_size);
    out.insert(out.end(), n.begin(), n.end());
    out.insert(out.end(), t.begin(), t.end());
    return out;
}

std::vector<uint8_t> encode_element_header(const std::string& name, int64_t size) {
    if (name.empty()) {
        throw ProtocolError("Element name is empty");
    }
    if (name.find('\0') != std::string::npos) {
        throw ProtocolError("Element name contains a NUL byte");
    }

    std::vector<uint8_t> out(name.begin(), name.end());
    out.push_back(0x00);
    auto s = encode_int64(size);
    out.insert(out.end(), s.begin(), s.end());
    return out;
}

bool is_valid_utf8(const uint8_t* data, size_t length) {
    size_t i = 0;
    while (i < length) {
        uint8_t c = data[i];
        size_t extra;
        uint32_t cp;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= length) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            uint8_t cc = data[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and out-of-range code points.
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
            (extra == 3 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::filesystem::path from_wire_name(const std::string& name) {
    if (name.empty()) {
        throw ProtocolError("Empty element name");
    }
    if (name.front() == '/') {
        throw ProtocolError("Element name is not a relative path: " + name);
    }
#ifdef _WIN32
    if (name.find('\\') != std::string::npos || name.find(':') != std::string::npos) {
        throw ProtocolError("Element name is not a relative path: " + name);
    }
#endif

    std::filesystem::path result;
    size_t start = 0;
    while (start <= name.size()) {
        size_t slash = name.find('/', start);
        std::string segment = name.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        if (segment.empty() || segment == "." || segment == "..") {
            throw ProtocolError("Unsafe element name: " + name);
        }
        result /= std::filesystem::u8path(segment);
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return result;
}

std::string to_wire_name(const std::filesystem::path& relative) {
    std::string out;
    for (const auto& part : relative) {
        std::string segment = part.u8string();
        if (segment.empty() || segment == "/") continue;
        if (!out.empty()) out += '/';
        out += segment;
    }
    return out;
}

} // namespace zipline::protocol

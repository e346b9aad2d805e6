#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace zipline::protocol {

// TCP stream: int64 N | int64 T | N x (utf8 name | 0x00 | int64 size | size bytes)
// All integers are little-endian signed.

// Element name that marks an in-memory text snippet.
inline constexpr const char* kTextElementName = "___ZIPLINE___TEXT___";

// Element size announcing a folder; no payload follows.
inline constexpr int64_t kFolderSize = -1;

std::array<uint8_t, 8> encode_int64(int64_t value);
int64_t decode_int64(const std::array<uint8_t, 8>& buffer);

// The 16 bytes that open every transfer.
std::vector<uint8_t> encode_session_header(int64_t total_elements, int64_t total_size);

// Name, terminator and size of one element. Throws ProtocolError when the
// name is empty or contains a NUL byte.
std::vector<uint8_t> encode_element_header(const std::string& name, int64_t size);

bool is_valid_utf8(const uint8_t* data, size_t length);
inline bool is_valid_utf8(const std::string& s) {
    return is_valid_utf8(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

// Converts a forward-slash wire name to a relative host path. Rejects
// absolute names, empty segments, "." and ".." with ProtocolError so a
// received element can never land outside the save root.
std::filesystem::path from_wire_name(const std::string& name);

// Joins relative path segments with '/'.
std::string to_wire_name(const std::filesystem::path& relative);

} // namespace zipline::protocol

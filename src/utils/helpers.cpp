#include "helpers.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
//
// Big-endian readers
//
uint16_t read_be16(const std::vector<uint8_t>& blob, size_t offset) {
    return static_cast<uint16_t>((blob[offset] << 8) |
                                 (blob[offset + 1]));
}

uint32_t read_be24(const std::vector<uint8_t>& blob, size_t offset) {
    return (static_cast<uint32_t>(blob[offset]) << 16) |
           (static_cast<uint32_t>(blob[offset + 1]) << 8) |
           (static_cast<uint32_t>(blob[offset + 2]));
}

uint32_t read_be32(const std::vector<uint8_t>& blob, size_t offset) {
    return (static_cast<uint32_t>(blob[offset]) << 24) |
           (static_cast<uint32_t>(blob[offset + 1]) << 16) |
           (static_cast<uint32_t>(blob[offset + 2]) << 8) |
           (static_cast<uint32_t>(blob[offset + 3]));
}

uint64_t read_be64(const std::vector<uint8_t>& blob, size_t offset) {
    return (static_cast<uint64_t>(blob[offset]) << 56) |
           (static_cast<uint64_t>(blob[offset + 1]) << 48) |
           (static_cast<uint64_t>(blob[offset + 2]) << 40) |
           (static_cast<uint64_t>(blob[offset + 3]) << 32) |
           (static_cast<uint64_t>(blob[offset + 4]) << 24) |
           (static_cast<uint64_t>(blob[offset + 5]) << 16) |
           (static_cast<uint64_t>(blob[offset + 6]) << 8)  |
           (static_cast<uint64_t>(blob[offset + 7]));
}

//
// Little-endian readers
//
uint32_t read_le32(const std::vector<uint8_t>& blob, size_t offset) {
    return (static_cast<uint32_t>(blob[offset + 3]) << 24) |
           (static_cast<uint32_t>(blob[offset + 2]) << 16) |
           (static_cast<uint32_t>(blob[offset + 1]) << 8) |
           (static_cast<uint32_t>(blob[offset]));
}

std::optional<size_t> find_bytes(const std::vector<uint8_t>& blob,
                                 const std::vector<uint8_t>& pattern,
                                 size_t from,
                                 size_t until) {
    size_t end = std::min(until, blob.size());
    if (pattern.empty() || from >= end || end - from < pattern.size())
        return std::nullopt;

    auto first = blob.begin() + static_cast<std::ptrdiff_t>(from);
    auto last = blob.begin() + static_cast<std::ptrdiff_t>(end);
    auto it = std::search(first, last,
                          std::boyer_moore_horspool_searcher(pattern.begin(), pattern.end()));
    if (it == last)
        return std::nullopt;
    return static_cast<size_t>(it - blob.begin());
}

bool bytes_at(const std::vector<uint8_t>& blob, size_t offset, const std::vector<uint8_t>& pattern) {
    if (offset > blob.size() || blob.size() - offset < pattern.size())
        return false;
    return std::equal(pattern.begin(), pattern.end(), blob.begin() + static_cast<std::ptrdiff_t>(offset));
}

bool ends_with(const std::vector<uint8_t>& blob, const std::vector<uint8_t>& pattern) {
    return blob.size() >= pattern.size() && bytes_at(blob, blob.size() - pattern.size(), pattern);
}

std::string compact_timestamp(std::time_t t) {
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y%m%d_%H%M%S");
    return oss.str();
}

std::string to_hex(uint64_t value)
{
   std::array<char, 24> buffer;
   auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                              value, 16);  // base 16

   std::string hex(buffer.data(), result.ptr);
   return hex;
}

std::string human_size(uint64_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (bytes >= GIB)
        oss << static_cast<double>(bytes) / static_cast<double>(GIB) << " GB";
    else
        oss << static_cast<double>(bytes) / static_cast<double>(MIB) << " MB";
    return oss.str();
}

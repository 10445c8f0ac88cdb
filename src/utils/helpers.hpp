#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <ctime>
#include <optional>

constexpr std::uint64_t KIB = 1024ULL;
constexpr std::uint64_t MIB = 1024ULL * KIB;
constexpr std::uint64_t GIB = 1024ULL * MIB;

//
// Big-endian readers
//
uint16_t read_be16(const std::vector<uint8_t>& blob, size_t offset);
uint32_t read_be32(const std::vector<uint8_t>& blob, size_t offset);
uint64_t read_be64(const std::vector<uint8_t>& blob, size_t offset);
uint32_t read_be24(const std::vector<uint8_t>& blob, size_t offset);

//
// Little-endian readers
//
uint32_t read_le32(const std::vector<uint8_t>& blob, size_t offset);

//
// Byte pattern search, returns the offset of the first match at or after `from`
//
std::optional<size_t> find_bytes(const std::vector<uint8_t>& blob,
                                 const std::vector<uint8_t>& pattern,
                                 size_t from,
                                 size_t until = SIZE_MAX);

bool bytes_at(const std::vector<uint8_t>& blob, size_t offset, const std::vector<uint8_t>& pattern);
bool ends_with(const std::vector<uint8_t>& blob, const std::vector<uint8_t>& pattern);

// Local time as YYYYmmdd_HHMMSS, used in artifact names
std::string compact_timestamp(std::time_t t);
std::string to_hex(uint64_t value);
std::string human_size(uint64_t bytes);

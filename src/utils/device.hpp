#pragma once
#include <cstdint>
#include <optional>
#include <string>

// On Linux device nodes are already raw; kept as the single place to map a
// user-supplied path to the node that gets opened.
std::string resolveRawDevicePath(const std::string& path);

// Size of a block device (BLKGETSIZE64) or a regular image file
std::optional<uint64_t> deviceSize(const std::string& path);

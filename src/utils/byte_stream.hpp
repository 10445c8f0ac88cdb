#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

enum class ReadStatus {
    Ok,           // `count` bytes delivered; zero means nothing available right now
    EndOfStream,  // no more data after the `count` bytes delivered
    Failed
};

// Sequential source of raw bytes: a device node, a disk image, or memory.
class ByteStream {
public:
    virtual ~ByteStream() = default;
    virtual std::string name() const = 0;
    virtual ReadStatus read(std::uint8_t* dst, size_t len, size_t& count) = 0;
    virtual std::string lastError() const { return {}; }
};

class StreamOpenError : public std::runtime_error {
public:
    enum class Reason {
        NotFound,
        PermissionDenied,
        Other
    };

    StreamOpenError(Reason reason, const std::string& what)
        : std::runtime_error(what), why(reason) {}

    Reason reason() const noexcept { return why; }

    // Maps the OS error behind a failed open to the reason shown to the user
    static Reason reasonFor(const std::error_code& ec);

private:
    Reason why;
};

class FileByteStream : public ByteStream {
public:
    // Throws StreamOpenError
    static std::unique_ptr<FileByteStream> open(const fs::path& path);

    std::string name() const override { return path.string(); }
    ReadStatus read(std::uint8_t* dst, size_t len, size_t& count) override;
    std::string lastError() const override { return error; }

private:
    FileByteStream(fs::path path, std::ifstream file);

    fs::path path;
    std::ifstream file;
    std::string error;
};

class MemoryByteStream : public ByteStream {
public:
    // `chunk` limits how much one read() returns; 0 means no limit
    explicit MemoryByteStream(std::vector<std::uint8_t> data, size_t chunk = 0);

    std::string name() const override { return "memory"; }
    ReadStatus read(std::uint8_t* dst, size_t len, size_t& count) override;

private:
    std::vector<std::uint8_t> data;
    size_t chunk;
    size_t position = 0;
};

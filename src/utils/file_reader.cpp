#include "byte_stream.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

StreamOpenError::Reason StreamOpenError::reasonFor(const std::error_code& ec) {
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
        return Reason::PermissionDenied;
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)
        return Reason::NotFound;
    return Reason::Other;
}

std::unique_ptr<FileByteStream> FileByteStream::open(const fs::path& path) {
    // exists() reports a lookup failure through ec, which is not the same as
    // the path being absent
    std::error_code ec;
    bool present = fs::exists(path, ec);
    if (ec) {
        throw StreamOpenError(StreamOpenError::reasonFor(ec),
                              "Cannot access " + path.string() + ": " + ec.message());
    }
    if (!present) {
        throw StreamOpenError(StreamOpenError::Reason::NotFound,
                              "Device not found: " + path.string());
    }

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        int err = errno;
        auto reason = err != 0 ? StreamOpenError::reasonFor(std::error_code(err, std::generic_category()))
                               : StreamOpenError::Reason::Other;
        std::string detail = err != 0 ? std::strerror(err) : "cannot open";
        throw StreamOpenError(reason, "Cannot open " + path.string() + ": " + detail);
    }
    return std::unique_ptr<FileByteStream>(new FileByteStream(path, std::move(file)));
}

FileByteStream::FileByteStream(fs::path path, std::ifstream file)
    : path(std::move(path)), file(std::move(file)) {}

ReadStatus FileByteStream::read(std::uint8_t* dst, size_t len, size_t& count) {
    errno = 0;
    file.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(len));
    count = static_cast<size_t>(file.gcount());
    if (file.bad()) {
        error = errno != 0 ? std::strerror(errno) : "I/O error";
        return ReadStatus::Failed;
    }
    if (file.eof())
        return ReadStatus::EndOfStream;
    return ReadStatus::Ok;
}

MemoryByteStream::MemoryByteStream(std::vector<std::uint8_t> data, size_t chunk)
    : data(std::move(data)), chunk(chunk) {}

ReadStatus MemoryByteStream::read(std::uint8_t* dst, size_t len, size_t& count) {
    size_t available = data.size() - position;
    count = std::min(len, available);
    if (chunk != 0)
        count = std::min(count, chunk);
    std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(position), count, dst);
    position += count;
    return position == data.size() ? ReadStatus::EndOfStream : ReadStatus::Ok;
}

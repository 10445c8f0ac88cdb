#include "block_source.hpp"

#include "carve_fixtures.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace {

    // Raises the cancel flag from inside the first read
    class CancellingStream : public ByteStream {
    public:
        explicit CancellingStream(std::atomic<bool>* cancel)
            : cancel(cancel) {}

        std::string name() const override { return "cancelling"; }

        ReadStatus read(uint8_t* dst, size_t len, size_t& count) override
        {
            cancel->store(true);
            count = len;
            std::fill_n(dst, len, 0x11);
            return ReadStatus::Ok;
        }

    private:
        std::atomic<bool>* cancel;
    };

}  // namespace


TEST(BlockSource, RejectsZeroBlockSize)
{
    MemoryByteStream input(make_filler(10));
    EXPECT_THROW(BlockSource(input, 0), std::invalid_argument);
}

TEST(BlockSource, CutsStreamIntoFixedBlocks)
{
    const Bytes data = make_filler(10);
    MemoryByteStream input(data);
    BlockSource source(input, 4);
    std::atomic<bool> cancel { false };

    Bytes joined;
    std::vector<size_t> sizes;
    for (;;) {
        BlockOutcome outcome = source.next(cancel);
        if (outcome.status != BlockStatus::Data) {
            EXPECT_EQ(outcome.status, BlockStatus::Exhausted);
            break;
        }
        EXPECT_EQ(outcome.block.index, sizes.size());
        sizes.push_back(outcome.block.data.size());
        append_all(&joined, outcome.block.data);
    }
    EXPECT_EQ(sizes, (std::vector<size_t> { 4, 4, 2 }));
    EXPECT_EQ(joined, data);
    EXPECT_EQ(source.blocksProduced(), 3u);
    EXPECT_EQ(source.next(cancel).status, BlockStatus::Exhausted);
}

TEST(BlockSource, FillsShortReads)
{
    MemoryByteStream input(make_filler(20), 3);
    BlockSource source(input, 8);
    std::atomic<bool> cancel { false };

    BlockOutcome outcome = source.next(cancel);
    ASSERT_EQ(outcome.status, BlockStatus::Data);
    EXPECT_EQ(outcome.block.data.size(), 8u);
}

TEST(BlockSource, EmptyStreamIsExhaustedImmediately)
{
    MemoryByteStream input(Bytes {});
    BlockSource source(input, 8);
    std::atomic<bool> cancel { false };
    EXPECT_EQ(source.next(cancel).status, BlockStatus::Exhausted);
    EXPECT_EQ(source.blocksProduced(), 0u);
}

TEST(BlockSource, EmptyReadsAreNotEndOfStream)
{
    ScriptedStream input(make_filler(6), { 0, 0, 6 });
    BlockSource source(input, 8, 5);
    std::atomic<bool> cancel { false };

    EXPECT_EQ(source.next(cancel).status, BlockStatus::Empty);
    EXPECT_EQ(source.next(cancel).status, BlockStatus::Empty);
    BlockOutcome outcome = source.next(cancel);
    ASSERT_EQ(outcome.status, BlockStatus::Data);
    EXPECT_EQ(outcome.block.index, 0u);
    EXPECT_EQ(outcome.block.data.size(), 6u);
}

TEST(BlockSource, GivesUpAfterConsecutiveEmptyReads)
{
    ScriptedStream input(make_filler(6), { 0, 0, 0, 0, 0, 0 });
    BlockSource source(input, 8, 3);
    std::atomic<bool> cancel { false };

    EXPECT_EQ(source.next(cancel).status, BlockStatus::Empty);
    EXPECT_EQ(source.next(cancel).status, BlockStatus::Empty);
    EXPECT_EQ(source.next(cancel).status, BlockStatus::Exhausted);
    EXPECT_EQ(source.next(cancel).status, BlockStatus::Exhausted);
    EXPECT_EQ(input.reads, 3u);
}

TEST(BlockSource, DataResetsEmptyReadCount)
{
    ScriptedStream input(make_filler(12), { 0, 0, 4, 0, 0, 4, 0, 0, 4 });
    BlockSource source(input, 4, 3);
    std::atomic<bool> cancel { false };

    size_t blocks = 0;
    for (int i = 0; i < 20; ++i) {
        BlockOutcome outcome = source.next(cancel);
        if (outcome.status == BlockStatus::Exhausted)
            break;
        if (outcome.status == BlockStatus::Data)
            ++blocks;
    }
    EXPECT_EQ(blocks, 3u);
}

TEST(BlockSource, ReadErrorCarriesMessage)
{
    ScriptedStream input(make_filler(16), { 4, -1 });
    BlockSource source(input, 4);
    std::atomic<bool> cancel { false };

    EXPECT_EQ(source.next(cancel).status, BlockStatus::Data);
    BlockOutcome outcome = source.next(cancel);
    EXPECT_EQ(outcome.status, BlockStatus::Error);
    EXPECT_EQ(outcome.message, "scripted failure");
    EXPECT_TRUE(outcome.block.data.empty());
}

TEST(BlockSource, CancelBeforeReadLeavesStreamUntouched)
{
    ScriptedStream input(make_filler(16), {});
    BlockSource source(input, 4);
    std::atomic<bool> cancel { true };

    EXPECT_EQ(source.next(cancel).status, BlockStatus::Cancelled);
    EXPECT_EQ(input.reads, 0u);
}

TEST(BlockSource, CancelDuringReadDropsTheBlock)
{
    std::atomic<bool> cancel { false };
    CancellingStream input(&cancel);
    BlockSource source(input, 4);

    BlockOutcome outcome = source.next(cancel);
    EXPECT_EQ(outcome.status, BlockStatus::Cancelled);
    EXPECT_TRUE(outcome.block.data.empty());
    EXPECT_EQ(source.blocksProduced(), 0u);
}

TEST(FileByteStream, MissingPathIsNotFound)
{
    TempDir dir;
    try {
        FileByteStream::open(dir.path() / "no_such_device");
        FAIL() << "expected StreamOpenError";
    } catch (const StreamOpenError& e) {
        EXPECT_EQ(e.reason(), StreamOpenError::Reason::NotFound);
    }
}

TEST(FileByteStream, OpenFailureReasonFollowsErrorCode)
{
    using Reason = StreamOpenError::Reason;
    EXPECT_EQ(StreamOpenError::reasonFor(std::make_error_code(std::errc::permission_denied)),
              Reason::PermissionDenied);
    EXPECT_EQ(StreamOpenError::reasonFor(std::make_error_code(std::errc::operation_not_permitted)),
              Reason::PermissionDenied);
    EXPECT_EQ(StreamOpenError::reasonFor(std::make_error_code(std::errc::no_such_file_or_directory)),
              Reason::NotFound);
    EXPECT_EQ(StreamOpenError::reasonFor(std::make_error_code(std::errc::io_error)), Reason::Other);
    EXPECT_EQ(StreamOpenError::reasonFor(std::error_code(EACCES, std::system_category())),
              Reason::PermissionDenied);
}

TEST(FileByteStream, PathUnderRegularFileIsNotFound)
{
    TempDir dir;
    const auto file = dir.path() / "plain";
    {
        std::ofstream out(file);
        out << "x";
    }
    try {
        FileByteStream::open(file / "child");
        FAIL() << "expected StreamOpenError";
    } catch (const StreamOpenError& e) {
        EXPECT_EQ(e.reason(), StreamOpenError::Reason::NotFound);
    }
}

TEST(FileByteStream, ReadsWholeFileInBlocks)
{
    TempDir dir;
    const Bytes data = make_filler(1000, 3);
    const auto path  = dir.path() / "disk.img";
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    auto stream = FileByteStream::open(path);
    EXPECT_EQ(stream->name(), path.string());
    BlockSource source(*stream, 256);
    std::atomic<bool> cancel { false };

    Bytes joined;
    BlockOutcome outcome;
    while ((outcome = source.next(cancel)).status == BlockStatus::Data) {
        append_all(&joined, outcome.block.data);
    }
    EXPECT_EQ(outcome.status, BlockStatus::Exhausted);
    EXPECT_EQ(joined, data);
    EXPECT_EQ(source.blocksProduced(), 4u);
}

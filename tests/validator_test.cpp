#include "validator.hpp"

#include "carve_fixtures.hpp"
#include "scanner.hpp"
#include "signature_registry.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

    class CountingValidator : public DeepValidator {
    public:
        bool verdict = true;
        int calls    = 0;
        std::string lastFormat;

        bool check(const std::vector<std::uint8_t>&, const std::string& format) override
        {
            ++calls;
            lastFormat = format;
            return verdict;
        }
    };

    class ThrowingValidator : public DeepValidator {
    public:
        bool check(const std::vector<std::uint8_t>&, const std::string&) override
        {
            throw std::out_of_range("decoder read past the buffer");
        }
    };

    struct DecoderFault {
        int code = 7;
    };

    class FaultingValidator : public DeepValidator {
    public:
        bool check(const std::vector<std::uint8_t>&, const std::string&) override
        {
            throw DecoderFault {};
        }
    };

}  // namespace


TEST(Validator, StructuralFailureSkipsDeepCheck)
{
    auto deep = std::make_shared<CountingValidator>();
    Validator validator(deep);
    auto jpeg = SignatureRegistry::instance().create("JPEG");

    Bytes small = make_jpeg(0);
    small.resize(100);
    append_all(&small, { 0xFF, 0xD9 });
    EXPECT_FALSE(validator.validate(*jpeg, small));

    Bytes no_footer = make_jpeg();
    no_footer.push_back(0x00);
    EXPECT_FALSE(validator.validate(*jpeg, no_footer));

    EXPECT_EQ(deep->calls, 0);
}

TEST(Validator, DeepCheckDecides)
{
    auto deep = std::make_shared<CountingValidator>();
    Validator validator(deep);
    auto png = SignatureRegistry::instance().create("PNG");

    EXPECT_TRUE(validator.validate(*png, make_png()));
    EXPECT_EQ(deep->calls, 1);
    EXPECT_EQ(deep->lastFormat, "PNG");

    deep->verdict = false;
    EXPECT_FALSE(validator.validate(*png, make_png()));
}

TEST(Validator, DeepCheckExceptionIsAFailure)
{
    Validator validator(std::make_shared<ThrowingValidator>());
    auto mp4 = SignatureRegistry::instance().create("MP4");
    EXPECT_FALSE(validator.validate(*mp4, make_mp4()));
}

TEST(Validator, NonStandardExceptionIsAFailure)
{
    Validator validator(std::make_shared<FaultingValidator>());
    auto jpeg = SignatureRegistry::instance().create("JPEG");
    bool verdict = true;
    EXPECT_NO_THROW(verdict = validator.validate(*jpeg, make_jpeg()));
    EXPECT_FALSE(verdict);
}

TEST(Validator, NonStandardExceptionDoesNotAbortScan)
{
    ScanConfig cfg;
    cfg.blockSize = 64;
    Scanner scanner(cfg, std::make_shared<FaultingValidator>());
    MemoryByteStream input(concat({ make_filler(20), make_jpeg(), make_filler(20) }));
    BlockSource source(input, cfg.blockSize);
    RecordingSink sink;
    NullObserver observer;
    std::atomic<bool> cancel { false };

    ScanResult result;
    EXPECT_NO_THROW(result = scanner.scan(source, sink, observer, cancel));
    EXPECT_EQ(result.status, ScanStatus::Completed);
    EXPECT_EQ(result.artifactsFound, 0u);
    EXPECT_EQ(result.artifactsRejected, 1u);
    EXPECT_TRUE(sink.artifacts.empty());
}

TEST(Validator, NoDeepCollaboratorMeansStructureOnly)
{
    Validator validator(nullptr);
    auto mkv = SignatureRegistry::instance().create("MKV");
    EXPECT_TRUE(validator.validate(*mkv, make_mkv(64, "dummy")));
    EXPECT_FALSE(validator.validate(*mkv, make_filler(80)));
}

TEST(Validator, DecoderValidatorCorroboratesEveryFormat)
{
    Validator validator(std::make_shared<DecoderValidator>());
    const auto& registry = SignatureRegistry::instance();

    EXPECT_TRUE(validator.validate(*registry.create("JPEG"), make_jpeg()));
    EXPECT_TRUE(validator.validate(*registry.create("PNG"), make_png()));
    EXPECT_TRUE(validator.validate(*registry.create("MP4"), make_mp4()));
    EXPECT_TRUE(validator.validate(*registry.create("MKV"), make_mkv()));
    EXPECT_TRUE(validator.validate(*registry.create("AVI"), make_avi()));
    EXPECT_TRUE(validator.validate(*registry.create("FLV"), make_flv()));

    EXPECT_FALSE(validator.validate(*registry.create("MKV"), make_mkv(64, "dummy")));
}

#include <gtest/gtest.h>
#include "layers/range_accessor.hpp"
#include "mock_accessor.hpp"

#include <limits>
#include <stdexcept>

using namespace OmniStore;
using namespace OmniStore::Testing;
using Layers::RangeAccessor;

namespace
{

constexpr std::string_view kDigits = "0123456789abcdefghij";

Storage::Capability WithoutRangeRead()
{
    auto capability       = Storage::Capability::All();
    capability.range_read = false;
    return capability;
}

std::string ReadWindow(Storage::IAccessor &accessor, std::optional<Storage::BytesRange> range)
{
    auto reader = accessor.Read(Storage::ReadArgs{Id("obj"), range, {}});
    EXPECT_TRUE(reader.has_value());
    if (!reader) {
        return {};
    }
    return ToString(Io::ReadToEnd(**reader).value());
}

}  // anonymous namespace

TEST(RangeAccessorTest, PushesRangesDownWhenSupported)
{
    auto mock = std::make_shared<MockAccessor>();
    mock->Put("obj", kDigits);
    RangeAccessor range(mock);

    EXPECT_EQ(ReadWindow(range, Storage::BytesRange{10, 5}), "abcde");

    auto ranges = mock->ReadRanges();
    ASSERT_EQ(ranges.size(), 1u);
    ASSERT_TRUE(ranges[0].has_value());
    EXPECT_EQ(*ranges[0], (Storage::BytesRange{10, 5}));
}

TEST(RangeAccessorTest, EmulatesRangesOnFullReads)
{
    auto mock = std::make_shared<MockAccessor>(WithoutRangeRead());
    mock->Put("obj", kDigits);
    RangeAccessor range(mock);

    EXPECT_TRUE(range.Info().capability.range_read);
    EXPECT_EQ(ReadWindow(range, Storage::BytesRange{10, 5}), "abcde");
    EXPECT_EQ(ReadWindow(range, Storage::BytesRange{18, std::nullopt}), "ij");
    EXPECT_EQ(ReadWindow(range, Storage::BytesRange{40, 3}), "");

    for (const auto &requested : mock->ReadRanges()) {
        EXPECT_FALSE(requested.has_value());
    }
}

TEST(RangeAccessorTest, FullRangeIsStripped)
{
    auto mock = std::make_shared<MockAccessor>(WithoutRangeRead());
    mock->Put("obj", kDigits);
    RangeAccessor range(mock);

    EXPECT_EQ(ReadWindow(range, Storage::BytesRange{0, std::nullopt}), kDigits);
    EXPECT_FALSE(mock->ReadRanges().front().has_value());
}

TEST(RangeAccessorTest, OverflowingRangeIsInvalidInput)
{
    auto mock = std::make_shared<MockAccessor>();
    mock->Put("obj", kDigits);
    RangeAccessor range(mock);

    auto reader = range.Read(Storage::ReadArgs{
        Id("obj"), Storage::BytesRange{std::numeric_limits<std::uint64_t>::max() - 1, 5}, {}
    });
    ASSERT_FALSE(reader.has_value());
    EXPECT_EQ(reader.error().Kind(), StorageErrc::InvalidInput);
    EXPECT_EQ(mock->Calls(Operation::Read), 0u);
}

TEST(RangeAccessorTest, ReadErrorsPassThrough)
{
    auto mock = std::make_shared<MockAccessor>(WithoutRangeRead());
    RangeAccessor range(mock);

    auto reader = range.Read(Storage::ReadArgs{Id("obj"), Storage::BytesRange{1, 1}, {}});
    ASSERT_FALSE(reader.has_value());
    EXPECT_EQ(reader.error().Kind(), StorageErrc::NotFound);
}

TEST(RangeAccessorTest, RequiresInner)
{
    EXPECT_THROW(RangeAccessor(nullptr), std::invalid_argument);
}

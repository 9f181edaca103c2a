#include <gtest/gtest.h>
#include "mock_accessor.hpp"
#include "services/memory/memory_accessor.hpp"

#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

using namespace OmniStore;
using namespace OmniStore::Testing;
using Services::MemoryAccessor;

namespace
{

class MemoryAccessorTest : public ::testing::Test
{
    protected:
    void SetUp() override { Build(Config::ServiceDefinition{}); }

    void Build(Config::ServiceDefinition definition)
    {
        memory = std::make_unique<MemoryAccessor>(definition);
    }

    Storage::StorageResult<Storage::ObjectMetadata> Put(
        std::string_view path, std::string_view content,
        std::optional<std::uint64_t> size_hint = std::nullopt
    )
    {
        auto bytes  = ToBytes(content);
        auto reader = Io::BufferReader::View(bytes);
        return memory->Write(Storage::WriteArgs{Id(path), size_hint, {}}, reader);
    }

    Storage::StorageResult<std::string> Get(
        std::string_view path, std::optional<Storage::BytesRange> range = std::nullopt
    )
    {
        auto reader = memory->Read(Storage::ReadArgs{Id(path), range, {}});
        if (!reader) {
            return std::unexpected(reader.error());
        }
        auto data = Io::ReadToEnd(**reader);
        if (!data) {
            return std::unexpected(data.error());
        }
        return ToString(*data);
    }

    std::vector<std::string> ListNames(std::string_view dir)
    {
        std::vector<std::string> names;
        auto lister = memory->List(Storage::ListArgs{Id(dir), {}});
        EXPECT_TRUE(lister.has_value());
        if (!lister) {
            return names;
        }
        auto entries = Io::CollectAll(**lister);
        EXPECT_TRUE(entries.has_value());
        for (const auto &entry : entries.value_or(std::vector<Storage::DirEntry>{})) {
            names.push_back(entry.id.Str());
        }
        return names;
    }

    std::unique_ptr<MemoryAccessor> memory;
};

}  // anonymous namespace

TEST_F(MemoryAccessorTest, InfoAdvertisesEveryOperation)
{
    auto info = memory->Info();
    EXPECT_EQ(info.scheme, Storage::Scheme::Memory);
    EXPECT_EQ(info.name, "memory");
    EXPECT_TRUE(info.capability.read && info.capability.write && info.capability.list);
    EXPECT_TRUE(info.capability.range_read);
    EXPECT_FALSE(info.capability.needs_credential);
}

TEST_F(MemoryAccessorTest, WriteThenReadBack)
{
    auto meta = Put("a/b.txt", "hello");
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->content_length, 5u);
    EXPECT_TRUE(meta->etag.has_value());
    EXPECT_TRUE(meta->last_modified.has_value());

    EXPECT_EQ(Get("a/b.txt").value(), "hello");

    auto stat = memory->Stat(Storage::StatArgs{Id("a/b.txt"), {}});
    ASSERT_TRUE(stat.has_value());
    EXPECT_EQ(*stat, *meta);
}

TEST_F(MemoryAccessorTest, OverwriteReplacesContentAndEtag)
{
    auto first  = Put("obj", "first version");
    auto second = Put("obj", "second");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first->etag, second->etag);
    EXPECT_EQ(Get("obj").value(), "second");
    EXPECT_EQ(memory->ObjectCount(), 1u);
}

TEST_F(MemoryAccessorTest, OpenReaderKeepsItsSnapshot)
{
    ASSERT_TRUE(Put("obj", "old").has_value());
    auto reader = memory->Read(Storage::ReadArgs{Id("obj"), std::nullopt, {}});
    ASSERT_TRUE(reader.has_value());

    ASSERT_TRUE(Put("obj", "new!").has_value());
    EXPECT_EQ(ToString(Io::ReadToEnd(**reader).value()), "old");
}

TEST_F(MemoryAccessorTest, RangedReads)
{
    ASSERT_TRUE(Put("obj", "0123456789").has_value());
    EXPECT_EQ(Get("obj", Storage::BytesRange{2, 3}).value(), "234");
    EXPECT_EQ(Get("obj", Storage::BytesRange{7, 100}).value(), "789");
    EXPECT_EQ(Get("obj", Storage::BytesRange{4, std::nullopt}).value(), "456789");
    EXPECT_EQ(Get("obj", Storage::BytesRange{10, 4}).value(), "");

    auto past_end = Get("obj", Storage::BytesRange{11, 1});
    ASSERT_FALSE(past_end.has_value());
    EXPECT_EQ(past_end.error().Kind(), StorageErrc::InvalidInput);
}

TEST_F(MemoryAccessorTest, ReadFailures)
{
    auto missing = Get("nope");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().Kind(), StorageErrc::NotFound);
    EXPECT_EQ(missing.error().Path(), "nope");

    auto directory = Get("dir/");
    ASSERT_FALSE(directory.has_value());
    EXPECT_EQ(directory.error().Kind(), StorageErrc::InvalidInput);
}

TEST_F(MemoryAccessorTest, SizeHintMismatchKeepsPreviousObject)
{
    ASSERT_TRUE(Put("obj", "keep me").has_value());
    auto bad = Put("obj", "short", 99);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().Kind(), StorageErrc::InvalidInput);
    EXPECT_EQ(Get("obj").value(), "keep me");
}

TEST_F(MemoryAccessorTest, MaxWriteSizeIsEnforced)
{
    Build(Config::ServiceDefinition{.max_write_size = 4});
    EXPECT_EQ(memory->Info().capability.max_write_size, 4u);

    ASSERT_TRUE(Put("small", "1234").has_value());
    auto big = Put("big", "12345");
    ASSERT_FALSE(big.has_value());
    EXPECT_EQ(big.error().Kind(), StorageErrc::InvalidInput);
    EXPECT_EQ(Get("big").error().Kind(), StorageErrc::NotFound);
}

TEST_F(MemoryAccessorTest, WritingADirectoryPathIsInvalid)
{
    auto res = Put("dir/", "x");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().Kind(), StorageErrc::InvalidInput);
}

TEST_F(MemoryAccessorTest, DeleteIsIdempotent)
{
    ASSERT_TRUE(Put("obj", "x").has_value());
    ASSERT_TRUE(memory->Delete(Storage::DeleteArgs{Id("obj"), {}}).has_value());
    ASSERT_TRUE(memory->Delete(Storage::DeleteArgs{Id("obj"), {}}).has_value());
    EXPECT_EQ(Get("obj").error().Kind(), StorageErrc::NotFound);
}

TEST_F(MemoryAccessorTest, DeleteDirectoryRules)
{
    ASSERT_TRUE(memory->CreateDir(Storage::CreateDirArgs{Id("full/"), {}}).has_value());
    ASSERT_TRUE(Put("full/child", "x").has_value());
    ASSERT_TRUE(memory->CreateDir(Storage::CreateDirArgs{Id("empty/"), {}}).has_value());

    auto not_empty = memory->Delete(Storage::DeleteArgs{Id("full/"), {}});
    ASSERT_FALSE(not_empty.has_value());
    EXPECT_EQ(not_empty.error().Kind(), StorageErrc::InvalidInput);

    EXPECT_TRUE(memory->Delete(Storage::DeleteArgs{Id("empty/"), {}}).has_value());
    EXPECT_EQ(memory->Stat(Storage::StatArgs{Id("empty/"), {}}).error().Kind(), StorageErrc::NotFound);

    auto root = memory->Delete(Storage::DeleteArgs{Storage::ObjectId::Root(), {}});
    ASSERT_FALSE(root.has_value());
    EXPECT_EQ(root.error().Kind(), StorageErrc::InvalidInput);
}

TEST_F(MemoryAccessorTest, StatDirectories)
{
    ASSERT_TRUE(Put("implicit/leaf", "x").has_value());
    ASSERT_TRUE(memory->CreateDir(Storage::CreateDirArgs{Id("explicit/"), {}}).has_value());

    EXPECT_TRUE(memory->Stat(Storage::StatArgs{Storage::ObjectId::Root(), {}})->is_directory);
    EXPECT_TRUE(memory->Stat(Storage::StatArgs{Id("implicit/"), {}})->is_directory);
    EXPECT_TRUE(memory->Stat(Storage::StatArgs{Id("explicit/"), {}})->is_directory);
    EXPECT_EQ(memory->Stat(Storage::StatArgs{Id("ghost/"), {}}).error().Kind(), StorageErrc::NotFound);
    EXPECT_EQ(memory->Stat(Storage::StatArgs{Id("implicit"), {}}).error().Kind(), StorageErrc::NotFound);
}

TEST_F(MemoryAccessorTest, ListShowsDirectChildrenOnce)
{
    ASSERT_TRUE(Put("a.txt", "1").has_value());
    ASSERT_TRUE(Put("dir/x", "2").has_value());
    ASSERT_TRUE(Put("dir/y", "3").has_value());
    ASSERT_TRUE(Put("dir/nested/z", "4").has_value());
    ASSERT_TRUE(memory->CreateDir(Storage::CreateDirArgs{Id("dir2/"), {}}).has_value());

    EXPECT_EQ(ListNames("/"), (std::vector<std::string>{"a.txt", "dir/", "dir2/"}));
    EXPECT_EQ(ListNames("dir/"), (std::vector<std::string>{"dir/nested/", "dir/x", "dir/y"}));
    EXPECT_TRUE(ListNames("dir2/").empty());
    EXPECT_TRUE(ListNames("missing/").empty());
}

TEST_F(MemoryAccessorTest, ListPagesAcrossSubdirectories)
{
    Build(Config::ServiceDefinition{.list_page_size = 1});
    for (const char *key : {"d/a", "d/sub/1", "d/sub/2", "d/sub/3", "d/z"}) {
        ASSERT_TRUE(Put(key, "x").has_value());
    }

    auto lister = memory->List(Storage::ListArgs{Id("d/"), {}});
    ASSERT_TRUE(lister.has_value());
    auto *paged = dynamic_cast<Io::PagedLister *>(lister->get());
    ASSERT_NE(paged, nullptr);

    auto entries = Io::CollectAll(*paged);
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 3u);
    EXPECT_EQ((*entries)[0].id.Str(), "d/a");
    EXPECT_EQ((*entries)[1].id.Str(), "d/sub/");
    EXPECT_TRUE((*entries)[1].metadata.is_directory);
    EXPECT_EQ((*entries)[2].id.Str(), "d/z");
    EXPECT_EQ(paged->FetchCount(), 3u);
}

TEST_F(MemoryAccessorTest, ListOfAFileIsInvalid)
{
    auto lister = memory->List(Storage::ListArgs{Id("file"), {}});
    ASSERT_FALSE(lister.has_value());
    EXPECT_EQ(lister.error().Kind(), StorageErrc::InvalidInput);
}

TEST_F(MemoryAccessorTest, CreateDirIsIdempotent)
{
    ASSERT_TRUE(memory->CreateDir(Storage::CreateDirArgs{Id("a/b/"), {}}).has_value());
    ASSERT_TRUE(memory->CreateDir(Storage::CreateDirArgs{Id("a/b/"), {}}).has_value());
    ASSERT_TRUE(memory->CreateDir(Storage::CreateDirArgs{Storage::ObjectId::Root(), {}}).has_value());
    EXPECT_EQ(memory->ObjectCount(), 1u);

    auto file_path = memory->CreateDir(Storage::CreateDirArgs{Id("a/c"), {}});
    ASSERT_FALSE(file_path.has_value());
    EXPECT_EQ(file_path.error().Kind(), StorageErrc::InvalidInput);
}

TEST_F(MemoryAccessorTest, CancelledCallsFail)
{
    std::stop_source source;
    source.request_stop();
    auto res = memory->Stat(Storage::StatArgs{Id("obj"), source.get_token()});
    ASSERT_FALSE(res.has_value());
    EXPECT_TRUE(Storage::IsCancelled(res.error()));
}

TEST(MemoryAccessorConstructionTest, ZeroPageSizeIsRejected)
{
    EXPECT_THROW(MemoryAccessor(Config::ServiceDefinition{.list_page_size = 0}), std::invalid_argument);
}

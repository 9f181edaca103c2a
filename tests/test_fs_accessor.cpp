#include <gtest/gtest.h>
#include "mock_accessor.hpp"
#include "services/fs/fs_accessor.hpp"

#include <unistd.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using namespace OmniStore;
using namespace OmniStore::Testing;
using Services::FsAccessor;

namespace
{

class FsAccessorTest : public ::testing::Test
{
    protected:
    void SetUp() override
    {
        test_dir = fs::temp_directory_path() /
                   ("omnistore_fs_test_" + std::to_string(::getpid()) + "_" +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_dir);
        Build(std::nullopt);
    }

    void TearDown() override { fs::remove_all(test_dir); }

    void Build(std::optional<std::uint64_t> max_write_size)
    {
        Config::ServiceDefinition definition{
            .type = Storage::Scheme::Fs, .root = test_dir / "root", .max_write_size = max_write_size
        };
        accessor = std::make_unique<FsAccessor>(definition);
        ASSERT_TRUE(accessor->Initialize().has_value());
    }

    fs::path Root() const { return test_dir / "root"; }

    static void WriteTextFile(const fs::path &path, const std::string &content)
    {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    Storage::StorageResult<Storage::ObjectMetadata> Put(
        std::string_view path, std::string_view content,
        std::optional<std::uint64_t> size_hint = std::nullopt
    )
    {
        auto bytes  = ToBytes(content);
        auto reader = Io::BufferReader::View(bytes);
        return accessor->Write(Storage::WriteArgs{Id(path), size_hint, {}}, reader);
    }

    Storage::StorageResult<std::string> Get(
        std::string_view path, std::optional<Storage::BytesRange> range = std::nullopt
    )
    {
        auto reader = accessor->Read(Storage::ReadArgs{Id(path), range, {}});
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
        auto lister = accessor->List(Storage::ListArgs{Id(dir), {}});
        EXPECT_TRUE(lister.has_value());
        if (!lister) {
            return names;
        }
        auto entries = Io::CollectAll(**lister);
        EXPECT_TRUE(entries.has_value());
        for (const auto &entry : entries.value_or(std::vector<Storage::DirEntry>{})) {
            names.push_back(entry.id.Str());
        }
        std::ranges::sort(names);
        return names;
    }

    fs::path test_dir;
    std::unique_ptr<FsAccessor> accessor;
};

}  // anonymous namespace

TEST_F(FsAccessorTest, InitializeCreatesTheRoot)
{
    EXPECT_TRUE(fs::is_directory(Root()));
    EXPECT_EQ(accessor->Info().scheme, Storage::Scheme::Fs);
    EXPECT_EQ(accessor->Info().root, fs::absolute(Root()).lexically_normal().string());
}

TEST_F(FsAccessorTest, InitializeRejectsAFileRoot)
{
    WriteTextFile(test_dir / "plain", "x");
    FsAccessor file_root(Config::ServiceDefinition{.type = Storage::Scheme::Fs, .root = test_dir / "plain"});
    auto res = file_root.Initialize();
    ASSERT_FALSE(res.has_value());
}

TEST_F(FsAccessorTest, EmptyRootIsRejected)
{
    EXPECT_THROW(FsAccessor(Config::ServiceDefinition{.type = Storage::Scheme::Fs}), std::invalid_argument);
}

TEST_F(FsAccessorTest, WriteCreatesParentsAndReadsBack)
{
    auto meta = Put("a/b/c.txt", "file body");
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->content_length, 9u);
    ASSERT_TRUE(meta->etag.has_value());
    EXPECT_TRUE(meta->etag->starts_with("W/\""));

    EXPECT_TRUE(fs::is_regular_file(Root() / "a/b/c.txt"));
    EXPECT_EQ(Get("a/b/c.txt").value(), "file body");

    auto stat = accessor->Stat(Storage::StatArgs{Id("a/b/c.txt"), {}});
    ASSERT_TRUE(stat.has_value());
    EXPECT_FALSE(stat->is_directory);
    EXPECT_EQ(stat->content_length, 9u);
}

TEST_F(FsAccessorTest, FailedWriteLeavesNoTraceAndKeepsOldContent)
{
    ASSERT_TRUE(Put("obj", "original").has_value());
    auto bad = Put("obj", "replacement", 3);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().Kind(), StorageErrc::InvalidInput);
    EXPECT_EQ(Get("obj").value(), "original");

    std::vector<std::string> on_disk;
    for (const auto &entry : fs::directory_iterator(Root())) {
        on_disk.push_back(entry.path().filename().string());
    }
    EXPECT_EQ(on_disk, std::vector<std::string>{"obj"});
}

TEST_F(FsAccessorTest, MaxWriteSizeIsEnforced)
{
    Build(8);
    ASSERT_TRUE(Put("fits", "12345678").has_value());
    auto big = Put("too-big", "123456789");
    ASSERT_FALSE(big.has_value());
    EXPECT_EQ(big.error().Kind(), StorageErrc::InvalidInput);
    EXPECT_FALSE(fs::exists(Root() / "too-big"));
}

TEST_F(FsAccessorTest, RangedReads)
{
    ASSERT_TRUE(Put("obj", "0123456789").has_value());
    EXPECT_EQ(Get("obj", Storage::BytesRange{3, 4}).value(), "3456");
    EXPECT_EQ(Get("obj", Storage::BytesRange{8, 50}).value(), "89");
    EXPECT_EQ(Get("obj", Storage::BytesRange{10, std::nullopt}).value(), "");

    auto past_end = Get("obj", Storage::BytesRange{11, 1});
    ASSERT_FALSE(past_end.has_value());
    EXPECT_EQ(past_end.error().Kind(), StorageErrc::InvalidInput);
}

TEST_F(FsAccessorTest, ReadFailuresAreClassified)
{
    EXPECT_EQ(Get("missing").error().Kind(), StorageErrc::NotFound);

    ASSERT_TRUE(Put("file", "x").has_value());
    EXPECT_EQ(Get("file/under").error().Kind(), StorageErrc::NotFound);

    fs::create_directories(Root() / "dir");
    EXPECT_EQ(Get("dir").error().Kind(), StorageErrc::InvalidInput);
    EXPECT_EQ(Get("dir/").error().Kind(), StorageErrc::InvalidInput);
}

TEST_F(FsAccessorTest, DeleteSemantics)
{
    ASSERT_TRUE(Put("obj", "x").has_value());
    ASSERT_TRUE(accessor->Delete(Storage::DeleteArgs{Id("obj"), {}}).has_value());
    EXPECT_FALSE(fs::exists(Root() / "obj"));
    EXPECT_TRUE(accessor->Delete(Storage::DeleteArgs{Id("obj"), {}}).has_value());

    ASSERT_TRUE(Put("full/child", "x").has_value());
    auto not_empty = accessor->Delete(Storage::DeleteArgs{Id("full/"), {}});
    ASSERT_FALSE(not_empty.has_value());
    EXPECT_EQ(not_empty.error().Kind(), StorageErrc::InvalidInput);

    auto dir_as_file = accessor->Delete(Storage::DeleteArgs{Id("full"), {}});
    ASSERT_FALSE(dir_as_file.has_value());
    EXPECT_EQ(dir_as_file.error().Kind(), StorageErrc::InvalidInput);

    fs::create_directories(Root() / "empty");
    EXPECT_TRUE(accessor->Delete(Storage::DeleteArgs{Id("empty/"), {}}).has_value());
    EXPECT_FALSE(fs::exists(Root() / "empty"));

    auto root = accessor->Delete(Storage::DeleteArgs{Storage::ObjectId::Root(), {}});
    ASSERT_FALSE(root.has_value());
    EXPECT_EQ(root.error().Kind(), StorageErrc::InvalidInput);
}

TEST_F(FsAccessorTest, StatDistinguishesFilesAndDirectories)
{
    ASSERT_TRUE(Put("dir/file", "abc").has_value());
    EXPECT_TRUE(accessor->Stat(Storage::StatArgs{Id("dir/"), {}})->is_directory);
    EXPECT_TRUE(accessor->Stat(Storage::StatArgs{Storage::ObjectId::Root(), {}})->is_directory);
    EXPECT_EQ(
        accessor->Stat(Storage::StatArgs{Id("dir/file/"), {}}).error().Kind(), StorageErrc::NotFound
    );
    EXPECT_EQ(
        accessor->Stat(Storage::StatArgs{Id("nothing"), {}}).error().Kind(), StorageErrc::NotFound
    );
}

TEST_F(FsAccessorTest, ListReturnsOneLevelAndHidesTempFiles)
{
    ASSERT_TRUE(Put("top.txt", "1").has_value());
    ASSERT_TRUE(Put("sub/inner.txt", "2").has_value());
    WriteTextFile(Root() / (std::string(FsAccessor::kTempPrefix) + "leftover"), "partial");

    EXPECT_EQ(ListNames("/"), (std::vector<std::string>{"sub/", "top.txt"}));
    EXPECT_EQ(ListNames("sub/"), (std::vector<std::string>{"sub/inner.txt"}));
}

TEST_F(FsAccessorTest, ListFailures)
{
    auto missing = accessor->List(Storage::ListArgs{Id("nope/"), {}});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().Kind(), StorageErrc::NotFound);

    ASSERT_TRUE(Put("file", "x").has_value());
    auto file_as_dir = accessor->List(Storage::ListArgs{Id("file/"), {}});
    ASSERT_FALSE(file_as_dir.has_value());
    EXPECT_EQ(file_as_dir.error().Kind(), StorageErrc::InvalidInput);
}

TEST_F(FsAccessorTest, CreateDirIsIdempotent)
{
    ASSERT_TRUE(accessor->CreateDir(Storage::CreateDirArgs{Id("x/y/z/"), {}}).has_value());
    ASSERT_TRUE(accessor->CreateDir(Storage::CreateDirArgs{Id("x/y/z/"), {}}).has_value());
    EXPECT_TRUE(fs::is_directory(Root() / "x/y/z"));

    ASSERT_TRUE(Put("occupied", "x").has_value());
    auto blocked = accessor->CreateDir(Storage::CreateDirArgs{Id("occupied/"), {}});
    ASSERT_FALSE(blocked.has_value());
    EXPECT_EQ(blocked.error().Kind(), StorageErrc::AlreadyExists);
}

TEST_F(FsAccessorTest, PathsStayInsideTheRoot)
{
    auto full = accessor->GetFullPath(Id("a/b/"));
    EXPECT_EQ(full, fs::absolute(Root()).lexically_normal() / "a/b");
    EXPECT_EQ(accessor->GetFullPath(Storage::ObjectId::Root()), fs::absolute(Root()).lexically_normal());
}

#include <gtest/gtest.h>
#include "storage/storage_error.hpp"

#include <cerrno>

using namespace OmniStore::Storage;

TEST(StorageErrorTest, OnlyRateLimitedAndUnavailableAreRetryable)
{
    EXPECT_TRUE(IsRetryable(StorageErrc::RateLimited));
    EXPECT_TRUE(IsRetryable(StorageErrc::Unavailable));

    for (auto kind :
         {StorageErrc::NotFound, StorageErrc::AlreadyExists, StorageErrc::PermissionDenied,
          StorageErrc::InvalidPath, StorageErrc::InvalidInput, StorageErrc::Unsupported,
          StorageErrc::Unexpected}) {
        EXPECT_FALSE(IsRetryable(kind)) << make_error_code(kind).message();
    }
}

TEST(StorageErrorTest, CarriesOperationPathAndDetail)
{
    StorageError error(StorageErrc::NotFound, Operation::Stat, "a/b.txt", "no such key");
    EXPECT_EQ(error.Kind(), StorageErrc::NotFound);
    EXPECT_EQ(error.Op(), Operation::Stat);
    EXPECT_EQ(error.Path(), "a/b.txt");
    EXPECT_EQ(error.Detail(), "no such key");
    EXPECT_FALSE(error.IsRetryable());
    EXPECT_EQ(error.ToString(), "stat a/b.txt: Object not found (no such key)");
}

TEST(StorageErrorTest, ConvertsToErrorCode)
{
    std::error_code ec = StorageErrc::Unavailable;
    EXPECT_EQ(ec.category().name(), std::string("OmniStore::Storage"));
    EXPECT_EQ(ec, make_error_code(StorageErrc::Unavailable));
}

TEST(StorageErrorTest, WithKindKeepsContextAndPrependsNote)
{
    StorageError error(StorageErrc::Unavailable, Operation::Write, "x", "timeout");
    auto retagged = error.WithKind(StorageErrc::Unexpected, "not restartable");
    EXPECT_EQ(retagged.Kind(), StorageErrc::Unexpected);
    EXPECT_EQ(retagged.Op(), Operation::Write);
    EXPECT_EQ(retagged.Path(), "x");
    EXPECT_EQ(retagged.Detail(), "not restartable: timeout");
}

TEST(StorageErrorTest, CancellationIsUnexpected)
{
    auto cancelled = MakeCancelledError(Operation::List, "dir/");
    EXPECT_EQ(cancelled.error().Kind(), StorageErrc::Unexpected);
    EXPECT_TRUE(IsCancelled(cancelled.error()));
    EXPECT_FALSE(IsCancelled(StorageError(StorageErrc::Unexpected, Operation::List, "dir/", "boom")));
}

TEST(StorageErrorTest, ClassifiesErrno)
{
    EXPECT_EQ(ErrnoToStorageErrc(ENOENT), StorageErrc::NotFound);
    EXPECT_EQ(ErrnoToStorageErrc(EACCES), StorageErrc::PermissionDenied);
    EXPECT_EQ(ErrnoToStorageErrc(EEXIST), StorageErrc::AlreadyExists);
    EXPECT_EQ(ErrnoToStorageErrc(ENOTEMPTY), StorageErrc::InvalidInput);
    EXPECT_EQ(ErrnoToStorageErrc(ENAMETOOLONG), StorageErrc::InvalidPath);
    EXPECT_EQ(ErrnoToStorageErrc(EAGAIN), StorageErrc::Unavailable);
    EXPECT_EQ(ErrnoToStorageErrc(EIO), StorageErrc::Unexpected);
}

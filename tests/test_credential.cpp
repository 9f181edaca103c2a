#include <gtest/gtest.h>
#include "credential/credential_resolver.hpp"
#include "layers/credential_accessor.hpp"
#include "mock_accessor.hpp"

#include <map>
#include <stop_token>
#include <string>

using namespace OmniStore;
using namespace OmniStore::Testing;
using Credential::CachingCredentialResolver;
using Credential::EnvCredentialResolver;
using Credential::StaticCredentialResolver;
using std::chrono::seconds;

namespace
{

Credential::Credential MakeKey(const std::string &id)
{
    return Credential::Credential{
        .access_key_id = id, .secret_access_key = "secret-" + id, .region = "eu-central-1"
    };
}

// Hands out scripted results and counts how often it was asked
class ScriptedResolver : public Credential::ICredentialResolver
{
    public:
    Storage::StorageResult<Credential::Credential> Resolve(std::stop_token) override
    {
        ++calls;
        if (!results.empty()) {
            auto next = results.front();
            results.erase(results.begin());
            return next;
        }
        return MakeKey("key-" + std::to_string(calls));
    }

    std::vector<Storage::StorageResult<Credential::Credential>> results;
    int calls = 0;
};

struct FakeClock {
    std::chrono::system_clock::time_point now{std::chrono::seconds(1'700'000'000)};

    CachingCredentialResolver::Clock Source()
    {
        return [this] {
            return now;
        };
    }
};

}  // anonymous namespace

//------------------------------------------------------------------------------//
// Resolvers
//------------------------------------------------------------------------------//

TEST(CredentialResolverTest, ClassifiesResolutionFailures)
{
    using Storage::StorageError;
    auto kind_of = [](StorageErrc kind) {
        return Credential::ClassifyResolutionFailure(StorageError(kind, Operation::Stat, {})).Kind();
    };
    EXPECT_EQ(kind_of(StorageErrc::PermissionDenied), StorageErrc::PermissionDenied);
    EXPECT_EQ(kind_of(StorageErrc::Unavailable), StorageErrc::Unavailable);
    EXPECT_EQ(kind_of(StorageErrc::RateLimited), StorageErrc::Unavailable);
    EXPECT_EQ(kind_of(StorageErrc::NotFound), StorageErrc::PermissionDenied);
    EXPECT_EQ(kind_of(StorageErrc::Unexpected), StorageErrc::PermissionDenied);

    auto cancelled = Storage::MakeCancelledError(Operation::Stat, "obj").error();
    EXPECT_TRUE(Storage::IsCancelled(Credential::ClassifyResolutionFailure(cancelled)));
}

TEST(CredentialResolverTest, StaticResolverNeedsKeyAndSecret)
{
    StaticCredentialResolver complete(MakeKey("AKIA"));
    auto cred = complete.Resolve({});
    ASSERT_TRUE(cred.has_value());
    EXPECT_EQ(cred->access_key_id, "AKIA");

    StaticCredentialResolver incomplete(Credential::Credential{.access_key_id = "AKIA"});
    auto missing = incomplete.Resolve({});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().Kind(), StorageErrc::PermissionDenied);
}

TEST(CredentialResolverTest, EnvResolverReadsVariables)
{
    std::map<std::string, std::string> env = {
        {    "OMNISTORE_ACCESS_KEY_ID",    "env-key"},
        {"OMNISTORE_SECRET_ACCESS_KEY", "env-secret"},
        {           "OMNISTORE_REGION",  "us-east-1"},
    };
    EnvCredentialResolver resolver([&](const char *name) -> std::optional<std::string> {
        auto it = env.find(name);
        if (it == env.end()) {
            return std::nullopt;
        }
        return it->second;
    });

    auto cred = resolver.Resolve({});
    ASSERT_TRUE(cred.has_value());
    EXPECT_EQ(cred->access_key_id, "env-key");
    EXPECT_EQ(cred->secret_access_key, "env-secret");
    EXPECT_EQ(cred->region, "us-east-1");
    EXPECT_TRUE(cred->session_token.empty());

    env.erase("OMNISTORE_SECRET_ACCESS_KEY");
    auto missing = resolver.Resolve({});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().Kind(), StorageErrc::PermissionDenied);
}

TEST(CachingCredentialResolverTest, RefreshesOnlyAfterTtl)
{
    auto inner = std::make_shared<ScriptedResolver>();
    FakeClock clock;
    CachingCredentialResolver cache(inner, seconds(900), clock.Source());

    EXPECT_EQ(cache.Resolve({})->access_key_id, "key-1");
    clock.now += seconds(899);
    EXPECT_EQ(cache.Resolve({})->access_key_id, "key-1");
    EXPECT_EQ(inner->calls, 1);

    clock.now += seconds(1);
    EXPECT_EQ(cache.Resolve({})->access_key_id, "key-2");
    EXPECT_EQ(inner->calls, 2);
    EXPECT_EQ(cache.RefreshCount(), 2u);
}

TEST(CachingCredentialResolverTest, HonorsCredentialExpiry)
{
    auto inner = std::make_shared<ScriptedResolver>();
    FakeClock clock;
    auto short_lived       = MakeKey("session");
    short_lived.expires_at = clock.now + seconds(60);
    inner->results.push_back(short_lived);
    CachingCredentialResolver cache(inner, seconds(900), clock.Source());

    EXPECT_EQ(cache.Resolve({})->access_key_id, "session");
    clock.now += seconds(61);
    EXPECT_EQ(cache.Resolve({})->access_key_id, "key-2");
}

TEST(CachingCredentialResolverTest, FailuresAreNotCached)
{
    auto inner = std::make_shared<ScriptedResolver>();
    inner->results.push_back(
        Storage::MakeError(StorageErrc::Unavailable, Operation::Stat, {}, "metadata service down")
    );
    FakeClock clock;
    CachingCredentialResolver cache(inner, seconds(900), clock.Source());

    auto first = cache.Resolve({});
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error().Kind(), StorageErrc::Unavailable);

    auto second = cache.Resolve({});
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(inner->calls, 2);
}

TEST(CachingCredentialResolverTest, InvalidateForcesRefresh)
{
    auto inner = std::make_shared<ScriptedResolver>();
    CachingCredentialResolver cache(inner);

    ASSERT_TRUE(cache.Resolve({}).has_value());
    cache.Invalidate();
    ASSERT_TRUE(cache.Resolve({}).has_value());
    EXPECT_EQ(inner->calls, 2);
}

//------------------------------------------------------------------------------//
// CredentialAccessor
//------------------------------------------------------------------------------//

TEST(CredentialAccessorTest, AuthorizesOncePerCredential)
{
    auto capability             = Storage::Capability::All();
    capability.needs_credential = true;
    auto mock                   = std::make_shared<MockAccessor>(capability);
    mock->Put("obj", "data");

    auto resolver = std::make_shared<StaticCredentialResolver>(MakeKey("AKIA"));
    Layers::CredentialAccessor accessor(mock, resolver);

    ASSERT_TRUE(accessor.Stat(Storage::StatArgs{Id("obj"), {}}).has_value());
    ASSERT_TRUE(accessor.Stat(Storage::StatArgs{Id("obj"), {}}).has_value());

    auto authorized = mock->AuthorizedWith();
    ASSERT_EQ(authorized.size(), 1u);
    EXPECT_EQ(authorized.front().access_key_id, "AKIA");
}

TEST(CredentialAccessorTest, RotatedCredentialIsHandedToBackend)
{
    auto mock     = std::make_shared<MockAccessor>();
    auto inner    = std::make_shared<ScriptedResolver>();
    FakeClock clock;
    auto cache    = std::make_shared<CachingCredentialResolver>(inner, seconds(10), clock.Source());
    Layers::CredentialAccessor accessor(mock, cache);

    ASSERT_TRUE(accessor.CreateDir(Storage::CreateDirArgs{Id("a/"), {}}).has_value());
    clock.now += seconds(11);
    ASSERT_TRUE(accessor.CreateDir(Storage::CreateDirArgs{Id("a/"), {}}).has_value());

    auto authorized = mock->AuthorizedWith();
    ASSERT_EQ(authorized.size(), 2u);
    EXPECT_EQ(authorized[0].access_key_id, "key-1");
    EXPECT_EQ(authorized[1].access_key_id, "key-2");
}

TEST(CredentialAccessorTest, ResolutionFailureStopsTheRequest)
{
    auto mock     = std::make_shared<MockAccessor>();
    auto resolver = std::make_shared<StaticCredentialResolver>(Credential::Credential{});
    Layers::CredentialAccessor accessor(mock, resolver);

    auto res = accessor.Delete(Storage::DeleteArgs{Id("x/y"), {}});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().Kind(), StorageErrc::PermissionDenied);
    EXPECT_EQ(res.error().Op(), Operation::Delete);
    EXPECT_EQ(res.error().Path(), "x/y");
    EXPECT_EQ(mock->TotalCalls(), 0u);
}

TEST(CredentialAccessorTest, TransientResolutionFailureStaysRetryable)
{
    auto mock  = std::make_shared<MockAccessor>();
    auto inner = std::make_shared<ScriptedResolver>();
    inner->results.push_back(Storage::MakeError(StorageErrc::RateLimited, Operation::Stat, {}));
    Layers::CredentialAccessor accessor(mock, inner);

    auto res = accessor.Stat(Storage::StatArgs{Id("obj"), {}});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().Kind(), StorageErrc::Unavailable);
    EXPECT_TRUE(res.error().IsRetryable());
}

TEST(CredentialAccessorTest, RejectedCredentialIsPermissionDenied)
{
    auto mock = std::make_shared<MockAccessor>();
    mock->FailAuthorize(StorageErrc::Unexpected);
    Layers::CredentialAccessor accessor(mock, std::make_shared<StaticCredentialResolver>(MakeKey("bad")));

    auto res = accessor.Stat(Storage::StatArgs{Id("obj"), {}});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().Kind(), StorageErrc::PermissionDenied);
    EXPECT_EQ(mock->Calls(Operation::Stat), 0u);
}

TEST(CredentialAccessorTest, CancelledResolutionStaysCancelled)
{
    // The caller gives up while the resolver is still working
    class CancellingResolver : public Credential::ICredentialResolver
    {
        public:
        explicit CancellingResolver(std::stop_source &source) : source_(source) {}

        Storage::StorageResult<Credential::Credential> Resolve(std::stop_token) override
        {
            source_.request_stop();
            return Storage::MakeCancelledError(Operation::Stat, {});
        }

        private:
        std::stop_source &source_;
    };

    std::stop_source source;
    auto mock = std::make_shared<MockAccessor>();
    Layers::CredentialAccessor accessor(mock, std::make_shared<CancellingResolver>(source));

    auto res = accessor.Stat(Storage::StatArgs{Id("obj"), source.get_token()});
    ASSERT_FALSE(res.has_value());
    EXPECT_TRUE(Storage::IsCancelled(res.error()));
    EXPECT_EQ(res.error().Op(), Operation::Stat);
    EXPECT_EQ(res.error().Path(), "obj");
    EXPECT_EQ(mock->TotalCalls(), 0u);
}

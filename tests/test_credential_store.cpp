// ---------------------------------------------------------------------------
// test_credential_store.cpp
//
// CredentialStore / TokenSource / ConsoleAuthProvider / ShutdownHook 단위 테스트
// ---------------------------------------------------------------------------

#include "auth/auth_provider.hpp"
#include "auth/credential_store.hpp"
#include "auth/shutdown_hook.hpp"
#include "auth/token.hpp"
#include "auth/token_source.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

// 파일에는 초 단위로 저장되므로 비교용 토큰도 초 단위로 맞춘다
std::chrono::system_clock::time_point whole_seconds(std::chrono::system_clock::time_point tp)
{
    return std::chrono::floor<std::chrono::seconds>(tp);
}

Token make_token(std::chrono::system_clock::time_point expiry)
{
    Token token;
    token.access_token  = "access-abc";
    token.refresh_token = "refresh-xyz";
    token.token_type    = "Bearer";
    token.expiry        = whole_seconds(expiry);
    return token;
}

// ---------------------------------------------------------------------------
// FakeAuthProvider
//   호출 횟수를 기록하고 미리 정한 결과를 돌려준다.
// ---------------------------------------------------------------------------
class FakeAuthProvider final : public AuthProvider {
public:
    std::expected<Token, RelayError> interactive_result{
        std::unexpected(RelayError{RelayErrorCode::kAuthFailed, "not configured", ""})};
    std::optional<RelayError> refresh_error{};

    int interactive_calls{0};
    int refresh_calls{0};

    auto obtain_interactive() -> std::expected<Token, RelayError> override
    {
        ++interactive_calls;
        return interactive_result;
    }

    auto refresh(const Token& token) -> std::expected<Token, RelayError> override
    {
        ++refresh_calls;
        if (refresh_error) {
            return std::unexpected(*refresh_error);
        }
        if (!token.valid()) {
            return std::unexpected(RelayError{RelayErrorCode::kAuthExpired, "expired", ""});
        }
        return token;
    }
};

}  // namespace

// ---------------------------------------------------------------------------
// Fixture: 임시 디렉터리
// ---------------------------------------------------------------------------
class CredentialStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / "mcrelay_test_auth"
               / (std::string(info->test_suite_name()) + "_" + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        path_ = dir_ / "token.tok";
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    void write_file(const std::string& content) const {
        std::ofstream file(path_);
        file << content;
    }

    fs::path dir_;
    fs::path path_;
};

// ===========================================================================
// CredentialStore
// ===========================================================================

TEST_F(CredentialStoreTest, MissingFileIsNotFound) {
    const CredentialStore store{path_};

    auto result = store.load();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, RelayErrorCode::kNotFound);
}

TEST_F(CredentialStoreTest, PersistThenLoadReturnsSameToken) {
    const CredentialStore store{path_};
    const Token           token = make_token(std::chrono::system_clock::now() + 1h);

    ASSERT_TRUE(store.persist(token).has_value());

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, token);
}

TEST_F(CredentialStoreTest, PersistLeavesNoTemporaryFile) {
    const CredentialStore store{path_};
    ASSERT_TRUE(store.persist(make_token(std::chrono::system_clock::now())).has_value());

    auto tmp = path_;
    tmp += ".tmp";
    EXPECT_TRUE(fs::exists(path_));
    EXPECT_FALSE(fs::exists(tmp));
}

TEST_F(CredentialStoreTest, PersistRestrictsPermissionsToOwner) {
    const CredentialStore store{path_};
    ASSERT_TRUE(store.persist(make_token(std::chrono::system_clock::now())).has_value());

    const auto perms = fs::status(path_).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
}

TEST_F(CredentialStoreTest, PersistOverwritesPreviousToken) {
    const CredentialStore store{path_};
    Token first  = make_token(std::chrono::system_clock::now());
    Token second = make_token(std::chrono::system_clock::now() + 2h);
    second.access_token = "access-new";

    ASSERT_TRUE(store.persist(first).has_value());
    ASSERT_TRUE(store.persist(second).has_value());

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->access_token, "access-new");
}

TEST_F(CredentialStoreTest, MalformedFileIsTreatedAsMissing) {
    write_file("access_token: [unterminated\n");
    const CredentialStore store{path_};

    auto result = store.load();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, RelayErrorCode::kNotFound);
}

TEST_F(CredentialStoreTest, MissingExpiryIsTreatedAsMissing) {
    write_file("access_token: abc\n");
    const CredentialStore store{path_};

    auto result = store.load();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, RelayErrorCode::kNotFound);
}

TEST_F(CredentialStoreTest, OptionalFieldsTakeDefaults) {
    write_file("access_token: abc\nexpiry: 4102444800\n");
    const CredentialStore store{path_};

    auto result = store.load();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->access_token, "abc");
    EXPECT_TRUE(result->refresh_token.empty());
    EXPECT_EQ(result->token_type, "Bearer");
}

TEST_F(CredentialStoreTest, PersistIntoMissingDirectoryCreatesIt) {
    const CredentialStore store{dir_ / "nested" / "token.tok"};

    ASSERT_TRUE(store.persist(make_token(std::chrono::system_clock::now())).has_value());
    EXPECT_TRUE(fs::exists(dir_ / "nested" / "token.tok"));
}

TEST_F(CredentialStoreTest, PersistFailureIsIoError) {
    // 대상 경로가 디렉터리면 rename 이 실패한다
    fs::create_directories(path_);
    fs::create_directories(path_ / "occupied");
    const CredentialStore store{path_};

    auto result = store.persist(make_token(std::chrono::system_clock::now()));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, RelayErrorCode::kIoError);

    auto tmp = path_;
    tmp += ".tmp";
    EXPECT_FALSE(fs::exists(tmp));
}

// ===========================================================================
// TokenSource
// ===========================================================================

TEST_F(CredentialStoreTest, ValidCachedTokenSkipsInteractiveLogin) {
    const CredentialStore store{path_};
    const Token           cached = make_token(std::chrono::system_clock::now() + 1h);
    ASSERT_TRUE(store.persist(cached).has_value());

    FakeAuthProvider provider;
    auto token = TokenSource::acquire(store, provider);

    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(*token, cached);
    EXPECT_EQ(provider.refresh_calls, 1);
    EXPECT_EQ(provider.interactive_calls, 0);
}

TEST_F(CredentialStoreTest, MissingCacheFallsBackToInteractive) {
    const CredentialStore store{path_};

    FakeAuthProvider provider;
    provider.interactive_result = make_token(std::chrono::system_clock::now() + 1h);

    auto token = TokenSource::acquire(store, provider);

    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(token->access_token, "access-abc");
    EXPECT_EQ(provider.refresh_calls, 0);
    EXPECT_EQ(provider.interactive_calls, 1);
}

TEST_F(CredentialStoreTest, ExpiredCacheFallsBackToInteractive) {
    const CredentialStore store{path_};
    ASSERT_TRUE(store.persist(make_token(std::chrono::system_clock::now() - 1h)).has_value());

    FakeAuthProvider provider;
    Token fresh = make_token(std::chrono::system_clock::now() + 1h);
    fresh.access_token = "fresh";
    provider.interactive_result = fresh;

    auto token = TokenSource::acquire(store, provider);

    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(token->access_token, "fresh");
    EXPECT_EQ(provider.refresh_calls, 1);
    EXPECT_EQ(provider.interactive_calls, 1);
}

TEST_F(CredentialStoreTest, InteractiveFailureIsFatal) {
    const CredentialStore store{path_};
    FakeAuthProvider      provider;

    auto token = TokenSource::acquire(store, provider);

    ASSERT_FALSE(token.has_value());
    EXPECT_EQ(token.error().code, RelayErrorCode::kAuthFailed);
}

TEST_F(CredentialStoreTest, RefreshRejectionIsPropagated) {
    const CredentialStore store{path_};
    ASSERT_TRUE(store.persist(make_token(std::chrono::system_clock::now() + 1h)).has_value());

    FakeAuthProvider provider;
    provider.refresh_error = RelayError{RelayErrorCode::kAuthFailed, "revoked", ""};

    auto token = TokenSource::acquire(store, provider);

    ASSERT_FALSE(token.has_value());
    EXPECT_EQ(token.error().code, RelayErrorCode::kAuthFailed);
    EXPECT_EQ(provider.interactive_calls, 0);
}

// ===========================================================================
// ConsoleAuthProvider
// ===========================================================================

TEST(ConsoleAuthProviderTest, ReadsTokensFromConsole) {
    std::istringstream in{"  my-access  \nmy-refresh\n"};
    std::ostringstream out;
    ConsoleAuthProvider provider{in, out, 3600s};

    const auto before = std::chrono::system_clock::now();
    auto token = provider.obtain_interactive();

    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(token->access_token, "my-access");
    EXPECT_EQ(token->refresh_token, "my-refresh");
    EXPECT_GE(token->expiry, before + 3600s);
    EXPECT_NE(out.str().find("access token:"), std::string::npos);
}

TEST(ConsoleAuthProviderTest, RefreshTokenIsOptional) {
    std::istringstream in{"only-access"};
    std::ostringstream out;
    ConsoleAuthProvider provider{in, out, 60s};

    auto token = provider.obtain_interactive();
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(token->access_token, "only-access");
    EXPECT_TRUE(token->refresh_token.empty());
}

TEST(ConsoleAuthProviderTest, EmptyInputAbortsLogin) {
    std::istringstream in{""};
    std::ostringstream out;
    ConsoleAuthProvider provider{in, out, 60s};

    auto token = provider.obtain_interactive();
    ASSERT_FALSE(token.has_value());
    EXPECT_EQ(token.error().code, RelayErrorCode::kAuthFailed);
}

TEST(ConsoleAuthProviderTest, RefreshKeepsValidAndRejectsExpired) {
    std::istringstream in;
    std::ostringstream out;
    ConsoleAuthProvider provider{in, out, 60s};

    const Token valid   = make_token(std::chrono::system_clock::now() + 1h);
    const Token expired = make_token(std::chrono::system_clock::now() - 1s);

    auto kept = provider.refresh(valid);
    ASSERT_TRUE(kept.has_value());
    EXPECT_EQ(*kept, valid);

    auto rejected = provider.refresh(expired);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, RelayErrorCode::kAuthExpired);
}

// ===========================================================================
// ShutdownHook
// ===========================================================================

TEST(ShutdownHookTest, RunsExactlyOnce) {
    int calls = 0;
    {
        ShutdownHook hook{[&calls] { ++calls; }};
        hook.run();
        hook.run();
        EXPECT_TRUE(hook.has_run());
    }
    EXPECT_EQ(calls, 1);
}

TEST(ShutdownHookTest, DestructorRunsPendingAction) {
    int calls = 0;
    {
        ShutdownHook hook{[&calls] { ++calls; }};
        EXPECT_FALSE(hook.has_run());
    }
    EXPECT_EQ(calls, 1);
}

TEST(ShutdownHookTest, ActionExceptionDoesNotEscape) {
    ShutdownHook hook{[] { throw std::runtime_error("disk full"); }};

    EXPECT_NO_THROW(hook.run());
    EXPECT_TRUE(hook.has_run());
}

TEST(ShutdownHookTest, NonStandardExceptionDoesNotEscape) {
    int calls = 0;
    ShutdownHook hook{[&calls] {
        ++calls;
        throw 42;
    }};

    EXPECT_NO_THROW(hook.run());
    EXPECT_NO_THROW(hook.run());
    EXPECT_EQ(calls, 1);
}

TEST_F(CredentialStoreTest, ShutdownHookPersistsToken) {
    const CredentialStore store{path_};
    const Token           token = make_token(std::chrono::system_clock::now() + 1h);
    {
        ShutdownHook hook{[&] {
            if (!store.persist(token)) {
                throw std::runtime_error("persist failed");
            }
        }};
    }

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, token);
}

#pragma once

#include "auth/auth_provider.hpp"
#include "auth/credential_store.hpp"
#include "auth/token.hpp"
#include "common/types.hpp"

#include <expected>

// ---------------------------------------------------------------------------
// TokenSource
//   프로세스 시작 시 사용할 Token 을 결정한다.
//
//   store.load() → provider.refresh()
//   kNotFound / kAuthExpired 이면 provider.obtain_interactive() 로 넘어간다.
//   그 밖의 실패는 그대로 반환한다 (프로세스 시작 실패).
// ---------------------------------------------------------------------------
class TokenSource {
public:
    [[nodiscard]] static auto acquire(const CredentialStore& store, AuthProvider& provider)
        -> std::expected<Token, RelayError>;
};

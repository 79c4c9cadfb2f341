#pragma once

#include "auth/token.hpp"
#include "common/types.hpp"

#include <chrono>
#include <expected>
#include <iosfwd>

// ---------------------------------------------------------------------------
// AuthProvider
//   대화형(out-of-band) 로그인과 토큰 갱신을 수행하는 외부 협력자.
//
//   obtain_interactive : 중단/거절 시 kAuthFailed
//   refresh            : 더 이상 갱신할 수 없으면 kAuthExpired
// ---------------------------------------------------------------------------
class AuthProvider {
public:
    virtual ~AuthProvider() = default;

    virtual auto obtain_interactive() -> std::expected<Token, RelayError> = 0;

    virtual auto refresh(const Token& token) -> std::expected<Token, RelayError> = 0;
};

// ---------------------------------------------------------------------------
// ConsoleAuthProvider
//   운영자 콘솔에서 access token / refresh token 을 입력받는다.
//   받은 토큰의 만료 시각은 now + lifetime.
//
//   오프라인 provider 이므로 refresh 는 토큰을 새로 발급하지 못한다.
//   유효한 동안은 그대로 돌려주고, 만료되면 kAuthExpired.
// ---------------------------------------------------------------------------
class ConsoleAuthProvider final : public AuthProvider {
public:
    ConsoleAuthProvider(std::istream& in, std::ostream& out, std::chrono::seconds lifetime);

    auto obtain_interactive() -> std::expected<Token, RelayError> override;

    auto refresh(const Token& token) -> std::expected<Token, RelayError> override;

private:
    std::istream&        in_;
    std::ostream&        out_;
    std::chrono::seconds lifetime_;
};

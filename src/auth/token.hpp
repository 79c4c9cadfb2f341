#pragma once

#include <chrono>
#include <string>

// ---------------------------------------------------------------------------
// Token
//   업스트림 로그인에 쓰는 캐시된 인증 정보.
//   프로세스당 하나만 활성화되며, 시작 시 한 번 얻고 종료 시 한 번 저장한다.
// ---------------------------------------------------------------------------
struct Token {
    std::string                           access_token{};
    std::string                           refresh_token{};
    std::string                           token_type{"Bearer"};
    std::chrono::system_clock::time_point expiry{};

    // access token 이 있고 만료 전이면 유효
    [[nodiscard]] auto valid(std::chrono::system_clock::time_point now =
                                 std::chrono::system_clock::now()) const noexcept -> bool
    {
        return !access_token.empty() && expiry > now;
    }

    friend bool operator==(const Token&, const Token&) = default;
};

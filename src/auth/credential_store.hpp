#pragma once

// ---------------------------------------------------------------------------
// credential_store.hpp
//
// 캐시된 Token 을 YAML 파일로 읽고 쓴다.
//
// [파일 형식]
//   access_token: <opaque>
//   refresh_token: <opaque>
//   token_type: Bearer
//   expiry: <unix seconds>
//
// [실패 정책]
// - load(): 파일 없음 / 파싱 불가 / 필드 누락은 모두 kNotFound.
//   손상된 캐시는 없는 것으로 취급한다 (대화형 로그인으로 넘어간다).
// - persist(): 임시 파일에 쓴 뒤 rename 한다. 실패 시 kIoError.
//   기존 파일이 반쯤 쓰인 상태로 남지 않는다.
// ---------------------------------------------------------------------------

#include "auth/token.hpp"
#include "common/types.hpp"

#include <expected>
#include <filesystem>

class CredentialStore {
public:
    explicit CredentialStore(std::filesystem::path path);

    [[nodiscard]] auto load() const -> std::expected<Token, RelayError>;

    [[nodiscard]] auto persist(const Token& token) const -> std::expected<void, RelayError>;

    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// Direction
//   릴레이되는 패킷의 출발지.
//   kClient : 클라이언트 → 업스트림 서버
//   kServer : 업스트림 서버 → 클라이언트
// ---------------------------------------------------------------------------
enum class Direction : std::uint8_t {
    kClient = 0,
    kServer = 1,
};

[[nodiscard]] constexpr auto to_string(Direction dir) noexcept -> std::string_view
{
    return dir == Direction::kClient ? "client" : "server";
}

// ---------------------------------------------------------------------------
// SessionContext
//   클라이언트 연결 하나를 식별하는 컨텍스트.
//   proxy 레이어가 생성하고 logger/observer 레이어에 const-ref 로 전달한다.
// ---------------------------------------------------------------------------
struct SessionContext {
    std::uint64_t session_id{0};           // 프로세스 범위 내 유일 세션 ID
    std::string   client_ip{};             // 클라이언트 IPv4/IPv6 주소 문자열
    std::uint16_t client_port{0};          // 클라이언트 TCP 포트
    std::string   client_data{};           // Login 에 실려 온 클라이언트 메타데이터 (원문 그대로)
    std::chrono::system_clock::time_point connected_at{};  // 연결 수립 시각
    bool          handshake_clean{false};  // 두 핸드셰이크가 모두 오류 없이 끝났는지
};

// ---------------------------------------------------------------------------
// RelayErrorCode
//   릴레이 전 구간에서 발생 가능한 오류 분류.
// ---------------------------------------------------------------------------
enum class RelayErrorCode : std::uint8_t {
    kDialFailed       = 0,  // 업스트림 연결/로그인 실패 (해당 세션만 종료)
    kAuthExpired      = 1,  // 캐시된 토큰을 더 이상 갱신할 수 없음
    kAuthFailed       = 2,  // 대화형 로그인 중단/거절
    kReadFailed       = 3,  // 연결에서 패킷 읽기 실패
    kWriteFailed      = 4,  // 연결에 패킷 쓰기 실패
    kRemoteDisconnect = 5,  // 상대가 사유와 함께 명시적으로 끊음 (message = 사유)
    kIoError          = 6,  // 파일 I/O 실패 (자격 증명 저장 등)
    kNotFound         = 7,  // 캐시된 자격 증명 없음 또는 손상
    kMalformedPacket  = 8,  // 프레임/패킷 구조가 올바르지 않음
    kConfigError      = 9,  // 설정 파일 오류
};

// ---------------------------------------------------------------------------
// RelayError
//   실패 시 반환되는 오류 정보.
//   std::expected<T, RelayError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct RelayError {
    RelayErrorCode code{RelayErrorCode::kIoError};
    std::string    message{};  // 사람이 읽을 수 있는 오류 설명 (kRemoteDisconnect 이면 상대의 사유)
    std::string    context{};  // 오류가 발생한 위치/원인 (로깅용)

    [[nodiscard]] auto is_remote_disconnect() const noexcept -> bool
    {
        return code == RelayErrorCode::kRemoteDisconnect;
    }
};

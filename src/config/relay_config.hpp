#pragma once

#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// RelayConfig
//   릴레이 프로세스의 모든 설정 값.
//
//   적용 순서 (뒤가 앞을 덮어쓴다):
//     기본값 → YAML (--config) → 환경변수 → 명령행 플래그
//
//   listen_address / listen_port   : 클라이언트를 받을 주소 (port 0 = 임의 포트)
//   upstream_address / upstream_port : 실제 게임 서버
//   token_path                     : 캐시된 자격 증명 파일
//   log_path / log_level           : 구조화 로그 출력
//   interactive_token_lifetime_sec : 대화형 로그인으로 받은 토큰의 유효 기간
// ---------------------------------------------------------------------------
struct RelayConfig {
    std::string   listen_address{"0.0.0.0"};
    std::uint16_t listen_port{19132};

    std::string   upstream_address{"127.0.0.1"};
    std::uint16_t upstream_port{19134};

    std::string   token_path{"token.tok"};

    std::string   log_path{"logs/mcrelay.log"};
    std::string   log_level{"info"};

    std::uint32_t interactive_token_lifetime_sec{86400};
};

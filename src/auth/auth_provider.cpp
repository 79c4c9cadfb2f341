#include "auth/auth_provider.hpp"

#include <spdlog/spdlog.h>

#include <istream>
#include <ostream>
#include <string>

namespace {

// 앞뒤 공백 제거
std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}  // namespace

ConsoleAuthProvider::ConsoleAuthProvider(std::istream& in,
                                         std::ostream& out,
                                         std::chrono::seconds lifetime)
    : in_{in}
    , out_{out}
    , lifetime_{lifetime}
{}

auto ConsoleAuthProvider::obtain_interactive() -> std::expected<Token, RelayError>
{
    out_ << "Sign in to the upstream service on another device, then paste the issued tokens.\n"
         << "access token: " << std::flush;

    std::string access;
    if (!std::getline(in_, access) || trim(access).empty()) {
        return std::unexpected(RelayError{
            RelayErrorCode::kAuthFailed, "interactive login aborted", "console"});
    }

    out_ << "refresh token (optional): " << std::flush;
    std::string refresh;
    if (!std::getline(in_, refresh)) {
        refresh.clear();
    }

    Token token;
    token.access_token  = trim(access);
    token.refresh_token = trim(refresh);
    token.token_type    = "Bearer";
    token.expiry        = std::chrono::system_clock::now() + lifetime_;

    spdlog::info("[auth] interactive login completed");
    return token;
}

auto ConsoleAuthProvider::refresh(const Token& token) -> std::expected<Token, RelayError>
{
    if (token.valid()) {
        return token;
    }
    return std::unexpected(RelayError{
        RelayErrorCode::kAuthExpired, "cached token expired", "console"});
}

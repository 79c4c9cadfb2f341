#include "auth/credential_store.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <system_error>
#include <utility>

namespace {

RelayError not_found(std::string message, const std::filesystem::path& path)
{
    return RelayError{RelayErrorCode::kNotFound, std::move(message), path.string()};
}

RelayError io_error(std::string message, const std::filesystem::path& path)
{
    return RelayError{RelayErrorCode::kIoError, std::move(message), path.string()};
}

}  // namespace

CredentialStore::CredentialStore(std::filesystem::path path)
    : path_{std::move(path)}
{}

// ---------------------------------------------------------------------------
// load
// ---------------------------------------------------------------------------
auto CredentialStore::load() const -> std::expected<Token, RelayError>
{
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return std::unexpected(not_found("no cached credentials", path_));
    }

    try {
        const YAML::Node root = YAML::LoadFile(path_.string());
        if (!root.IsMap()) {
            return std::unexpected(not_found("credential file is not a map", path_));
        }

        Token token;
        token.access_token  = root["access_token"].as<std::string>();
        token.refresh_token = root["refresh_token"].as<std::string>("");
        token.token_type    = root["token_type"].as<std::string>("Bearer");
        token.expiry        = std::chrono::system_clock::time_point{
            std::chrono::seconds{root["expiry"].as<std::int64_t>()}};

        if (token.access_token.empty()) {
            return std::unexpected(not_found("credential file has an empty access token", path_));
        }
        return token;
    } catch (const YAML::Exception& e) {
        // 손상된 캐시는 없는 것과 같다
        spdlog::warn("[auth] ignoring malformed credential file '{}': {}", path_.string(), e.what());
        return std::unexpected(not_found(fmt::format("malformed credential file: {}", e.what()),
                                         path_));
    }
}

// ---------------------------------------------------------------------------
// persist
//   <path>.tmp 에 쓰고 (소유자만 읽기/쓰기) rename 으로 교체한다.
// ---------------------------------------------------------------------------
auto CredentialStore::persist(const Token& token) const -> std::expected<void, RelayError>
{
    const auto expiry_sec = std::chrono::duration_cast<std::chrono::seconds>(
        token.expiry.time_since_epoch()).count();

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "access_token"  << YAML::Value << token.access_token;
    out << YAML::Key << "refresh_token" << YAML::Value << token.refresh_token;
    out << YAML::Key << "token_type"    << YAML::Value << token.token_type;
    out << YAML::Key << "expiry"        << YAML::Value << static_cast<long long>(expiry_sec);
    out << YAML::EndMap;

    if (!out.good()) {
        return std::unexpected(io_error(fmt::format("cannot serialize token: {}",
                                                    out.GetLastError()), path_));
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return std::unexpected(io_error(
                fmt::format("cannot create directory: {}", ec.message()), path_));
        }
    }

    auto tmp_path = path_;
    tmp_path += ".tmp";

    {
        std::ofstream file{tmp_path, std::ios::out | std::ios::trunc};
        if (!file) {
            return std::unexpected(io_error("cannot open temporary credential file", tmp_path));
        }
        file << out.c_str() << '\n';
        file.flush();
        if (!file) {
            file.close();
            std::filesystem::remove(tmp_path, ec);
            return std::unexpected(io_error("cannot write temporary credential file", tmp_path));
        }
    }

    std::filesystem::permissions(tmp_path,
                                 std::filesystem::perms::owner_read
                                     | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("[auth] cannot restrict permissions of '{}': {}",
                     tmp_path.string(), ec.message());
    }

    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        const auto message = fmt::format("cannot replace credential file: {}", ec.message());
        std::error_code rm_ec;
        std::filesystem::remove(tmp_path, rm_ec);
        return std::unexpected(io_error(message, path_));
    }

    return {};
}

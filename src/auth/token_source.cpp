#include "auth/token_source.hpp"

#include <spdlog/spdlog.h>

auto TokenSource::acquire(const CredentialStore& store, AuthProvider& provider)
    -> std::expected<Token, RelayError>
{
    auto cached = store.load();
    if (cached) {
        auto refreshed = provider.refresh(*cached);
        if (refreshed) {
            spdlog::info("[auth] using cached credentials from '{}'", store.path().string());
            return refreshed;
        }
        if (refreshed.error().code != RelayErrorCode::kAuthExpired) {
            return std::unexpected(refreshed.error());
        }
        spdlog::info("[auth] cached credentials expired, falling back to interactive login");
    } else if (cached.error().code == RelayErrorCode::kNotFound) {
        spdlog::info("[auth] {} ({}), starting interactive login",
                     cached.error().message, cached.error().context);
    } else {
        return std::unexpected(cached.error());
    }

    return provider.obtain_interactive();
}

#pragma once

#include <filesystem>
#include <shared_mutex>
#include <string>

namespace listen_along {
namespace services {

// Persists the Spotify refresh token in auth.yaml beside the config file.
class SpotifyAuthStorage {
public:
    explicit SpotifyAuthStorage(const std::filesystem::path& storage_path = {});
    ~SpotifyAuthStorage() = default;

    std::string get_refresh_token() const;
    void set_refresh_token(const std::string& token);
    void clear();

    void save();
    void load();

    const std::filesystem::path& path() const { return m_storage_path; }

    static std::filesystem::path get_default_auth_path();

private:
    void ensure_storage_directory();
    void save_internal();
    void load_internal();

    mutable std::shared_mutex m_mutex;
    std::filesystem::path m_storage_path;

    std::string m_refresh_token;
};

} // namespace services
} // namespace listen_along

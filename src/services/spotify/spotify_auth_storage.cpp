#include "listen_along/services/spotify/spotify_auth_storage.hpp"
#include "listen_along/utils/logger.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>

namespace listen_along {
namespace services {

SpotifyAuthStorage::SpotifyAuthStorage(const std::filesystem::path& storage_path)
    : m_storage_path(storage_path.empty() ? get_default_auth_path() : storage_path) {
    ensure_storage_directory();
    load();
}

std::string SpotifyAuthStorage::get_refresh_token() const {
    std::shared_lock lock(m_mutex);
    return m_refresh_token;
}

void SpotifyAuthStorage::set_refresh_token(const std::string& token) {
    {
        std::unique_lock lock(m_mutex);
        m_refresh_token = token;
    }
    save();
}

void SpotifyAuthStorage::clear() {
    set_refresh_token({});
}

void SpotifyAuthStorage::save() {
    std::shared_lock lock(m_mutex);
    save_internal();
}

void SpotifyAuthStorage::load() {
    std::unique_lock lock(m_mutex);
    load_internal();
}

std::filesystem::path SpotifyAuthStorage::get_default_auth_path() {
    std::filesystem::path auth_dir;

#ifdef _WIN32
    if (const char* app_data = std::getenv("APPDATA")) {
        auth_dir = std::filesystem::path(app_data) / "Listen Along";
    }
#else
    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME")) {
        auth_dir = std::filesystem::path(xdg_config) / "listen-along";
    } else if (const char* home = std::getenv("HOME")) {
        auth_dir = std::filesystem::path(home) / ".config" / "listen-along";
    }
#endif

    return auth_dir / "auth.yaml";
}

void SpotifyAuthStorage::ensure_storage_directory() {
    auto dir = m_storage_path.parent_path();
    if (dir.empty()) {
        return;
    }

    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            LOG_ERROR("SpotifyAuthStorage", "Failed to create " + dir.string() + ": " + ec.message());
        }
    }
}

void SpotifyAuthStorage::save_internal() {
    try {
        YAML::Node node;
        if (!m_refresh_token.empty()) {
            node["spotify"]["refresh_token"] = m_refresh_token;
        }

        std::ofstream file(m_storage_path);
        if (!file) {
            LOG_ERROR("SpotifyAuthStorage", "Failed to open auth file for writing");
            return;
        }

        file << node;
        LOG_DEBUG("SpotifyAuthStorage", "Saved authentication data");
    } catch (const YAML::Exception& e) {
        LOG_ERROR("SpotifyAuthStorage", "Error saving auth data: " + std::string(e.what()));
    }
}

void SpotifyAuthStorage::load_internal() {
    std::error_code ec;
    if (!std::filesystem::exists(m_storage_path, ec)) {
        LOG_DEBUG("SpotifyAuthStorage", "No stored Spotify credentials");
        return;
    }

    try {
        YAML::Node node = YAML::LoadFile(m_storage_path.string());
        if (node["spotify"] && node["spotify"]["refresh_token"]) {
            m_refresh_token = node["spotify"]["refresh_token"].as<std::string>();
        }
        LOG_DEBUG("SpotifyAuthStorage", "Loaded authentication data");
    } catch (const YAML::Exception& e) {
        LOG_ERROR("SpotifyAuthStorage", "Error loading auth data: " + std::string(e.what()));
    }
}

} // namespace services
} // namespace listen_along

#include "listen_along/platform/system_service.hpp"
#include "listen_along/utils/logger.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <climits>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

#ifdef USE_QT_UI
#include <QDir>
#include <QLockFile>
#include <QStandardPaths>
#endif

#include <cerrno>
#include <cstdlib>
#include <fstream>

namespace listen_along {
namespace platform {

std::string to_string(SystemError error) {
    switch (error) {
        case SystemError::NotSupported: return "not supported";
        case SystemError::PermissionDenied: return "permission denied";
        case SystemError::ResourceNotFound: return "resource not found";
        case SystemError::OperationFailed: return "operation failed";
        case SystemError::AlreadyExists: return "already exists";
    }
    return "unknown";
}

// ============================================================================
// SingleInstanceManager
// ============================================================================

class SingleInstanceManagerImpl : public SingleInstanceManager {
public:
    explicit SingleInstanceManagerImpl(const std::string& instance_name)
        : m_instance_name(instance_name) {
#ifdef USE_QT_UI
        QDir temp_dir(QStandardPaths::writableLocation(QStandardPaths::TempLocation));
        m_lock_file_path = temp_dir.absoluteFilePath(QString::fromStdString(instance_name) + ".lock").toStdString();
        m_lock_file = std::make_unique<QLockFile>(QString::fromStdString(m_lock_file_path));
        m_lock_file->setStaleLockTime(0);
#endif
    }

    ~SingleInstanceManagerImpl() override {
        release_instance();
    }

    std::expected<bool, SystemError> try_acquire_instance() override {
        if (m_acquired) {
            return true;
        }

        LOG_DEBUG("SingleInstance", "Acquiring instance lock: " + m_instance_name);

#ifdef USE_QT_UI
        m_acquired = m_lock_file->tryLock(0);
        if (!m_acquired && m_lock_file->error() != QLockFile::LockFailedError) {
            LOG_ERROR("SingleInstance", "Failed to acquire lock: " +
                      std::to_string(static_cast<int>(m_lock_file->error())));
            return std::unexpected(SystemError::OperationFailed);
        }
#elif defined(_WIN32)
        const std::string mutex_name = "Local\\" + m_instance_name + "_SingleInstance_Mutex";
        m_mutex_handle = CreateMutexA(nullptr, TRUE, mutex_name.c_str());
        if (m_mutex_handle == nullptr) {
            LOG_ERROR("SingleInstance", "Failed to create mutex");
            return std::unexpected(SystemError::OperationFailed);
        }
        m_acquired = GetLastError() != ERROR_ALREADY_EXISTS;
        if (!m_acquired) {
            CloseHandle(m_mutex_handle);
            m_mutex_handle = nullptr;
        }
#else
        const char* tmp_dir = std::getenv("TMPDIR");
        m_lock_file_path = std::string(tmp_dir ? tmp_dir : "/tmp") + "/" + m_instance_name + ".lock";
        m_lock_fd = open(m_lock_file_path.c_str(), O_RDWR | O_CREAT, 0600);
        if (m_lock_fd == -1) {
            LOG_ERROR("SingleInstance", "Failed to create lock file " + m_lock_file_path);
            return std::unexpected(SystemError::OperationFailed);
        }
        m_acquired = flock(m_lock_fd, LOCK_EX | LOCK_NB) != -1;
        if (!m_acquired) {
            close(m_lock_fd);
            m_lock_fd = -1;
        }
#endif

        if (!m_acquired) {
            LOG_INFO("SingleInstance", "Another instance is already running");
        }
        return m_acquired;
    }

    void release_instance() override {
        if (!m_acquired) {
            return;
        }

#ifdef USE_QT_UI
        m_lock_file->unlock();
#elif defined(_WIN32)
        if (m_mutex_handle != nullptr) {
            ReleaseMutex(m_mutex_handle);
            CloseHandle(m_mutex_handle);
            m_mutex_handle = nullptr;
        }
#else
        if (m_lock_fd != -1) {
            flock(m_lock_fd, LOCK_UN);
            close(m_lock_fd);
            m_lock_fd = -1;
            unlink(m_lock_file_path.c_str());
        }
#endif
        m_acquired = false;
        LOG_DEBUG("SingleInstance", "Instance lock released");
    }

    bool is_instance_acquired() const override {
        return m_acquired;
    }

private:
    std::string m_instance_name;
    bool m_acquired = false;
    std::string m_lock_file_path;

#ifdef USE_QT_UI
    std::unique_ptr<QLockFile> m_lock_file;
#elif defined(_WIN32)
    HANDLE m_mutex_handle = nullptr;
#else
    int m_lock_fd = -1;
#endif
};

std::unique_ptr<SingleInstanceManager> SingleInstanceManager::create(const std::string& instance_name) {
    return std::make_unique<SingleInstanceManagerImpl>(instance_name);
}

// ============================================================================
// UriSchemeRegistrar
// ============================================================================

std::expected<std::filesystem::path, SystemError> UriSchemeRegistrar::executable_path() {
#ifdef _WIN32
    wchar_t buffer[MAX_PATH];
    const DWORD len = GetModuleFileNameW(nullptr, buffer, MAX_PATH);
    if (len == 0 || len == MAX_PATH) {
        return std::unexpected(SystemError::OperationFailed);
    }
    return std::filesystem::path(std::wstring(buffer, len));
#elif defined(__APPLE__)
    char buffer[PATH_MAX];
    uint32_t size = sizeof(buffer);
    if (_NSGetExecutablePath(buffer, &size) != 0) {
        return std::unexpected(SystemError::OperationFailed);
    }
    return std::filesystem::path(buffer);
#else
    std::error_code ec;
    auto path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::unexpected(SystemError::ResourceNotFound);
    }
    return path;
#endif
}

#ifdef _WIN32
class WindowsUriSchemeRegistrar : public UriSchemeRegistrar {
public:
    std::expected<void, SystemError> register_scheme(const std::string& scheme,
                                                     const std::string& description) override {
        auto exe = executable_path();
        if (!exe) {
            return std::unexpected(exe.error());
        }

        const std::string base = "Software\\Classes\\" + scheme;
        const std::string command = "\"" + exe->string() + "\" \"%1\"";

        if (!set_value(base, "", "URL:" + description) ||
            !set_value(base, "URL Protocol", "") ||
            !set_value(base + "\\DefaultIcon", "", "\"" + exe->string() + "\",0") ||
            !set_value(base + "\\shell\\open\\command", "", command)) {
            LOG_ERROR("UriScheme", "Failed to write registry keys for " + scheme);
            return std::unexpected(SystemError::PermissionDenied);
        }

        LOG_INFO("UriScheme", "Registered " + scheme + ":// in HKCU");
        return {};
    }

private:
    static bool set_value(const std::string& key_path, const std::string& name, const std::string& value) {
        HKEY key;
        if (RegCreateKeyExA(HKEY_CURRENT_USER, key_path.c_str(), 0, nullptr, 0, KEY_WRITE, nullptr, &key,
                            nullptr) != ERROR_SUCCESS) {
            return false;
        }
        const LONG result = RegSetValueExA(key, name.empty() ? nullptr : name.c_str(), 0, REG_SZ,
                                           reinterpret_cast<const BYTE*>(value.c_str()),
                                           static_cast<DWORD>(value.size() + 1));
        RegCloseKey(key);
        return result == ERROR_SUCCESS;
    }
};
#elif defined(__linux__)
class XdgUriSchemeRegistrar : public UriSchemeRegistrar {
public:
    explicit XdgUriSchemeRegistrar(std::string app_name) : m_app_name(std::move(app_name)) {}

    std::expected<void, SystemError> register_scheme(const std::string& scheme,
                                                     const std::string& description) override {
        auto exe = executable_path();
        if (!exe) {
            return std::unexpected(exe.error());
        }

        std::filesystem::path apps_dir;
        if (const char* xdg_data = std::getenv("XDG_DATA_HOME")) {
            apps_dir = std::filesystem::path(xdg_data) / "applications";
        } else if (const char* home = std::getenv("HOME")) {
            apps_dir = std::filesystem::path(home) / ".local" / "share" / "applications";
        } else {
            LOG_ERROR("UriScheme", "Could not determine applications directory");
            return std::unexpected(SystemError::ResourceNotFound);
        }

        std::error_code ec;
        std::filesystem::create_directories(apps_dir, ec);
        if (ec) {
            LOG_ERROR("UriScheme", "Failed to create " + apps_dir.string() + ": " + ec.message());
            return std::unexpected(SystemError::PermissionDenied);
        }

        const auto desktop_name = "listen-along-" + scheme + ".desktop";
        std::ofstream file(apps_dir / desktop_name);
        if (!file) {
            LOG_ERROR("UriScheme", "Failed to write " + desktop_name);
            return std::unexpected(SystemError::PermissionDenied);
        }

        file << "[Desktop Entry]\n"
             << "Type=Application\n"
             << "Name=" << m_app_name << " (" << description << ")\n"
             << "Exec=\"" << exe->string() << "\" %u\n"
             << "Terminal=false\n"
             << "NoDisplay=true\n"
             << "MimeType=x-scheme-handler/" << scheme << ";\n";
        file.close();

        const auto mime = "x-scheme-handler/" + scheme;
        if (!run("xdg-mime", {"default", desktop_name, mime})) {
            LOG_ERROR("UriScheme", "xdg-mime failed for " + mime);
            return std::unexpected(SystemError::OperationFailed);
        }

        LOG_INFO("UriScheme", "Registered " + scheme + ":// via " + desktop_name);
        return {};
    }

private:
    std::string m_app_name;

    static bool run(const char* program, const std::vector<std::string>& args) {
        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(program));
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        pid_t pid = fork();
        if (pid == 0) {
            execvp(program, argv.data());
            _exit(127);
        }
        if (pid < 0) {
            return false;
        }

        int status = 0;
        pid_t result;
        do {
            result = waitpid(pid, &status, 0);
        } while (result == -1 && errno == EINTR);
        return result != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
    }
};
#endif

class UnsupportedUriSchemeRegistrar : public UriSchemeRegistrar {
public:
    std::expected<void, SystemError> register_scheme(const std::string& scheme, const std::string&) override {
        LOG_WARNING("UriScheme", "Cannot register " + scheme + ":// on this platform");
        return std::unexpected(SystemError::NotSupported);
    }
};

std::unique_ptr<UriSchemeRegistrar> UriSchemeRegistrar::create(const std::string& app_name) {
#ifdef _WIN32
    (void)app_name;
    return std::make_unique<WindowsUriSchemeRegistrar>();
#elif defined(__linux__)
    return std::make_unique<XdgUriSchemeRegistrar>(app_name);
#else
    (void)app_name;
    return std::make_unique<UnsupportedUriSchemeRegistrar>();
#endif
}

} // namespace platform
} // namespace listen_along

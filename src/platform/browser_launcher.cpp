#include "listen_along/platform/browser_launcher.hpp"
#include "listen_along/utils/logger.hpp"
#include "listen_along/utils/url_utils.hpp"
#include <cerrno>
#include <iostream>

#ifdef _WIN32
#include <windows.h>
#include <shellapi.h>
#else
#include <sys/wait.h>
#include <unistd.h>
#endif

#ifdef USE_QT_UI
#include <QApplication>
#include <QDesktopServices>
#include <QMessageBox>
#include <QMetaObject>
#include <QUrl>
#endif

namespace listen_along::platform {

std::string to_string(BrowserLaunchError error) {
    switch (error) {
        case BrowserLaunchError::NotSupported: return "not supported";
        case BrowserLaunchError::LaunchFailed: return "launch failed";
        case BrowserLaunchError::InvalidUrl: return "invalid URL";
    }
    return "unknown";
}

namespace {

#ifndef _WIN32
// fork+execlp so the URL never passes through a shell
bool run_opener(const char* program, const std::string& url) {
    pid_t pid = fork();
    if (pid == 0) {
        execlp(program, program, url.c_str(), static_cast<char*>(nullptr));
        _exit(1);
    }
    if (pid < 0) {
        LOG_ERROR("BrowserLauncher", "Failed to fork process for opening URL");
        return false;
    }

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid, &status, 0);
    } while (result == -1 && errno == EINTR);

    return result != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}
#endif

} // namespace

class NativeBrowserLauncher : public BrowserLauncher {
public:
    std::expected<void, BrowserLaunchError> open_url(const std::string& url) override {
        if (!utils::UrlUtils::is_valid_url(url)) {
            return std::unexpected(BrowserLaunchError::InvalidUrl);
        }

        LOG_INFO("BrowserLauncher", "Opening URL: " + url);

#ifdef _WIN32
        const int wide_len = MultiByteToWideChar(CP_UTF8, 0, url.c_str(), -1, nullptr, 0);
        std::wstring wurl(static_cast<std::size_t>(wide_len), L'\0');
        MultiByteToWideChar(CP_UTF8, 0, url.c_str(), -1, wurl.data(), wide_len);

        HINSTANCE result = ShellExecuteW(nullptr, L"open", wurl.c_str(), nullptr, nullptr, SW_SHOWNORMAL);
        if (reinterpret_cast<INT_PTR>(result) <= 32) {
            LOG_ERROR("BrowserLauncher", "ShellExecuteW failed with code " +
                      std::to_string(reinterpret_cast<INT_PTR>(result)));
            return std::unexpected(BrowserLaunchError::LaunchFailed);
        }
#elif defined(__APPLE__)
        if (!run_opener("open", url)) {
            LOG_ERROR("BrowserLauncher", "Failed to open URL via 'open'");
            return std::unexpected(BrowserLaunchError::LaunchFailed);
        }
#else
        if (!run_opener("xdg-open", url)) {
            LOG_ERROR("BrowserLauncher", "Failed to open URL via xdg-open");
            return std::unexpected(BrowserLaunchError::LaunchFailed);
        }
#endif
        return {};
    }

    bool show_message(const std::string& title, const std::string& message) override {
        std::cout << "\n=== " << title << " ===\n" << message << "\n" << std::endl;
        return true;
    }
};

#ifdef USE_QT_UI
class QtBrowserLauncher : public BrowserLauncher {
public:
    std::expected<void, BrowserLaunchError> open_url(const std::string& url) override {
        if (!utils::UrlUtils::is_valid_url(url)) {
            return std::unexpected(BrowserLaunchError::InvalidUrl);
        }

        LOG_INFO("QtBrowserLauncher", "Opening URL: " + url);

        if (!QDesktopServices::openUrl(QUrl(QString::fromStdString(url)))) {
            LOG_ERROR("QtBrowserLauncher", "QDesktopServices could not open URL");
            return std::unexpected(BrowserLaunchError::LaunchFailed);
        }
        return {};
    }

    bool show_message(const std::string& title, const std::string& message) override {
        if (!QApplication::instance()) {
            return false;
        }
        QString qtitle = QString::fromStdString(title);
        QString qmessage = QString::fromStdString(message);

        QMetaObject::invokeMethod(QApplication::instance(), [qtitle, qmessage]() {
            QMessageBox::information(nullptr, qtitle, qmessage);
        }, Qt::QueuedConnection);
        return true;
    }
};
#endif

std::unique_ptr<BrowserLauncher> create_browser_launcher() {
#ifdef USE_QT_UI
    if (QApplication::instance()) {
        return std::make_unique<QtBrowserLauncher>();
    }
#endif
    return std::make_unique<NativeBrowserLauncher>();
}

} // namespace listen_along::platform

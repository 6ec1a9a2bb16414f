#pragma once

#include <expected>
#include <memory>
#include <string>

namespace listen_along::platform {

enum class BrowserLaunchError {
    NotSupported,
    LaunchFailed,
    InvalidUrl
};

std::string to_string(BrowserLaunchError error);

// Opens URLs in the system browser
class BrowserLauncher {
public:
    virtual ~BrowserLauncher() = default;

    virtual std::expected<void, BrowserLaunchError> open_url(const std::string& url) = 0;

    // Informational notice before something opens in the browser. Returns false if unsupported.
    virtual bool show_message(const std::string& title, const std::string& message) = 0;
};

std::unique_ptr<BrowserLauncher> create_browser_launcher();

} // namespace listen_along::platform

#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace listen_along {
namespace platform {

enum class UiError {
    NotSupported,
    InitializationFailed,
    ResourceNotFound,
    OperationFailed
};

enum class MenuItemType {
    Action,
    Separator
};

struct MenuItem {
    MenuItemType type = MenuItemType::Action;
    std::string id;
    std::string label;
    bool enabled = true;
    std::function<void()> action;

    MenuItem() = default;
    MenuItem(std::string id, std::string label, std::function<void()> action = {});

    static MenuItem separator();
};

// Tray icon with a context menu. Setters may be called from any thread;
// implementations forward the change to the UI thread.
class SystemTray {
public:
    virtual ~SystemTray() = default;

    virtual std::expected<void, UiError> initialize() = 0;
    virtual void shutdown() = 0;
    virtual bool is_initialized() const = 0;

    virtual std::expected<void, UiError> set_tooltip(const std::string& tooltip) = 0;

    virtual std::expected<void, UiError> set_menu(const std::vector<MenuItem>& items) = 0;
    virtual std::expected<void, UiError> set_menu_item_label(const std::string& id, const std::string& label) = 0;

    virtual void show() = 0;
};

class UiService {
public:
    virtual ~UiService() = default;

    virtual std::expected<void, UiError> initialize() = 0;
    virtual void shutdown() = 0;
    virtual bool is_initialized() const = 0;

    virtual std::unique_ptr<SystemTray> create_system_tray() = 0;
    virtual bool supports_system_tray() const = 0;

    virtual void process_events() = 0;
};

// nullptr when built without a UI toolkit.
std::unique_ptr<UiService> create_ui_service();

} // namespace platform
} // namespace listen_along

#pragma once

#include "listen_along/platform/ui_service.hpp"
#include <QIcon>
#include <QMenu>
#include <QSystemTrayIcon>
#include <atomic>
#include <functional>
#include <map>
#include <memory>

class QAction;

namespace listen_along::platform::qt {

class QtSystemTray : public SystemTray {
public:
    QtSystemTray();
    ~QtSystemTray() override;

    std::expected<void, UiError> initialize() override;
    void shutdown() override;
    bool is_initialized() const override;

    std::expected<void, UiError> set_tooltip(const std::string& tooltip) override;

    std::expected<void, UiError> set_menu(const std::vector<MenuItem>& items) override;
    std::expected<void, UiError> set_menu_item_label(const std::string& id, const std::string& label) override;

    void show() override;

private:
    // Runs task on the thread that owns the tray, queued if called from elsewhere.
    void post_to_ui(std::function<void()> task);
    void rebuild_menu(const std::vector<MenuItem>& items);
    QAction* find_action_by_id(const std::string& id);
    static QIcon load_icon(const QString& base_path);

    std::unique_ptr<QSystemTrayIcon> m_tray_icon;
    std::unique_ptr<QMenu> m_context_menu;
    // Touched only on the UI thread
    std::map<std::string, QAction*> m_action_map;

    std::atomic<bool> m_initialized{false};
};

} // namespace listen_along::platform::qt

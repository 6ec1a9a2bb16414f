#pragma once

#include "listen_along/platform/ui_service.hpp"
#include <QApplication>
#include <memory>

namespace listen_along::platform::qt {

// Wraps the QApplication created in main; never owns it.
class QtUiService : public UiService {
public:
    QtUiService() = default;
    ~QtUiService() override;

    std::expected<void, UiError> initialize() override;
    void shutdown() override;
    bool is_initialized() const override;

    std::unique_ptr<SystemTray> create_system_tray() override;
    bool supports_system_tray() const override;

    void process_events() override;

private:
    QApplication* m_app = nullptr;
    bool m_initialized = false;
};

} // namespace listen_along::platform::qt

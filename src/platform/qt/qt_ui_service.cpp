#include "listen_along/platform/qt/qt_ui_service.hpp"
#include "listen_along/platform/qt/qt_system_tray.hpp"
#include "listen_along/utils/logger.hpp"
#include <QCoreApplication>

namespace listen_along::platform::qt {

QtUiService::~QtUiService() {
    shutdown();
}

std::expected<void, UiError> QtUiService::initialize() {
    if (m_initialized) {
        return {};
    }

    m_app = qobject_cast<QApplication*>(QCoreApplication::instance());
    if (!m_app) {
        LOG_ERROR("QtUiService", "QApplication not available - ensure Qt is initialized in main");
        return std::unexpected(UiError::InitializationFailed);
    }

    m_initialized = true;
    LOG_DEBUG("QtUiService", "Qt UI service initialized");
    return {};
}

void QtUiService::shutdown() {
    if (!m_initialized) {
        return;
    }

    m_app = nullptr;
    m_initialized = false;
    LOG_DEBUG("QtUiService", "Qt UI service shut down");
}

bool QtUiService::is_initialized() const {
    return m_initialized;
}

std::unique_ptr<SystemTray> QtUiService::create_system_tray() {
    if (!m_initialized) {
        LOG_ERROR("QtUiService", "UI service not initialized, cannot create system tray");
        return nullptr;
    }

    if (!supports_system_tray()) {
        LOG_WARNING("QtUiService", "System tray not available on this platform");
        return nullptr;
    }

    return std::make_unique<QtSystemTray>();
}

bool QtUiService::supports_system_tray() const {
    return QSystemTrayIcon::isSystemTrayAvailable();
}

void QtUiService::process_events() {
    if (m_app) {
        m_app->processEvents();
    }
}

} // namespace listen_along::platform::qt

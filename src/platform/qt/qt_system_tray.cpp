#include "listen_along/platform/qt/qt_system_tray.hpp"
#include "listen_along/utils/logger.hpp"
#include <QAction>
#include <QApplication>
#include <QFile>
#include <QMetaObject>
#include <QThread>

namespace listen_along::platform::qt {

QtSystemTray::QtSystemTray() = default;

QtSystemTray::~QtSystemTray() {
    shutdown();
}

std::expected<void, UiError> QtSystemTray::initialize() {
    if (m_initialized) {
        return {};
    }

    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        LOG_ERROR("QtSystemTray", "System tray is not available on this system");
        return std::unexpected(UiError::NotSupported);
    }

    m_tray_icon = std::make_unique<QSystemTrayIcon>();
    m_context_menu = std::make_unique<QMenu>();
    m_tray_icon->setContextMenu(m_context_menu.get());

    QIcon icon = load_icon(":/icons/tray_icon");
    m_tray_icon->setIcon(icon.isNull() ? QApplication::windowIcon() : icon);

    m_initialized = true;
    LOG_DEBUG("QtSystemTray", "System tray initialized");
    return {};
}

void QtSystemTray::shutdown() {
    if (!m_initialized.exchange(false)) {
        return;
    }

    for (auto& [id, action] : m_action_map) {
        QObject::disconnect(action, nullptr, nullptr, nullptr);
    }
    m_action_map.clear();

    if (m_tray_icon) {
        m_tray_icon->hide();
    }
    if (m_context_menu) {
        m_context_menu->clear();
    }

    // Menu first: the icon holds a non-owning pointer to it
    m_tray_icon->setContextMenu(nullptr);
    m_context_menu.reset();
    m_tray_icon.reset();

    LOG_DEBUG("QtSystemTray", "System tray shut down");
}

bool QtSystemTray::is_initialized() const {
    return m_initialized;
}

std::expected<void, UiError> QtSystemTray::set_tooltip(const std::string& tooltip) {
    if (!m_initialized) {
        return std::unexpected(UiError::NotSupported);
    }

    post_to_ui([this, text = QString::fromStdString(tooltip)] {
        m_tray_icon->setToolTip(text);
    });
    return {};
}

std::expected<void, UiError> QtSystemTray::set_menu(const std::vector<MenuItem>& items) {
    if (!m_initialized) {
        return std::unexpected(UiError::NotSupported);
    }

    post_to_ui([this, items] { rebuild_menu(items); });
    return {};
}

std::expected<void, UiError> QtSystemTray::set_menu_item_label(const std::string& id, const std::string& label) {
    if (!m_initialized) {
        return std::unexpected(UiError::NotSupported);
    }

    post_to_ui([this, id, text = QString::fromStdString(label)] {
        if (auto* action = find_action_by_id(id)) {
            action->setText(text);
        } else {
            LOG_WARNING("QtSystemTray", "Unknown menu item: " + id);
        }
    });
    return {};
}

void QtSystemTray::show() {
    if (m_initialized) {
        post_to_ui([this] { m_tray_icon->show(); });
    }
}

void QtSystemTray::post_to_ui(std::function<void()> task) {
    if (QThread::currentThread() == m_context_menu->thread()) {
        task();
        return;
    }
    // Dropped by Qt if the menu is destroyed before the event is delivered
    QMetaObject::invokeMethod(m_context_menu.get(), std::move(task), Qt::QueuedConnection);
}

void QtSystemTray::rebuild_menu(const std::vector<MenuItem>& items) {
    m_context_menu->clear();
    m_action_map.clear();

    for (const auto& item : items) {
        if (item.type == MenuItemType::Separator) {
            m_context_menu->addSeparator();
            continue;
        }

        auto* action = new QAction(QString::fromStdString(item.label), m_context_menu.get());
        action->setEnabled(item.enabled);
        if (item.action) {
            QObject::connect(action, &QAction::triggered, item.action);
        }

        m_context_menu->addAction(action);
        m_action_map[item.id] = action;
    }

    LOG_DEBUG("QtSystemTray", "Menu updated with " + std::to_string(items.size()) + " items");
}

QAction* QtSystemTray::find_action_by_id(const std::string& id) {
    auto it = m_action_map.find(id);
    return it != m_action_map.end() ? it->second : nullptr;
}

QIcon QtSystemTray::load_icon(const QString& base_path) {
#ifdef Q_OS_LINUX
    const QString theme_suffix = QIcon::themeName().contains("dark") ? "_dark" : "_light";
    if (QFile::exists(base_path + theme_suffix + ".svg")) {
        return QIcon(base_path + theme_suffix + ".svg");
    }
#endif

    for (const char* extension : {".svg", ".png", ".ico"}) {
        if (QFile::exists(base_path + extension)) {
            return QIcon(base_path + extension);
        }
    }
    return QIcon();
}

} // namespace listen_along::platform::qt

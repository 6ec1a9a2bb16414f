#include "listen_along/platform/ui_service.hpp"

#ifdef USE_QT_UI
#include "listen_along/platform/qt/qt_ui_service.hpp"
#endif

namespace listen_along {
namespace platform {

MenuItem::MenuItem(std::string id, std::string label, std::function<void()> action)
    : type(MenuItemType::Action), id(std::move(id)), label(std::move(label)), action(std::move(action)) {}

MenuItem MenuItem::separator() {
    MenuItem item;
    item.type = MenuItemType::Separator;
    return item;
}

std::unique_ptr<UiService> create_ui_service() {
#ifdef USE_QT_UI
    return std::make_unique<qt::QtUiService>();
#else
    return nullptr;
#endif
}

} // namespace platform
} // namespace listen_along

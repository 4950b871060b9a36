#include "traybuilder.h"

TrayIconBuilder::TrayIconBuilder(const QString &id)
{
    spec_.id = id;
}

TrayIconBuilder &TrayIconBuilder::icon(const QString &path)
{
    spec_.icon = path;
    return *this;
}

TrayIconBuilder &TrayIconBuilder::tooltip(const QString &text)
{
    spec_.tooltip = text;
    return *this;
}

TrayIconBuilder &TrayIconBuilder::onTrayIconEvent(TrayIconEventHandler handler)
{
    spec_.onEvent = std::move(handler);
    return *this;
}

void TrayIconBuilder::build(Runtime &runtime) const
{
    runtime.createTrayIcon(spec_);
}

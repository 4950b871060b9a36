#ifndef TRAYBUILDER_H
#define TRAYBUILDER_H

#include "runtime.h"

class TrayIconBuilder
{
public:
    explicit TrayIconBuilder(const QString &id = QStringLiteral("main"));

    TrayIconBuilder &icon(const QString &path);
    TrayIconBuilder &tooltip(const QString &text);
    TrayIconBuilder &onTrayIconEvent(TrayIconEventHandler handler);

    // Throws StartupError when the runtime cannot create the icon.
    void build(Runtime &runtime) const;

private:
    TrayIconSpec spec_;
};

#endif // TRAYBUILDER_H

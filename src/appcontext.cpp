#include "appcontext.h"

#include <QtGlobal>

#ifndef TIMESHEET_APP_ID
#define TIMESHEET_APP_ID "com.timesheet.desktop"
#endif

#ifndef TIMESHEET_SERVER_URL
#define TIMESHEET_SERVER_URL "http://localhost:3100"
#endif

#ifndef TIMESHEET_VERSION
#define TIMESHEET_VERSION "0.1.0"
#endif

const WindowConfig *AppContext::windowConfig(const QString &label) const
{
    for (const WindowConfig &window : windows) {
        if (window.label == label)
            return &window;
    }
    return nullptr;
}

AppContext AppContext::generate()
{
    AppContext context;
    context.identifier = QStringLiteral(TIMESHEET_APP_ID);
    context.productName = QStringLiteral("Timesheet");
    context.organization = QStringLiteral("Timesheet");
    context.version = QStringLiteral(TIMESHEET_VERSION);

    WindowConfig main;
    main.label = QStringLiteral("main");
    main.title = QStringLiteral("Timesheet");
    main.size = QSize(800, 600);
    context.windows.append(main);

    context.deepLinkSchemes << QStringLiteral("timesheet");
    context.trayIcon = QStringLiteral(":/icons/tray.svg");
    context.trayTooltip = QStringLiteral("Timesheet");

    // The server URL is the only value a deployment may override at runtime.
    QString server = qEnvironmentVariable("TIMESHEET_SERVER_URL");
    if (server.isEmpty())
        server = QStringLiteral(TIMESHEET_SERVER_URL);
    context.serverUrl = QUrl(server);
    context.httpScope << originOf(context.serverUrl);

    return context;
}

QString originOf(const QUrl &url)
{
    if (!url.isValid() || url.host().isEmpty())
        return QString();
    QString origin = url.scheme().toLower() + QStringLiteral("://") + url.host().toLower();
    if (url.port() != -1)
        origin += QLatin1Char(':') + QString::number(url.port());
    return origin;
}

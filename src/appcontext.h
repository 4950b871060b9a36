#ifndef APPCONTEXT_H
#define APPCONTEXT_H

#include <QList>
#include <QSize>
#include <QString>
#include <QStringList>
#include <QUrl>

struct WindowConfig
{
    QString label;
    QString title;
    QSize size;
    bool visible = true;
};

// Static application context, fixed at build time.
struct AppContext
{
    QString identifier;
    QString productName;
    QString organization;
    QString version;
    QList<WindowConfig> windows;
    QStringList deepLinkSchemes;
    QUrl serverUrl;
    QStringList httpScope; // allowed origins, e.g. "http://localhost:3100"
    QString trayIcon;
    QString trayTooltip;

    const WindowConfig *windowConfig(const QString &label) const;

    static AppContext generate();
};

// Origin ("scheme://host[:port]") of a URL, as compared by the HTTP scope.
QString originOf(const QUrl &url);

#endif // APPCONTEXT_H

#include "openerplugin.h"
#include "diagnostics.h"

#include <QDesktopServices>
#include <QFileInfo>

const QString OpenerPlugin::kName = QStringLiteral("opener");

OpenerPlugin::OpenerPlugin(QObject *parent)
    : QObject(parent)
    , schemes_({QStringLiteral("http"), QStringLiteral("https"), QStringLiteral("mailto"), QStringLiteral("tel")})
{
}

QString OpenerPlugin::name() const
{
    return kName;
}

void OpenerPlugin::initialize(Runtime &runtime)
{
    Q_UNUSED(runtime);
    qCDebug(lcOpener) << "allowed schemes" << schemes_;
}

bool OpenerPlugin::isAllowed(const QUrl &url) const
{
    if (!url.isValid() || !schemes_.contains(url.scheme().toLower()))
        return false;
    // Web links need a host; mailto and tel only need a path.
    if (url.scheme().compare(QLatin1String("http"), Qt::CaseInsensitive) == 0
        || url.scheme().compare(QLatin1String("https"), Qt::CaseInsensitive) == 0)
        return !url.host().isEmpty();
    return !url.path().isEmpty();
}

bool OpenerPlugin::openUrl(const QUrl &url) const
{
    if (!isAllowed(url)) {
        qCWarning(lcOpener) << "refusing to open" << url.toString();
        return false;
    }
    if (!QDesktopServices::openUrl(url)) {
        qCWarning(lcOpener) << "no handler for" << url.toString();
        return false;
    }
    return true;
}

bool OpenerPlugin::openPath(const QString &path) const
{
    const QFileInfo info(path);
    if (!info.exists()) {
        qCWarning(lcOpener) << "refusing to open missing path" << path;
        return false;
    }
    if (!QDesktopServices::openUrl(QUrl::fromLocalFile(info.absoluteFilePath()))) {
        qCWarning(lcOpener) << "no handler for" << path;
        return false;
    }
    return true;
}

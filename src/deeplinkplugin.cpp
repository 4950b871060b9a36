#include "deeplinkplugin.h"
#include "diagnostics.h"

#include <QCoreApplication>
#include <QFileOpenEvent>

const QString DeepLinkPlugin::kName = QStringLiteral("deep-link");

DeepLinkPlugin::DeepLinkPlugin(const QStringList &schemes, QObject *parent)
    : QObject(parent)
{
    for (const QString &scheme : schemes)
        schemes_ << scheme.toLower();
}

QString DeepLinkPlugin::name() const
{
    return kName;
}

void DeepLinkPlugin::initialize(Runtime &runtime)
{
    if (QCoreApplication *app = QCoreApplication::instance())
        app->installEventFilter(this);

    const QList<QUrl> urls = extractUrls(runtime.arguments());
    if (!urls.isEmpty())
        handleUrls(urls);

    qCDebug(lcDeepLink) << "listening for schemes" << schemes_;
}

bool DeepLinkPlugin::accepts(const QUrl &url) const
{
    return url.isValid() && schemes_.contains(url.scheme().toLower());
}

QList<QUrl> DeepLinkPlugin::extractUrls(const QStringList &arguments) const
{
    QList<QUrl> urls;
    // The first argument is the program itself.
    for (int i = 1; i < arguments.size(); ++i) {
        const QUrl url(arguments.at(i), QUrl::StrictMode);
        if (accepts(url))
            urls << url;
    }
    return urls;
}

void DeepLinkPlugin::handleUrls(const QList<QUrl> &urls)
{
    QList<QUrl> accepted;
    for (const QUrl &url : urls) {
        if (accepts(url))
            accepted << url;
        else
            qCWarning(lcDeepLink) << "ignoring url with unregistered scheme:" << url.toString();
    }
    if (accepted.isEmpty())
        return;

    current_ = accepted;
    qCInfo(lcDeepLink) << "opened" << accepted;
    emit urlsOpened(accepted);
}

bool DeepLinkPlugin::eventFilter(QObject *watched, QEvent *event)
{
    if (event->type() == QEvent::FileOpen) {
        const QUrl url = static_cast<QFileOpenEvent *>(event)->url();
        if (accepts(url)) {
            handleUrls({url});
            return true;
        }
    }
    return QObject::eventFilter(watched, event);
}

#include "httpplugin.h"
#include "appcontext.h"
#include "diagnostics.h"

#include <QNetworkReply>
#include <QNetworkRequest>

const QString HttpPlugin::kName = QStringLiteral("http");

HttpPlugin::HttpPlugin(const QUrl &baseUrl, const QStringList &scope, QObject *parent)
    : QObject(parent), baseUrl_(baseUrl), scope_(scope)
{
}

QString HttpPlugin::name() const
{
    return kName;
}

void HttpPlugin::initialize(Runtime &runtime)
{
    Q_UNUSED(runtime);

    if (!baseUrl_.isValid())
        throw StartupError(QStringLiteral("invalid server URL %1").arg(baseUrl_.toString()));

    network_.setRedirectPolicy(QNetworkRequest::SameOriginRedirectPolicy);
    qCInfo(lcHttp) << "server" << baseUrl_.toString() << "scope" << scope_;
}

bool HttpPlugin::isAllowed(const QUrl &url) const
{
    const QString scheme = url.scheme().toLower();
    if (scheme != QLatin1String("http") && scheme != QLatin1String("https"))
        return false;
    const QString origin = originOf(url);
    return !origin.isEmpty() && scope_.contains(origin);
}

QUrl HttpPlugin::resolve(const QString &path) const
{
    return baseUrl_.resolved(QUrl(path));
}

QNetworkReply *HttpPlugin::fetch(const QByteArray &method, const QUrl &url, const QByteArray &body)
{
    if (!isAllowed(url)) {
        qCWarning(lcHttp) << "url not allowed by scope:" << url.toString();
        return nullptr;
    }

    QNetworkRequest request(url);
    if (!body.isEmpty())
        request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));

    QNetworkReply *reply = network_.sendCustomRequest(request, method, body);
    connect(reply, &QNetworkReply::errorOccurred, this, [reply](QNetworkReply::NetworkError) {
        qCWarning(lcHttp) << "request failed:" << reply->url().toString() << reply->errorString();
    });
    return reply;
}

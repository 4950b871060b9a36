#ifndef HTTPPLUGIN_H
#define HTTPPLUGIN_H

#include "runtime.h"

#include <QByteArray>
#include <QNetworkAccessManager>
#include <QObject>
#include <QStringList>
#include <QUrl>

class QNetworkReply;

// Outbound HTTP for the front-end, restricted to the configured origins.
class HttpPlugin : public QObject, public Plugin
{
    Q_OBJECT

public:
    static const QString kName;

    HttpPlugin(const QUrl &baseUrl, const QStringList &scope, QObject *parent = nullptr);

    QString name() const override;
    void initialize(Runtime &runtime) override;

    bool isAllowed(const QUrl &url) const;

    // Resolves a path such as "/api/auth/profile" against the base URL.
    QUrl resolve(const QString &path) const;

    // Returns nullptr when the URL is outside the scope. The caller owns the
    // reply and should deleteLater() it once finished.
    QNetworkReply *fetch(const QByteArray &method, const QUrl &url, const QByteArray &body = QByteArray());

    QNetworkAccessManager *network() { return &network_; }

private:
    QNetworkAccessManager network_;
    QUrl baseUrl_;
    QStringList scope_;
};

#endif // HTTPPLUGIN_H

#ifndef DEEPLINKPLUGIN_H
#define DEEPLINKPLUGIN_H

#include "runtime.h"

#include <QList>
#include <QObject>
#include <QStringList>
#include <QUrl>

// Receives custom-scheme URLs, either on the command line at launch or as
// file-open events delivered by the OS while running.
class DeepLinkPlugin : public QObject, public Plugin
{
    Q_OBJECT

public:
    static const QString kName;

    explicit DeepLinkPlugin(const QStringList &schemes, QObject *parent = nullptr);

    QString name() const override;
    void initialize(Runtime &runtime) override;

    QStringList schemes() const { return schemes_; }
    QList<QUrl> currentUrls() const { return current_; }

    bool accepts(const QUrl &url) const;
    QList<QUrl> extractUrls(const QStringList &arguments) const;

    // Records a new batch of URLs; URLs with foreign schemes are dropped.
    void handleUrls(const QList<QUrl> &urls);

signals:
    void urlsOpened(const QList<QUrl> &urls);

protected:
    bool eventFilter(QObject *watched, QEvent *event) override;

private:
    QStringList schemes_;
    QList<QUrl> current_;
};

#endif // DEEPLINKPLUGIN_H

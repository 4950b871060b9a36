#ifndef OPENERPLUGIN_H
#define OPENERPLUGIN_H

#include "runtime.h"

#include <QObject>
#include <QStringList>
#include <QUrl>

// Opens links and files with the user's default handlers.
class OpenerPlugin : public QObject, public Plugin
{
    Q_OBJECT

public:
    static const QString kName;

    explicit OpenerPlugin(QObject *parent = nullptr);

    QString name() const override;
    void initialize(Runtime &runtime) override;

    bool isAllowed(const QUrl &url) const;

    bool openUrl(const QUrl &url) const;
    bool openPath(const QString &path) const;

private:
    QStringList schemes_;
};

#endif // OPENERPLUGIN_H

#ifndef SINGLEINSTANCEPLUGIN_H
#define SINGLEINSTANCEPLUGIN_H

#include "runtime.h"

#include <QLockFile>
#include <QObject>
#include <QString>
#include <QStringList>
#include <functional>
#include <memory>

namespace grpc {
class Server;
}

// Keeps a single running instance per user. The first instance takes a lock
// and serves InstanceService.Activate on a local socket; later launches send
// their arguments there and exit before the event loop starts.
class SingleInstancePlugin : public QObject, public Plugin
{
    Q_OBJECT

public:
    // Runs on the GUI thread of the primary instance.
    using Callback = std::function<void(Runtime &runtime, const QStringList &args, const QString &cwd)>;

    static const QString kName;

    // An empty runtimeDir selects the user's runtime directory.
    SingleInstancePlugin(const QString &identifier, Callback callback,
                         const QString &runtimeDir = QString(), QObject *parent = nullptr);
    ~SingleInstancePlugin() override;

    QString name() const override;
    void initialize(Runtime &runtime) override;

    bool isPrimary() const { return primary_; }
    QString lockPath() const;
    QString socketPath() const;

private:
    class Service;

    void startServer();
    bool notifyPrimary(const QStringList &args, const QString &cwd) const;
    void dispatch(const QStringList &args, const QString &cwd);

    QString identifier_;
    QString runtimeDir_;
    Callback callback_;
    Runtime *runtime_ = nullptr;
    bool primary_ = false;

    std::unique_ptr<QLockFile> lock_;
    std::unique_ptr<Service> service_;
    std::unique_ptr<grpc::Server> server_;
};

#endif // SINGLEINSTANCEPLUGIN_H

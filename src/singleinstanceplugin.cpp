#include "singleinstanceplugin.h"
#include "deeplinkplugin.h"
#include "diagnostics.h"
#include "timesheet/instance.grpc.pb.h"
#include "timesheet/instance.pb.h"

#include <grpcpp/grpcpp.h>
#include <QDir>
#include <QFile>
#include <QStandardPaths>
#include <chrono>

using grpc::Channel;
using grpc::ClientContext;
using grpc::ServerContext;
using grpc::Status;
using timesheet::instance::ActivateReply;
using timesheet::instance::InstanceService;
using timesheet::instance::LaunchRequest;

const QString SingleInstancePlugin::kName = QStringLiteral("single-instance");

class SingleInstancePlugin::Service final : public InstanceService::Service
{
public:
    explicit Service(SingleInstancePlugin *owner) : owner_(owner) {}

    // Called on a gRPC worker thread.
    Status Activate(ServerContext *context, const LaunchRequest *request, ActivateReply *reply) override
    {
        Q_UNUSED(context);

        QStringList args;
        for (const std::string &arg : request->args())
            args << QString::fromStdString(arg);
        const QString cwd = QString::fromStdString(request->cwd());

        SingleInstancePlugin *owner = owner_;
        const bool queued = QMetaObject::invokeMethod(
            owner, [owner, args, cwd]() { owner->dispatch(args, cwd); }, Qt::QueuedConnection);

        reply->set_accepted(queued);
        return Status::OK;
    }

private:
    SingleInstancePlugin *owner_;
};

SingleInstancePlugin::SingleInstancePlugin(const QString &identifier, Callback callback,
                                           const QString &runtimeDir, QObject *parent)
    : QObject(parent), identifier_(identifier), runtimeDir_(runtimeDir), callback_(std::move(callback))
{
    if (runtimeDir_.isEmpty())
        runtimeDir_ = QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    if (runtimeDir_.isEmpty())
        runtimeDir_ = QDir::tempPath();
}

SingleInstancePlugin::~SingleInstancePlugin()
{
    if (server_) {
        server_->Shutdown();
        server_->Wait();
        QFile::remove(socketPath());
    }
}

QString SingleInstancePlugin::name() const
{
    return kName;
}

QString SingleInstancePlugin::lockPath() const
{
    return runtimeDir_ + QLatin1Char('/') + identifier_ + QStringLiteral(".lock");
}

QString SingleInstancePlugin::socketPath() const
{
    return runtimeDir_ + QLatin1Char('/') + identifier_ + QStringLiteral(".sock");
}

void SingleInstancePlugin::initialize(Runtime &runtime)
{
    runtime_ = &runtime;

    if (!QDir().mkpath(runtimeDir_))
        throw StartupError(QStringLiteral("cannot create runtime directory %1").arg(runtimeDir_));

    lock_ = std::make_unique<QLockFile>(lockPath());
    // Only a dead owner makes the lock stale, never its age.
    lock_->setStaleLockTime(0);
    if (lock_->tryLock(0)) {
        primary_ = true;
        startServer();
        return;
    }

    if (lock_->error() != QLockFile::LockFailedError) {
        qCWarning(lcInstance) << "cannot take instance lock" << lockPath() << "error" << lock_->error()
                              << "- running without single-instance enforcement";
        primary_ = true;
        return;
    }

    qint64 pid = 0;
    QString host;
    QString app;
    if (lock_->getLockInfo(&pid, &host, &app))
        qCInfo(lcInstance) << "instance already running with pid" << pid << "on" << host;

    if (!notifyPrimary(runtime.arguments(), QDir::currentPath()))
        throw StartupError(QStringLiteral("instance %1 holds %2 but does not answer").arg(pid).arg(lockPath()));

    runtime.exit(0);
}

void SingleInstancePlugin::startServer()
{
    // We hold the lock, so any socket left here belongs to a dead instance.
    QFile::remove(socketPath());

    service_ = std::make_unique<Service>(this);

    grpc::ServerBuilder builder;
    builder.AddListeningPort("unix:" + socketPath().toStdString(), grpc::InsecureServerCredentials());
    builder.RegisterService(service_.get());
    server_ = builder.BuildAndStart();
    if (!server_)
        throw StartupError(QStringLiteral("cannot listen on %1").arg(socketPath()));

    qCInfo(lcInstance) << "primary instance listening on" << socketPath();
}

bool SingleInstancePlugin::notifyPrimary(const QStringList &args, const QString &cwd) const
{
    std::shared_ptr<Channel> channel =
        grpc::CreateChannel("unix:" + socketPath().toStdString(), grpc::InsecureChannelCredentials());
    std::unique_ptr<InstanceService::Stub> stub = InstanceService::NewStub(channel);

    ClientContext context;
    // The primary may hold the lock a moment before its server is up.
    context.set_wait_for_ready(true);
    context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(3));

    LaunchRequest request;
    for (const QString &arg : args)
        request.add_args(arg.toStdString());
    request.set_cwd(cwd.toStdString());

    ActivateReply reply;
    Status status = stub->Activate(&context, request, &reply);
    if (!status.ok()) {
        qCWarning(lcInstance) << "activate failed:" << status.error_message().c_str();
        return false;
    }
    return reply.accepted();
}

void SingleInstancePlugin::dispatch(const QStringList &args, const QString &cwd)
{
    qCInfo(lcInstance) << "second launch with args" << args << "in" << cwd;
    if (!runtime_)
        return;
    if (callback_)
        callback_(*runtime_, args, cwd);

    // On Linux and Windows the OS starts a new process for a custom-scheme
    // URL, so deep links arrive here rather than as file-open events.
    if (DeepLinkPlugin *deepLink = runtime_->pluginAs<DeepLinkPlugin>(DeepLinkPlugin::kName)) {
        const QList<QUrl> urls = deepLink->extractUrls(args);
        if (!urls.isEmpty())
            deepLink->handleUrls(urls);
    }
}

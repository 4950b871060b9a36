#include "fakeruntime.h"
#include "diagnostics.h"
#include "windowpositioner.h"

namespace {

void throwingFatalHandler(const QString &message)
{
    throw FatalError(message);
}

QString policyName(ActivationPolicy policy)
{
    switch (policy) {
    case ActivationPolicy::Regular:
        return QStringLiteral("regular");
    case ActivationPolicy::Accessory:
        return QStringLiteral("accessory");
    case ActivationPolicy::Prohibited:
        return QStringLiteral("prohibited");
    }
    return QString();
}

} // namespace

FatalGuard::FatalGuard()
    : previous_(setFatalHandler(throwingFatalHandler))
{
}

FatalGuard::~FatalGuard()
{
    setFatalHandler(previous_);
}

FakeRuntime::FakeRuntime()
    : arguments_({QStringLiteral("timesheet")})
{
}

FakeRuntime::~FakeRuntime()
{
    plugins_.clear();
}

FakeWindow *FakeRuntime::addWindow(const QString &label)
{
    windows_.push_back(std::make_unique<FakeWindow>(label));
    return windows_.back().get();
}

void FakeRuntime::fireTrayEvent(const TrayIconEvent &event)
{
    if (!trays.empty() && trays.front().onEvent)
        trays.front().onEvent(*this, event);
}

void FakeRuntime::installPlugin(std::unique_ptr<Plugin> plugin)
{
    journal << QStringLiteral("plugin:") + plugin->name();
    plugin->initialize(*this);
    plugins_.push_back(std::move(plugin));
}

Plugin *FakeRuntime::plugin(const QString &name) const
{
    for (const auto &plugin : plugins_) {
        if (plugin->name() == name)
            return plugin.get();
    }
    return nullptr;
}

Window *FakeRuntime::window(const QString &label) const
{
    for (const auto &window : windows_) {
        if (window->label() == label)
            return window.get();
    }
    return nullptr;
}

QList<Window *> FakeRuntime::windows() const
{
    QList<Window *> result;
    for (const auto &window : windows_)
        result << window.get();
    return result;
}

void FakeRuntime::createTrayIcon(const TrayIconSpec &spec)
{
    if (failTray)
        throw StartupError(QStringLiteral("system tray is not available"));
    journal << QStringLiteral("tray:") + spec.id;
    trays.push_back(spec);
}

void FakeRuntime::setActivationPolicy(ActivationPolicy policy)
{
    journal << QStringLiteral("activation:") + policyName(policy);
}

void FakeRuntime::setCommandTable(CommandTable table)
{
    journal << QStringLiteral("commands:%1").arg(table.size());
    commands = std::move(table);
}

void FakeRuntime::exit(int code)
{
    journal << QStringLiteral("exit:%1").arg(code);
    exitRequested_ = true;
    exitCode_ = code;
}

int FakeRuntime::exec()
{
    journal << QStringLiteral("exec");
    return execResult;
}

RecordingIntegrations::RecordingIntegrations(const QString &settingsPath)
    : settingsPath_(settingsPath)
{
}

std::unique_ptr<Plugin> RecordingIntegrations::http()
{
    created << QStringLiteral("http");
    return std::make_unique<NamedPlugin>(QStringLiteral("http"));
}

std::unique_ptr<Plugin> RecordingIntegrations::singleInstance(SingleInstancePlugin::Callback callback)
{
    created << QStringLiteral("single-instance");
    singleInstanceCallback = std::move(callback);
    return std::make_unique<NamedPlugin>(QStringLiteral("single-instance"));
}

std::unique_ptr<Plugin> RecordingIntegrations::positioner()
{
    created << QStringLiteral("positioner");
    return std::make_unique<WindowPositioner>(settingsPath_);
}

std::unique_ptr<Plugin> RecordingIntegrations::deepLink()
{
    created << QStringLiteral("deep-link");
    return std::make_unique<NamedPlugin>(QStringLiteral("deep-link"));
}

std::unique_ptr<Plugin> RecordingIntegrations::opener()
{
    created << QStringLiteral("opener");
    return std::make_unique<NamedPlugin>(QStringLiteral("opener"));
}

TrayIconBuilder RecordingIntegrations::trayIcon()
{
    TrayIconBuilder builder(QStringLiteral("main"));
    builder.icon(QStringLiteral(":/icons/tray.svg")).tooltip(QStringLiteral("Timesheet"));
    return builder;
}

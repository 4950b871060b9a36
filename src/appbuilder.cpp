#include "appbuilder.h"
#include "diagnostics.h"

#include <stdexcept>

AppBuilder &AppBuilder::plugin(std::unique_ptr<Plugin> plugin)
{
    if (!plugin)
        throw std::logic_error("null plugin");
    const QString name = plugin->name();
    for (const Step &step : steps_) {
        if (step.plugin && step.name == name)
            throw std::logic_error("plugin " + name.toStdString() + " registered twice");
    }
    steps_.push_back({name, std::move(plugin), SetupHook()});
    return *this;
}

AppBuilder &AppBuilder::setup(SetupHook hook)
{
    if (hasSetup_)
        throw std::logic_error("setup hook registered twice");
    hasSetup_ = true;
    steps_.push_back({QStringLiteral("setup"), nullptr, std::move(hook)});
    return *this;
}

AppBuilder &AppBuilder::invokeHandler(CommandTable commands)
{
    commands_ = std::move(commands);
    return *this;
}

QStringList AppBuilder::steps() const
{
    QStringList names;
    for (const Step &step : steps_)
        names << step.name;
    return names;
}

int AppBuilder::run(Runtime &runtime)
{
    if (ran_)
        throw std::logic_error("AppBuilder::run called twice");
    ran_ = true;

    try {
        for (Step &step : steps_) {
            if (step.plugin) {
                qCDebug(lcApp) << "installing" << step.name;
                runtime.installPlugin(std::move(step.plugin));
            } else if (step.setup) {
                qCDebug(lcApp) << "running setup";
                step.setup(runtime);
            }

            if (runtime.exitRequested()) {
                qCInfo(lcApp) << "exit requested during startup, code" << runtime.exitCode();
                return runtime.exitCode();
            }
        }
        runtime.setCommandTable(std::move(commands_));
        steps_.clear();
        return runtime.exec();
    } catch (const std::exception &e) {
        // StartupError and anything else an integration or the setup hook throws.
        fatal(QStringLiteral("error while running application: %1").arg(QString::fromStdString(e.what())));
    }
}

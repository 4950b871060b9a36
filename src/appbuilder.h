#ifndef APPBUILDER_H
#define APPBUILDER_H

#include "commandtable.h"
#include "runtime.h"

#include <QStringList>
#include <functional>
#include <memory>
#include <vector>

// Collects integrations, the setup hook and the command table, then runs
// them against a Runtime in the order they were registered.
class AppBuilder
{
public:
    // May throw StartupError to abort startup.
    using SetupHook = std::function<void(Runtime &)>;

    AppBuilder() = default;
    AppBuilder(const AppBuilder &) = delete;
    AppBuilder &operator=(const AppBuilder &) = delete;

    // Throws std::logic_error if a plugin with the same name was registered.
    AppBuilder &plugin(std::unique_ptr<Plugin> plugin);

    // Only one setup hook is allowed.
    AppBuilder &setup(SetupHook hook);

    AppBuilder &invokeHandler(CommandTable commands);

    // Names of the registered steps in order; the setup hook shows up as "setup".
    QStringList steps() const;

    // Installs every step, then enters the event loop. An exception from any
    // step is fatal and the event loop is never entered. Returns early with the
    // runtime's exit code if an integration asked the process to exit.
    int run(Runtime &runtime);

private:
    struct Step
    {
        QString name;
        std::unique_ptr<Plugin> plugin;
        SetupHook setup;
    };

    std::vector<Step> steps_;
    CommandTable commands_;
    bool hasSetup_ = false;
    bool ran_ = false;
};

#endif // APPBUILDER_H

#ifndef BOOTSTRAPPER_H
#define BOOTSTRAPPER_H

#include "appbuilder.h"
#include "integrations.h"
#include "platform.h"
#include "runtime.h"

#include <QString>
#include <QStringList>

// Assembles the application: which integrations are installed, in what
// order, and what happens on a second launch and on tray events.
class Bootstrapper
{
public:
    static const QString kMainWindow;

    explicit Bootstrapper(Integrations &integrations);

    // Composes for the platform this binary was built for and runs the event
    // loop. Returns the exit code; startup failures terminate the process.
    int run(Runtime &runtime);

    template <Platform P>
    void compose(AppBuilder &builder);

    // Second-launch handler. The launch arguments and working directory are
    // not used for routing; a missing main window is fatal.
    static void focusMainWindow(Runtime &runtime, const QStringList &args, const QString &cwd);

    // Desktop setup: window position memory, the tray icon bound to it, and
    // the accessory activation policy. Throws StartupError if the tray icon
    // cannot be built.
    void setupDesktop(Runtime &runtime);

private:
    Integrations &integrations_;
};

template <Platform P>
void Bootstrapper::compose(AppBuilder &builder)
{
    builder.plugin(integrations_.http());

    if constexpr (isDesktop(P))
        builder.plugin(integrations_.singleInstance(&Bootstrapper::focusMainWindow));

    builder.setup([this](Runtime &runtime) {
        if constexpr (isDesktop(P))
            setupDesktop(runtime);
        else
            static_cast<void>(runtime);
    });

    builder.plugin(integrations_.deepLink());
    builder.plugin(integrations_.opener());
    builder.invokeHandler(CommandTable());
}

#endif // BOOTSTRAPPER_H

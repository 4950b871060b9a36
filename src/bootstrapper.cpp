#include "bootstrapper.h"
#include "diagnostics.h"
#include "windowpositioner.h"

const QString Bootstrapper::kMainWindow = QStringLiteral("main");

Bootstrapper::Bootstrapper(Integrations &integrations)
    : integrations_(integrations)
{
}

int Bootstrapper::run(Runtime &runtime)
{
    AppBuilder builder;
    compose<kPlatform>(builder);
    qCDebug(lcApp) << "startup steps" << builder.steps();
    return builder.run(runtime);
}

void Bootstrapper::focusMainWindow(Runtime &runtime, const QStringList &args, const QString &cwd)
{
    Q_UNUSED(args);
    Q_UNUSED(cwd);

    Window *window = runtime.window(kMainWindow);
    if (!window)
        fatal(QStringLiteral("no main window"));
    window->setFocus();
}

void Bootstrapper::setupDesktop(Runtime &runtime)
{
    runtime.installPlugin(integrations_.positioner());

    integrations_.trayIcon()
        .onTrayIconEvent([](Runtime &app, const TrayIconEvent &event) {
            WindowPositioner::handleTrayEvent(app, event);
        })
        .build(runtime);

    runtime.setActivationPolicy(ActivationPolicy::Accessory);
}

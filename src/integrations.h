#ifndef INTEGRATIONS_H
#define INTEGRATIONS_H

#include "appcontext.h"
#include "runtime.h"
#include "singleinstanceplugin.h"
#include "traybuilder.h"

#include <memory>

// Creates the integrations the bootstrapper installs. Each call returns a
// fresh plugin; the runtime takes ownership once it is installed.
class Integrations
{
public:
    virtual ~Integrations() = default;

    virtual std::unique_ptr<Plugin> http() = 0;
    virtual std::unique_ptr<Plugin> singleInstance(SingleInstancePlugin::Callback callback) = 0;
    virtual std::unique_ptr<Plugin> positioner() = 0;
    virtual std::unique_ptr<Plugin> deepLink() = 0;
    virtual std::unique_ptr<Plugin> opener() = 0;

    // Builder preloaded with the application's tray icon and tooltip.
    virtual TrayIconBuilder trayIcon() = 0;
};

class DefaultIntegrations : public Integrations
{
public:
    explicit DefaultIntegrations(const AppContext &context);

    std::unique_ptr<Plugin> http() override;
    std::unique_ptr<Plugin> singleInstance(SingleInstancePlugin::Callback callback) override;
    std::unique_ptr<Plugin> positioner() override;
    std::unique_ptr<Plugin> deepLink() override;
    std::unique_ptr<Plugin> opener() override;
    TrayIconBuilder trayIcon() override;

private:
    AppContext context_;
};

#endif // INTEGRATIONS_H

#include "integrations.h"
#include "deeplinkplugin.h"
#include "httpplugin.h"
#include "openerplugin.h"
#include "windowpositioner.h"

DefaultIntegrations::DefaultIntegrations(const AppContext &context)
    : context_(context)
{
}

std::unique_ptr<Plugin> DefaultIntegrations::http()
{
    return std::make_unique<HttpPlugin>(context_.serverUrl, context_.httpScope);
}

std::unique_ptr<Plugin> DefaultIntegrations::singleInstance(SingleInstancePlugin::Callback callback)
{
    return std::make_unique<SingleInstancePlugin>(context_.identifier, std::move(callback));
}

std::unique_ptr<Plugin> DefaultIntegrations::positioner()
{
    return std::make_unique<WindowPositioner>();
}

std::unique_ptr<Plugin> DefaultIntegrations::deepLink()
{
    return std::make_unique<DeepLinkPlugin>(context_.deepLinkSchemes);
}

std::unique_ptr<Plugin> DefaultIntegrations::opener()
{
    return std::make_unique<OpenerPlugin>();
}

TrayIconBuilder DefaultIntegrations::trayIcon()
{
    TrayIconBuilder builder(QStringLiteral("main"));
    builder.icon(context_.trayIcon).tooltip(context_.trayTooltip);
    return builder;
}

#include "appcontext.h"
#include "bootstrapper.h"
#include "integrations.h"
#include "qtruntime.h"
#include <QApplication>

int main(int argc, char *argv[])
{
    // The icons live in a static library, so the resource has to be pulled in here.
    Q_INIT_RESOURCE(timesheet);

    QApplication a(argc, argv);

    const AppContext context = AppContext::generate();

    // Set application metadata
    a.setApplicationName(context.productName);
    a.setOrganizationName(context.organization);
    a.setApplicationVersion(context.version);
    a.setDesktopFileName(context.identifier);

    QtRuntime runtime(a, context);
    DefaultIntegrations integrations(context);
    Bootstrapper bootstrapper(integrations);

    return bootstrapper.run(runtime);
}

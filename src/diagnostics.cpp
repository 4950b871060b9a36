#include "diagnostics.h"

#include <cstdlib>

Q_LOGGING_CATEGORY(lcApp, "timesheet.app")
Q_LOGGING_CATEGORY(lcInstance, "timesheet.instance")
Q_LOGGING_CATEGORY(lcTray, "timesheet.tray")
Q_LOGGING_CATEGORY(lcPositioner, "timesheet.positioner")
Q_LOGGING_CATEGORY(lcDeepLink, "timesheet.deeplink")
Q_LOGGING_CATEGORY(lcHttp, "timesheet.http")
Q_LOGGING_CATEGORY(lcOpener, "timesheet.opener")

namespace {

void qtFatalHandler(const QString &message)
{
    qFatal("%s", qPrintable(message));
}

FatalHandler fatalHandler = qtFatalHandler;

} // namespace

FatalHandler setFatalHandler(FatalHandler handler)
{
    FatalHandler previous = fatalHandler;
    fatalHandler = handler ? handler : qtFatalHandler;
    return previous;
}

void fatal(const QString &message)
{
    fatalHandler(message);
    std::abort();
}

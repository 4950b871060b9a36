#ifndef DIAGNOSTICS_H
#define DIAGNOSTICS_H

#include <QLoggingCategory>
#include <QString>
#include <stdexcept>

Q_DECLARE_LOGGING_CATEGORY(lcApp)
Q_DECLARE_LOGGING_CATEGORY(lcInstance)
Q_DECLARE_LOGGING_CATEGORY(lcTray)
Q_DECLARE_LOGGING_CATEGORY(lcPositioner)
Q_DECLARE_LOGGING_CATEGORY(lcDeepLink)
Q_DECLARE_LOGGING_CATEGORY(lcHttp)
Q_DECLARE_LOGGING_CATEGORY(lcOpener)

// Raised while the application is being assembled (integration setup, tray
// construction). The builder turns it into a fatal diagnostic.
class StartupError : public std::runtime_error
{
public:
    explicit StartupError(const QString &message)
        : std::runtime_error(message.toStdString())
    {
    }
};

using FatalHandler = void (*)(const QString &message);

// Installs the handler used by fatal() and returns the previous one.
// The default handler forwards to qFatal.
FatalHandler setFatalHandler(FatalHandler handler);

// Terminates the process with a diagnostic. A handler that returns is
// followed by std::abort().
[[noreturn]] void fatal(const QString &message);

#endif // DIAGNOSTICS_H

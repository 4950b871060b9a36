#ifndef RUNTIME_H
#define RUNTIME_H

#include <QList>
#include <QPoint>
#include <QRect>
#include <QString>
#include <QStringList>
#include <functional>
#include <memory>

class CommandTable;
class Runtime;

enum class ActivationPolicy
{
    Regular,
    Accessory,
    Prohibited
};

// A top-level window known to the runtime by its label.
class Window
{
public:
    enum class GeometryChange
    {
        Moved,
        Resized,
        Closing
    };

    using GeometryObserver = std::function<void(const Window &window, GeometryChange change)>;

    virtual ~Window() = default;

    virtual QString label() const = 0;
    virtual void setFocus() = 0;
    virtual void show() = 0;
    virtual void hide() = 0;
    virtual bool isVisible() const = 0;

    // Frame geometry in global coordinates.
    virtual QRect geometry() const = 0;
    virtual void setGeometry(const QRect &geometry) = 0;
    virtual void move(const QPoint &topLeft) = 0;

    // Available geometry of the screen the window is on.
    virtual QRect screenGeometry() const = 0;

    // Observers run after the user or the window manager moves, resizes or
    // closes the window.
    virtual void addGeometryObserver(GeometryObserver observer) = 0;
};

struct TrayIconEvent
{
    enum class Kind
    {
        Click,
        DoubleClick,
        MiddleClick,
        ContextMenu,
        Unknown
    };

    Kind kind = Kind::Unknown;
    QRect iconRect;  // tray icon rectangle in global coordinates, may be null
    QPoint position; // cursor position when the event fired
};

using TrayIconEventHandler = std::function<void(Runtime &, const TrayIconEvent &)>;

struct TrayIconSpec
{
    QString id;
    QString icon;
    QString tooltip;
    TrayIconEventHandler onEvent;
};

// An integration installed into the runtime. Each one has a unique name.
class Plugin
{
public:
    virtual ~Plugin() = default;

    virtual QString name() const = 0;

    // Called once when the plugin is installed. May throw StartupError.
    virtual void initialize(Runtime &runtime) = 0;
};

// The live application handle handed to integrations and to setup.
class Runtime
{
public:
    virtual ~Runtime() = default;

    virtual QStringList arguments() const = 0;

    // Takes ownership and initializes the plugin. Throws StartupError when
    // initialization fails.
    virtual void installPlugin(std::unique_ptr<Plugin> plugin) = 0;
    virtual Plugin *plugin(const QString &name) const = 0;

    virtual Window *window(const QString &label) const = 0;
    virtual QList<Window *> windows() const = 0;

    // Throws StartupError when the tray icon cannot be created.
    virtual void createTrayIcon(const TrayIconSpec &spec) = 0;

    virtual void setActivationPolicy(ActivationPolicy policy) = 0;
    virtual void setCommandTable(CommandTable commands) = 0;

    // Requests termination with the given code. Before exec() this stops
    // startup; afterwards it quits the event loop.
    virtual void exit(int code) = 0;
    virtual bool exitRequested() const = 0;
    virtual int exitCode() const = 0;

    // Runs the event loop and returns its exit code.
    virtual int exec() = 0;

    template <typename T>
    T *pluginAs(const QString &name) const
    {
        return dynamic_cast<T *>(plugin(name));
    }
};

#endif // RUNTIME_H

#ifndef QTRUNTIME_H
#define QTRUNTIME_H

#include "appcontext.h"
#include "commandtable.h"
#include "runtime.h"

#include <QApplication>
#include <QMenu>
#include <QObject>
#include <QPointer>
#include <QSystemTrayIcon>
#include <memory>
#include <vector>

class MainWindow;

// Window backed by a QWidget.
class WidgetWindow : public QObject, public Window
{
    Q_OBJECT

public:
    WidgetWindow(const QString &label, QWidget *widget);

    QString label() const override { return label_; }
    void setFocus() override;
    void show() override;
    void hide() override;
    bool isVisible() const override;
    QRect geometry() const override;
    void setGeometry(const QRect &geometry) override;
    void move(const QPoint &topLeft) override;
    QRect screenGeometry() const override;
    void addGeometryObserver(GeometryObserver observer) override;

    QWidget *widget() const { return widget_; }

protected:
    bool eventFilter(QObject *watched, QEvent *event) override;

private:
    void notify(GeometryChange change);

    QString label_;
    QPointer<QWidget> widget_;
    std::vector<GeometryObserver> observers_;
};

// Runtime over a QApplication. Creates the windows described by the context
// and owns every plugin and tray icon for the lifetime of the process.
class QtRuntime : public Runtime
{
public:
    QtRuntime(QApplication &app, const AppContext &context);
    ~QtRuntime() override;

    QStringList arguments() const override;

    void installPlugin(std::unique_ptr<Plugin> plugin) override;
    Plugin *plugin(const QString &name) const override;

    Window *window(const QString &label) const override;
    QList<Window *> windows() const override;

    void createTrayIcon(const TrayIconSpec &spec) override;

    // Context menu attached to every tray icon: Show brings back the main
    // window, Quit ends the event loop.
    std::unique_ptr<QMenu> createTrayMenu();

    // Throws StartupError when the icon file is missing or unreadable.
    static QIcon loadTrayIcon(const QString &path);
    static TrayIconEvent::Kind trayEventKind(QSystemTrayIcon::ActivationReason reason);

    void setActivationPolicy(ActivationPolicy policy) override;
    void setCommandTable(CommandTable commands) override;
    const CommandTable &commands() const { return commands_; }

    void exit(int code) override;
    bool exitRequested() const override { return exitRequested_; }
    int exitCode() const override { return exitCode_; }

    int exec() override;

private:
    struct ManagedWindow
    {
        std::unique_ptr<MainWindow> widget;
        std::unique_ptr<WidgetWindow> handle;
        bool visibleAtStart = true;
    };

    QApplication &app_;
    AppContext context_;
    std::vector<ManagedWindow> windows_;
    std::vector<std::unique_ptr<Plugin>> plugins_;
    std::vector<std::unique_ptr<QMenu>> trayMenus_;
    std::vector<std::unique_ptr<QSystemTrayIcon>> trays_;
    CommandTable commands_;
    ActivationPolicy policy_ = ActivationPolicy::Regular;
    bool exitRequested_ = false;
    int exitCode_ = 0;
};

#endif // QTRUNTIME_H

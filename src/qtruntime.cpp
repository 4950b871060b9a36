#include "qtruntime.h"
#include "deeplinkplugin.h"
#include "diagnostics.h"
#include "mainwindow.h"

#include <QAction>
#include <QCursor>
#include <QEvent>
#include <QFile>
#include <QIcon>
#include <QScreen>

TrayIconEvent::Kind QtRuntime::trayEventKind(QSystemTrayIcon::ActivationReason reason)
{
    switch (reason) {
    case QSystemTrayIcon::Trigger:
        return TrayIconEvent::Kind::Click;
    case QSystemTrayIcon::DoubleClick:
        return TrayIconEvent::Kind::DoubleClick;
    case QSystemTrayIcon::MiddleClick:
        return TrayIconEvent::Kind::MiddleClick;
    case QSystemTrayIcon::Context:
        return TrayIconEvent::Kind::ContextMenu;
    default:
        return TrayIconEvent::Kind::Unknown;
    }
}

WidgetWindow::WidgetWindow(const QString &label, QWidget *widget)
    : label_(label), widget_(widget)
{
    if (widget_)
        widget_->installEventFilter(this);
}

void WidgetWindow::setFocus()
{
    if (!widget_)
        return;
    if (widget_->isMinimized() || !widget_->isVisible())
        widget_->showNormal();
    widget_->raise();
    widget_->activateWindow();
}

void WidgetWindow::show()
{
    if (widget_)
        widget_->show();
}

void WidgetWindow::hide()
{
    if (widget_)
        widget_->hide();
}

bool WidgetWindow::isVisible() const
{
    return widget_ && widget_->isVisible();
}

QRect WidgetWindow::geometry() const
{
    if (!widget_)
        return QRect();
    // pos() includes the frame, size() does not; setGeometry() reverses this.
    return QRect(widget_->pos(), widget_->size());
}

void WidgetWindow::setGeometry(const QRect &geometry)
{
    if (!widget_)
        return;
    widget_->resize(geometry.size());
    widget_->move(geometry.topLeft());
}

void WidgetWindow::move(const QPoint &topLeft)
{
    if (widget_)
        widget_->move(topLeft);
}

QRect WidgetWindow::screenGeometry() const
{
    if (!widget_)
        return QRect();
    QScreen *screen = widget_->screen();
    return screen ? screen->availableGeometry() : QRect();
}

void WidgetWindow::addGeometryObserver(GeometryObserver observer)
{
    if (observer)
        observers_.push_back(std::move(observer));
}

bool WidgetWindow::eventFilter(QObject *watched, QEvent *event)
{
    if (watched == widget_) {
        switch (event->type()) {
        case QEvent::Move:
            notify(GeometryChange::Moved);
            break;
        case QEvent::Resize:
            notify(GeometryChange::Resized);
            break;
        case QEvent::Close:
            notify(GeometryChange::Closing);
            break;
        default:
            break;
        }
    }
    return QObject::eventFilter(watched, event);
}

void WidgetWindow::notify(GeometryChange change)
{
    for (const GeometryObserver &observer : observers_)
        observer(*this, change);
}

QtRuntime::QtRuntime(QApplication &app, const AppContext &context)
    : app_(app), context_(context)
{
    for (const WindowConfig &config : context_.windows) {
        ManagedWindow managed;
        managed.widget = std::make_unique<MainWindow>(config, context_.serverUrl);
        managed.handle = std::make_unique<WidgetWindow>(config.label, managed.widget.get());
        managed.visibleAtStart = config.visible;
        windows_.push_back(std::move(managed));
    }
}

QtRuntime::~QtRuntime()
{
    // Plugins may still look at windows while they shut down.
    plugins_.clear();
    trays_.clear();
    trayMenus_.clear();
}

QStringList QtRuntime::arguments() const
{
    return QCoreApplication::arguments();
}

void QtRuntime::installPlugin(std::unique_ptr<Plugin> plugin)
{
    if (this->plugin(plugin->name()))
        throw StartupError(QStringLiteral("plugin %1 is already installed").arg(plugin->name()));

    plugin->initialize(*this);

    if (auto *deepLink = dynamic_cast<DeepLinkPlugin *>(plugin.get())) {
        for (ManagedWindow &managed : windows_) {
            QObject::connect(deepLink, &DeepLinkPlugin::urlsOpened,
                             managed.widget.get(), &MainWindow::showDeepLinks);
            if (!deepLink->currentUrls().isEmpty())
                managed.widget->showDeepLinks(deepLink->currentUrls());
        }
    }

    qCDebug(lcApp) << "installed plugin" << plugin->name();
    plugins_.push_back(std::move(plugin));
}

Plugin *QtRuntime::plugin(const QString &name) const
{
    for (const std::unique_ptr<Plugin> &plugin : plugins_) {
        if (plugin->name() == name)
            return plugin.get();
    }
    return nullptr;
}

Window *QtRuntime::window(const QString &label) const
{
    for (const ManagedWindow &managed : windows_) {
        if (managed.handle->label() == label)
            return managed.handle.get();
    }
    return nullptr;
}

QList<Window *> QtRuntime::windows() const
{
    QList<Window *> result;
    for (const ManagedWindow &managed : windows_)
        result << managed.handle.get();
    return result;
}

void QtRuntime::createTrayIcon(const TrayIconSpec &spec)
{
    if (!QSystemTrayIcon::isSystemTrayAvailable())
        throw StartupError(QStringLiteral("system tray is not available"));

    auto tray = std::make_unique<QSystemTrayIcon>(loadTrayIcon(spec.icon));
    tray->setToolTip(spec.tooltip);

    trayMenus_.push_back(createTrayMenu());
    tray->setContextMenu(trayMenus_.back().get());

    QSystemTrayIcon *trayIcon = tray.get();
    const TrayIconEventHandler handler = spec.onEvent;
    QObject::connect(trayIcon, &QSystemTrayIcon::activated, trayIcon,
                     [this, trayIcon, handler](QSystemTrayIcon::ActivationReason reason) {
                         TrayIconEvent event;
                         event.kind = trayEventKind(reason);
                         event.iconRect = trayIcon->geometry();
                         event.position = QCursor::pos();
                         if (handler)
                             handler(*this, event);
                     });

    tray->show();
    trays_.push_back(std::move(tray));

    for (ManagedWindow &managed : windows_)
        managed.widget->setHideOnClose(true);

    qCInfo(lcTray) << "tray icon" << spec.id << "created";
}

std::unique_ptr<QMenu> QtRuntime::createTrayMenu()
{
    auto menu = std::make_unique<QMenu>();

    QAction *showAction = menu->addAction(QObject::tr("Show"));
    QObject::connect(showAction, &QAction::triggered, showAction, [this]() {
        if (!windows_.empty())
            windows_.front().handle->setFocus();
    });

    QAction *quitAction = menu->addAction(QObject::tr("Quit"));
    QObject::connect(quitAction, &QAction::triggered, qApp, &QCoreApplication::quit);

    return menu;
}

QIcon QtRuntime::loadTrayIcon(const QString &path)
{
    if (!QFile::exists(path))
        throw StartupError(QStringLiteral("tray icon %1 not found").arg(path));
    const QIcon icon(path);
    if (icon.isNull())
        throw StartupError(QStringLiteral("tray icon %1 could not be loaded").arg(path));
    return icon;
}

void QtRuntime::setActivationPolicy(ActivationPolicy policy)
{
    policy_ = policy;
    const bool background = policy != ActivationPolicy::Regular;

    // Keep running with every window closed and stay out of the taskbar.
    app_.setQuitOnLastWindowClosed(!background);
    // Qt::Tool shares bits with Qt::Window, so swap the whole window type.
    for (ManagedWindow &managed : windows_) {
        const Qt::WindowFlags flags = managed.widget->windowFlags() & ~Qt::WindowType_Mask;
        managed.widget->setWindowFlags(flags | (background ? Qt::Tool : Qt::Window));
    }

    qCInfo(lcApp) << "activation policy" << int(policy);
}

void QtRuntime::setCommandTable(CommandTable commands)
{
    commands_ = std::move(commands);
    qCDebug(lcApp) << "commands" << commands_.names();
}

void QtRuntime::exit(int code)
{
    exitRequested_ = true;
    exitCode_ = code;
    QCoreApplication::exit(code);
}

int QtRuntime::exec()
{
    if (policy_ != ActivationPolicy::Prohibited) {
        for (ManagedWindow &managed : windows_) {
            if (managed.visibleAtStart)
                managed.widget->show();
        }
    }

    qCInfo(lcApp) << "entering event loop";
    return app_.exec();
}

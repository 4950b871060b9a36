#include "windowpositioner.h"
#include "diagnostics.h"

#include <QCoreApplication>
#include <QPointer>
#include <algorithm>

const QString WindowPositioner::kName = QStringLiteral("positioner");

namespace {

// Moves arrive continuously while dragging; write once things settle.
constexpr int kSyncDelayMs = 500;

bool isTrayPosition(WindowPositioner::Position position)
{
    switch (position) {
    case WindowPositioner::Position::TrayLeft:
    case WindowPositioner::Position::TrayRight:
    case WindowPositioner::Position::TrayCenter:
    case WindowPositioner::Position::TrayBottomLeft:
    case WindowPositioner::Position::TrayBottomRight:
    case WindowPositioner::Position::TrayBottomCenter:
        return true;
    default:
        return false;
    }
}

// Keeps as much of the window on screen as possible.
QPoint clampToScreen(const QPoint &point, const QSize &size, const QRect &screen)
{
    if (screen.isNull())
        return point;
    const int maxX = std::max(screen.x(), screen.x() + screen.width() - size.width());
    const int maxY = std::max(screen.y(), screen.y() + screen.height() - size.height());
    return QPoint(std::clamp(point.x(), screen.x(), maxX), std::clamp(point.y(), screen.y(), maxY));
}

} // namespace

WindowPositioner::WindowPositioner(const QString &settingsPath, QObject *parent)
    : QObject(parent)
    , settings_(settingsPath.isEmpty() ? std::make_unique<QSettings>()
                                       : std::make_unique<QSettings>(settingsPath, QSettings::IniFormat))
{
    syncTimer_.setSingleShot(true);
    syncTimer_.setInterval(kSyncDelayMs);
    connect(&syncTimer_, &QTimer::timeout, this, [this]() { settings_->sync(); });
}

QString WindowPositioner::name() const
{
    return kName;
}

void WindowPositioner::initialize(Runtime &runtime)
{
    runtime_ = &runtime;

    for (Window *window : runtime.windows()) {
        restoreState(*window);
        trackWindow(*window);
    }

    if (QCoreApplication *app = QCoreApplication::instance())
        connect(app, &QCoreApplication::aboutToQuit, this, &WindowPositioner::saveAll);
}

void WindowPositioner::onTrayEvent(const TrayIconEvent &event)
{
    if (event.iconRect.isValid()) {
        trayRect_ = event.iconRect;
    } else if (!event.position.isNull()) {
        // Some platforms report no icon geometry; the cursor is the next best anchor.
        trayRect_ = QRect(event.position, QSize(1, 1));
    }
    qCDebug(lcPositioner) << "tray event" << int(event.kind) << "tray rect" << trayRect_;
}

bool WindowPositioner::moveWindow(Window &window, Position position) const
{
    bool ok = false;
    const QPoint topLeft = positionFor(position, window.screenGeometry(), window.geometry().size(), trayRect_, &ok);
    if (!ok) {
        qCWarning(lcPositioner) << "tray position requested before any tray event for" << window.label();
        return false;
    }
    window.move(topLeft);
    return true;
}

void WindowPositioner::trackWindow(Window &window)
{
    QPointer<WindowPositioner> self(this);
    window.addGeometryObserver([self](const Window &changed, Window::GeometryChange change) {
        if (!self)
            return;
        self->saveState(changed);
        if (change == Window::GeometryChange::Closing) {
            self->syncTimer_.stop();
            self->settings_->sync();
        } else {
            self->syncTimer_.start();
        }
    });
}

bool WindowPositioner::restoreState(Window &window) const
{
    const QRect saved = settings_->value(geometryKey(window.label())).toRect();
    if (!saved.isValid())
        return false;

    QRect geometry = saved;
    const QRect screen = window.screenGeometry();
    if (!screen.isNull() && !screen.intersects(saved)) {
        // Saved on a screen that is gone; keep the size, bring it back.
        geometry.moveTopLeft(positionFor(Position::Center, screen, saved.size(), QRect()));
    }
    window.setGeometry(geometry);
    qCDebug(lcPositioner) << "restored" << window.label() << geometry;
    return true;
}

void WindowPositioner::saveState(const Window &window)
{
    settings_->setValue(geometryKey(window.label()), window.geometry());
}

void WindowPositioner::saveAll()
{
    if (!runtime_)
        return;
    for (Window *window : runtime_->windows())
        saveState(*window);
    settings_->sync();
    if (settings_->status() != QSettings::NoError)
        qCWarning(lcPositioner) << "could not write window state to" << settings_->fileName();
}

QPoint WindowPositioner::positionFor(Position position, const QRect &screen, const QSize &size,
                                     const QRect &tray, bool *ok)
{
    if (ok)
        *ok = true;

    if (isTrayPosition(position) && tray.isNull()) {
        if (ok)
            *ok = false;
        return QPoint();
    }

    const int left = screen.x();
    const int top = screen.y();
    const int right = screen.x() + screen.width() - size.width();
    const int bottom = screen.y() + screen.height() - size.height();
    const int centerX = screen.x() + (screen.width() - size.width()) / 2;
    const int centerY = screen.y() + (screen.height() - size.height()) / 2;

    const int trayCenterX = tray.x() + (tray.width() - size.width()) / 2;
    const int aboveTray = tray.y() - size.height();
    const int belowTray = tray.y() + tray.height();

    switch (position) {
    case Position::TopLeft:
        return QPoint(left, top);
    case Position::TopRight:
        return QPoint(right, top);
    case Position::BottomLeft:
        return QPoint(left, bottom);
    case Position::BottomRight:
        return QPoint(right, bottom);
    case Position::TopCenter:
        return QPoint(centerX, top);
    case Position::BottomCenter:
        return QPoint(centerX, bottom);
    case Position::LeftCenter:
        return QPoint(left, centerY);
    case Position::RightCenter:
        return QPoint(right, centerY);
    case Position::Center:
        return QPoint(centerX, centerY);
    case Position::TrayLeft:
        return clampToScreen(QPoint(tray.x(), aboveTray), size, screen);
    case Position::TrayRight:
        return clampToScreen(QPoint(tray.x() + tray.width() - size.width(), aboveTray), size, screen);
    case Position::TrayCenter:
        return clampToScreen(QPoint(trayCenterX, aboveTray), size, screen);
    case Position::TrayBottomLeft:
        return clampToScreen(QPoint(tray.x(), belowTray), size, screen);
    case Position::TrayBottomRight:
        return clampToScreen(QPoint(tray.x() + tray.width() - size.width(), belowTray), size, screen);
    case Position::TrayBottomCenter:
        return clampToScreen(QPoint(trayCenterX, belowTray), size, screen);
    }
    return QPoint(left, top);
}

void WindowPositioner::handleTrayEvent(Runtime &runtime, const TrayIconEvent &event)
{
    if (WindowPositioner *positioner = runtime.pluginAs<WindowPositioner>(kName))
        positioner->onTrayEvent(event);
    else
        qCWarning(lcPositioner) << "tray event dropped, positioner is not installed";
}

QString WindowPositioner::geometryKey(const QString &label)
{
    return QStringLiteral("windows/%1/geometry").arg(label);
}

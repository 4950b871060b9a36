#ifndef WINDOWPOSITIONER_H
#define WINDOWPOSITIONER_H

#include "runtime.h"

#include <QObject>
#include <QRect>
#include <QSettings>
#include <QTimer>
#include <memory>

// Remembers window geometry across sessions and places windows at well-known
// spots on the screen or relative to the tray icon.
class WindowPositioner : public QObject, public Plugin
{
    Q_OBJECT

public:
    enum class Position
    {
        TopLeft,
        TopRight,
        BottomLeft,
        BottomRight,
        TopCenter,
        BottomCenter,
        LeftCenter,
        RightCenter,
        Center,
        TrayLeft,
        TrayRight,
        TrayCenter,
        TrayBottomLeft,
        TrayBottomRight,
        TrayBottomCenter
    };

    static const QString kName;

    // An empty path stores geometry in the application's default QSettings.
    explicit WindowPositioner(const QString &settingsPath = QString(), QObject *parent = nullptr);

    QString name() const override;
    void initialize(Runtime &runtime) override;

    void onTrayEvent(const TrayIconEvent &event);
    bool hasTrayRect() const { return !trayRect_.isNull(); }
    QRect trayRect() const { return trayRect_; }

    // Returns false for tray positions while no tray rectangle is known.
    bool moveWindow(Window &window, Position position) const;

    bool restoreState(Window &window) const;
    void saveState(const Window &window);
    void saveAll();

    // Top-left corner for a window of the given size. ok is false when a tray
    // position is requested with a null tray rectangle.
    static QPoint positionFor(Position position, const QRect &screen, const QSize &size,
                              const QRect &tray, bool *ok = nullptr);

    // Forwards a tray event to the positioner installed in runtime, if any.
    static void handleTrayEvent(Runtime &runtime, const TrayIconEvent &event);

private:
    static QString geometryKey(const QString &label);
    void trackWindow(Window &window);


    std::unique_ptr<QSettings> settings_;
    Runtime *runtime_ = nullptr;
    QRect trayRect_;
    QTimer syncTimer_;
};

#endif // WINDOWPOSITIONER_H

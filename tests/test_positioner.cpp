#include "doctest/doctest.h"
#include "fakeruntime.h"
#include "windowpositioner.h"

#include <QSettings>
#include <QTemporaryDir>

using Position = WindowPositioner::Position;

namespace {

const QRect kScreen(0, 0, 1920, 1040);
const QSize kWindow(400, 300);

} // namespace

DOCTEST_TEST_CASE("screen positions") {
  DOCTEST_CHECK_EQ(WindowPositioner::positionFor(Position::TopLeft, kScreen, kWindow, QRect()), QPoint(0, 0));
  DOCTEST_CHECK_EQ(WindowPositioner::positionFor(Position::TopRight, kScreen, kWindow, QRect()), QPoint(1520, 0));
  DOCTEST_CHECK_EQ(WindowPositioner::positionFor(Position::BottomLeft, kScreen, kWindow, QRect()), QPoint(0, 740));
  DOCTEST_CHECK_EQ(WindowPositioner::positionFor(Position::BottomRight, kScreen, kWindow, QRect()),
                   QPoint(1520, 740));
  DOCTEST_CHECK_EQ(WindowPositioner::positionFor(Position::Center, kScreen, kWindow, QRect()), QPoint(760, 370));
  DOCTEST_CHECK_EQ(WindowPositioner::positionFor(Position::TopCenter, kScreen, kWindow, QRect()), QPoint(760, 0));
  DOCTEST_CHECK_EQ(WindowPositioner::positionFor(Position::RightCenter, kScreen, kWindow, QRect()),
                   QPoint(1520, 370));
}

DOCTEST_TEST_CASE("screen positions honour a screen offset") {
  const QRect second(1920, 0, 1280, 1024);
  DOCTEST_CHECK_EQ(WindowPositioner::positionFor(Position::TopLeft, second, kWindow, QRect()), QPoint(1920, 0));
  DOCTEST_CHECK_EQ(WindowPositioner::positionFor(Position::Center, second, kWindow, QRect()), QPoint(2360, 362));
}

DOCTEST_TEST_CASE("tray positions need a tray rectangle") {
  bool ok = true;
  WindowPositioner::positionFor(Position::TrayCenter, kScreen, kWindow, QRect(), &ok);
  DOCTEST_CHECK_FALSE(ok);

  const QRect tray(1700, 1040, 24, 24);
  DOCTEST_CHECK_EQ(WindowPositioner::positionFor(Position::TrayLeft, kScreen, kWindow, tray, &ok),
                   QPoint(1520, 740));
  DOCTEST_CHECK(ok);
  DOCTEST_CHECK_EQ(WindowPositioner::positionFor(Position::TrayCenter, kScreen, kWindow, tray),
                   QPoint(1512, 740));
}

DOCTEST_TEST_CASE("tray positions below a top menu bar") {
  const QRect tray(800, 0, 22, 22);
  const QRect screen(0, 22, 1920, 1058);
  DOCTEST_CHECK_EQ(WindowPositioner::positionFor(Position::TrayBottomLeft, screen, kWindow, tray), QPoint(800, 22));
  DOCTEST_CHECK_EQ(WindowPositioner::positionFor(Position::TrayBottomCenter, screen, kWindow, tray),
                   QPoint(611, 22));
  DOCTEST_CHECK_EQ(WindowPositioner::positionFor(Position::TrayBottomRight, screen, kWindow, tray),
                   QPoint(422, 22));
}

DOCTEST_TEST_CASE("moveWindow follows the last tray event") {
  QTemporaryDir dir;
  WindowPositioner positioner(dir.filePath("positions.ini"));
  FakeWindow window("main");
  window.screen = kScreen;

  DOCTEST_CHECK_FALSE(positioner.moveWindow(window, Position::TrayCenter));
  DOCTEST_CHECK_EQ(window.rect.topLeft(), QPoint(0, 0));

  TrayIconEvent event;
  event.kind = TrayIconEvent::Kind::Click;
  event.iconRect = QRect(1000, 1040, 20, 20);
  positioner.onTrayEvent(event);

  DOCTEST_CHECK(positioner.moveWindow(window, Position::TrayCenter));
  DOCTEST_CHECK_EQ(window.rect, QRect(810, 740, 400, 300));
}

DOCTEST_TEST_CASE("the cursor stands in when the tray reports no geometry") {
  QTemporaryDir dir;
  WindowPositioner positioner(dir.filePath("positions.ini"));

  TrayIconEvent event;
  event.position = QPoint(50, 60);
  positioner.onTrayEvent(event);
  DOCTEST_CHECK_EQ(positioner.trayRect(), QRect(50, 60, 1, 1));
}

DOCTEST_TEST_CASE("window geometry survives a restart") {
  QTemporaryDir dir;
  const QString path = dir.filePath("positions.ini");

  {
    FakeRuntime runtime;
    FakeWindow *main = runtime.addWindow("main");
    auto positioner = std::make_unique<WindowPositioner>(path);
    WindowPositioner *raw = positioner.get();
    runtime.installPlugin(std::move(positioner));

    main->rect = QRect(120, 80, 640, 480);
    raw->saveAll();
  }

  FakeRuntime runtime;
  FakeWindow *main = runtime.addWindow("main");
  FakeWindow *other = runtime.addWindow("about");
  runtime.installPlugin(std::make_unique<WindowPositioner>(path));

  DOCTEST_CHECK_EQ(main->rect, QRect(120, 80, 640, 480));
  DOCTEST_CHECK_EQ(other->rect, QRect(0, 0, 400, 300));
}

DOCTEST_TEST_CASE("geometry saved on a missing screen is brought back") {
  QTemporaryDir dir;
  WindowPositioner positioner(dir.filePath("positions.ini"));

  FakeWindow saved("main");
  saved.rect = QRect(3000, 200, 400, 300);
  positioner.saveState(saved);

  FakeWindow window("main");
  window.screen = kScreen;
  DOCTEST_REQUIRE(positioner.restoreState(window));
  DOCTEST_CHECK_EQ(window.rect, QRect(760, 370, 400, 300));
}

DOCTEST_TEST_CASE("moving a window is remembered without an explicit save") {
  QTemporaryDir dir;
  const QString path = dir.filePath("positions.ini");

  {
    FakeRuntime runtime;
    FakeWindow *main = runtime.addWindow("main");
    runtime.installPlugin(std::make_unique<WindowPositioner>(path));
    DOCTEST_REQUIRE_EQ(main->observers.size(), 1u);

    main->rect = QRect(300, 200, 500, 400);
    main->notifyGeometry(Window::GeometryChange::Moved);
  }

  FakeRuntime runtime;
  FakeWindow *main = runtime.addWindow("main");
  runtime.installPlugin(std::make_unique<WindowPositioner>(path));
  DOCTEST_CHECK_EQ(main->rect, QRect(300, 200, 500, 400));
}

DOCTEST_TEST_CASE("closing a window writes its geometry straight away") {
  QTemporaryDir dir;
  const QString path = dir.filePath("positions.ini");

  FakeRuntime runtime;
  FakeWindow *main = runtime.addWindow("main");
  runtime.installPlugin(std::make_unique<WindowPositioner>(path));

  main->rect = QRect(40, 50, 600, 450);
  main->notifyGeometry(Window::GeometryChange::Resized);
  main->rect = QRect(60, 70, 600, 450);
  main->notifyGeometry(Window::GeometryChange::Closing);

  // Read back while the first positioner is still alive.
  QSettings stored(path, QSettings::IniFormat);
  DOCTEST_CHECK_EQ(stored.value("windows/main/geometry").toRect(), QRect(60, 70, 600, 450));
}

DOCTEST_TEST_CASE("geometry changes after the positioner is gone are ignored") {
  QTemporaryDir dir;
  FakeRuntime runtime;
  FakeWindow *main = runtime.addWindow("main");
  {
    WindowPositioner positioner(dir.filePath("positions.ini"));
    positioner.initialize(runtime);
  }
  DOCTEST_REQUIRE_EQ(main->observers.size(), 1u);
  const QRect before = main->rect;
  main->notifyGeometry(Window::GeometryChange::Closing);
  DOCTEST_CHECK_EQ(main->rect, before);
}

#include "doctest/doctest.h"
#include "deeplinkplugin.h"
#include "fakeruntime.h"
#include "singleinstanceplugin.h"

#include <QCoreApplication>
#include <QFile>
#include <QTemporaryDir>
#include <QThread>

namespace {

// Processes queued calls until done() holds or about two seconds pass.
template <typename Pred>
bool waitFor(Pred done)
{
    for (int i = 0; i < 200 && !done(); ++i) {
        QCoreApplication::processEvents();
        QThread::msleep(10);
    }
    return done();
}

} // namespace

DOCTEST_TEST_CASE("the first instance becomes primary") {
  QTemporaryDir dir;
  FakeRuntime runtime;

  SingleInstancePlugin guard("timesheet-test", {}, dir.path());
  guard.initialize(runtime);

  DOCTEST_CHECK(guard.isPrimary());
  DOCTEST_CHECK_FALSE(runtime.exitRequested());
  DOCTEST_CHECK(QFile::exists(guard.lockPath()));
}

DOCTEST_TEST_CASE("a second instance hands its launch to the primary and exits") {
  QTemporaryDir dir;
  FakeRuntime primaryRuntime;
  FakeRuntime secondaryRuntime;
  secondaryRuntime.setArguments({"timesheet", "timesheet://entries/3"});

  int calls = 0;
  QStringList seenArgs;
  QString seenCwd;
  Runtime *seenRuntime = nullptr;
  SingleInstancePlugin primary(
      "timesheet-test",
      [&](Runtime &runtime, const QStringList &args, const QString &cwd) {
        ++calls;
        seenRuntime = &runtime;
        seenArgs = args;
        seenCwd = cwd;
      },
      dir.path());
  primary.initialize(primaryRuntime);
  DOCTEST_REQUIRE(primary.isPrimary());

  SingleInstancePlugin secondary("timesheet-test", {}, dir.path());
  secondary.initialize(secondaryRuntime);

  DOCTEST_CHECK_FALSE(secondary.isPrimary());
  DOCTEST_CHECK(secondaryRuntime.exitRequested());
  DOCTEST_CHECK_EQ(secondaryRuntime.exitCode(), 0);

  DOCTEST_REQUIRE(waitFor([&calls]() { return calls > 0; }));
  DOCTEST_CHECK_EQ(calls, 1);
  DOCTEST_CHECK_EQ(seenRuntime, &primaryRuntime);
  DOCTEST_CHECK_EQ(seenArgs, QStringList({"timesheet", "timesheet://entries/3"}));
  DOCTEST_CHECK_FALSE(seenCwd.isEmpty());
}

DOCTEST_TEST_CASE("deep links from a second launch reach the primary") {
  QTemporaryDir dir;
  FakeRuntime primaryRuntime;
  FakeRuntime secondaryRuntime;
  secondaryRuntime.setArguments({"timesheet", "timesheet://entries/3"});

  primaryRuntime.installPlugin(std::make_unique<DeepLinkPlugin>(QStringList({"timesheet"})));
  auto *deepLink = primaryRuntime.pluginAs<DeepLinkPlugin>(DeepLinkPlugin::kName);
  DOCTEST_REQUIRE(deepLink != nullptr);

  bool focused = false;
  SingleInstancePlugin primary(
      "timesheet-test", [&focused](Runtime &, const QStringList &, const QString &) { focused = true; },
      dir.path());
  primary.initialize(primaryRuntime);

  SingleInstancePlugin secondary("timesheet-test", {}, dir.path());
  secondary.initialize(secondaryRuntime);
  DOCTEST_REQUIRE(secondaryRuntime.exitRequested());

  DOCTEST_REQUIRE(waitFor([deepLink]() { return !deepLink->currentUrls().isEmpty(); }));
  DOCTEST_CHECK(focused);
  DOCTEST_CHECK_EQ(deepLink->currentUrls(), QList<QUrl>({QUrl("timesheet://entries/3")}));
}

DOCTEST_TEST_CASE("separate identifiers do not interfere") {
  QTemporaryDir dir;
  FakeRuntime first;
  FakeRuntime second;

  SingleInstancePlugin a("timesheet-a", {}, dir.path());
  SingleInstancePlugin b("timesheet-b", {}, dir.path());
  a.initialize(first);
  b.initialize(second);

  DOCTEST_CHECK(a.isPrimary());
  DOCTEST_CHECK(b.isPrimary());
  DOCTEST_CHECK_FALSE(second.exitRequested());
}

DOCTEST_TEST_CASE("the socket is removed when the primary shuts down") {
  QTemporaryDir dir;
  FakeRuntime runtime;
  QString socket;
  {
    SingleInstancePlugin guard("timesheet-test", {}, dir.path());
    guard.initialize(runtime);
    socket = guard.socketPath();
    DOCTEST_CHECK(QFile::exists(socket));
  }
  DOCTEST_CHECK_FALSE(QFile::exists(socket));
}

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "utils/async/AsyncTask.hpp"
#include "utils/async/DebouncedInvoker.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QThread>
#include <QtTest/QSignalSpy>
#include <QtTest/QTest>

#include <memory>
#include <stdexcept>

namespace {

QCoreApplication* ensureApp()
{
    static int argc = 1;
    static char arg0[] = "utils-tests";
    static char* argv[] = {arg0, nullptr};
    static std::unique_ptr<QCoreApplication> app;
    if (!QCoreApplication::instance())
        app = std::make_unique<QCoreApplication>(argc, argv);
    return QCoreApplication::instance();
}

} // namespace

TEST(AsyncTaskTests, DeliversResultOnContextThread)
{
    ensureApp();

    QObject context;
    QThread* workThread = nullptr;
    QThread* doneThread = nullptr;
    int value = 0;
    bool finished = false;

    Utils::Async::run<int>(&context,
                           [&workThread]() {
                               workThread = QThread::currentThread();
                               return 42;
                           },
                           [&](int v) {
                               doneThread = QThread::currentThread();
                               value = v;
                               finished = true;
                           });

    EXPECT_TRUE(QTest::qWaitFor([&finished]() { return finished; }, 2000));
    EXPECT_EQ(value, 42);
    EXPECT_EQ(doneThread, context.thread());
    EXPECT_NE(workThread, context.thread());
}

TEST(AsyncTaskTests, DroppedContextSkipsDelivery)
{
    ensureApp();

    auto context = std::make_unique<QObject>();
    bool delivered = false;
    QThreadPool pool;

    Utils::Async::run<int>(context.get(),
                           []() {
                               QThread::msleep(50);
                               return 1;
                           },
                           [&delivered](int) { delivered = true; },
                           &pool);
    context.reset();

    pool.waitForDone();
    QCoreApplication::processEvents();
    EXPECT_FALSE(delivered);
}

TEST(AsyncTaskTests, ThrowingWorkNeverReachesDone)
{
    ensureApp();

    QObject context;
    bool delivered = false;
    QThreadPool pool;

    Utils::Async::run<int>(&context,
                           []() -> int { throw std::runtime_error("boom"); },
                           [&delivered](int) { delivered = true; },
                           &pool);

    pool.waitForDone();
    QCoreApplication::processEvents();
    EXPECT_FALSE(delivered);
}

TEST(DebouncedInvokerTests, BurstRunsActionOnce)
{
    ensureApp();

    Utils::Async::DebouncedInvoker invoker(30);
    int calls = 0;
    invoker.setAction([&calls]() { ++calls; });

    QSignalSpy spy(&invoker, &Utils::Async::DebouncedInvoker::fired);
    for (int i = 0; i < 5; ++i)
        invoker.trigger();
    EXPECT_TRUE(invoker.isPending());

    ASSERT_TRUE(spy.wait(1000));
    QTest::qWait(80);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(spy.count(), 1);
    EXPECT_FALSE(invoker.isPending());
}

TEST(DebouncedInvokerTests, CancelDropsPendingCall)
{
    ensureApp();

    Utils::Async::DebouncedInvoker invoker(20);
    int calls = 0;
    invoker.setAction([&calls]() { ++calls; });

    invoker.trigger();
    invoker.cancel();
    QTest::qWait(60);
    EXPECT_EQ(calls, 0);
}

TEST(DebouncedInvokerTests, TriggerWithoutActionIsIgnored)
{
    ensureApp();

    Utils::Async::DebouncedInvoker invoker(10);
    invoker.trigger();
    EXPECT_FALSE(invoker.isPending());
}

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QMetaObject>
#include <QtCore/QPointer>
#include <QtCore/QThreadPool>
#include <QtCore/QRunnable>
#include <QtCore/Qt>

#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace Utils::Async {

namespace detail {

// Runs `work` on a pool thread and hands its result to `done` on the
// context object's thread. A throwing task never reaches `done`; the
// failure is logged and the context simply sees no result.
template <typename Result, typename WorkFn, typename DoneFn>
class AsyncRunnable final : public QRunnable
{
public:
    AsyncRunnable(QPointer<QObject> context, WorkFn work, DoneFn done)
        : m_context(std::move(context))
        , m_work(std::move(work))
        , m_done(std::move(done))
    {
    }

    void run() override
    {
        if constexpr (std::is_void_v<Result>) {
            if (!invokeWork([this] { m_work(); }))
                return;
            deliver([done = std::move(m_done)]() mutable { done(); });
        } else {
            std::optional<Result> result;
            if (!invokeWork([this, &result] { result.emplace(m_work()); }))
                return;
            deliver([done = std::move(m_done), value = std::move(*result)]() mutable {
                done(std::move(value));
            });
        }
    }

private:
    template <typename Fn>
    static bool invokeWork(Fn&& fn)
    {
        try {
            fn();
            return true;
        } catch (const std::exception& e) {
            qCWarning(utilslog) << "Background task failed:" << e.what();
        } catch (...) {
            qCWarning(utilslog) << "Background task failed with a non-standard exception.";
        }
        return false;
    }

    template <typename Fn>
    void deliver(Fn&& fn)
    {
        if (!m_context)
            return;

        QPointer<QObject> guard = m_context;
        QMetaObject::invokeMethod(guard.data(),
                                  [guard, fn = std::forward<Fn>(fn)]() mutable {
                                      if (guard)
                                          fn();
                                  },
                                  Qt::QueuedConnection);
    }

    QPointer<QObject> m_context;
    WorkFn m_work;
    DoneFn m_done;
};

} // namespace detail

template <typename Result, typename Work, typename Done>
void run(QObject* context, Work&& work, Done&& done, QThreadPool* pool = QThreadPool::globalInstance())
{
    using WorkFn = std::decay_t<Work>;
    using DoneFn = std::decay_t<Done>;

    if (!context || !pool)
        return;

    auto task = new detail::AsyncRunnable<Result, WorkFn, DoneFn>(
        QPointer<QObject>(context),
        WorkFn(std::forward<Work>(work)),
        DoneFn(std::forward<Done>(done)));
    task->setAutoDelete(true);
    pool->start(task);
}

} // namespace Utils::Async

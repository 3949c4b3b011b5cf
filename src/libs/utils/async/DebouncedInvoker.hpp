// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QObject>
#include <QtCore/QTimer>

#include <functional>

namespace Utils::Async {

// Coalesces bursts of triggers into one deferred call. Every trigger
// restarts the delay, so the action runs once the burst has gone quiet.
class UTILS_EXPORT DebouncedInvoker final : public QObject
{
    Q_OBJECT

public:
    explicit DebouncedInvoker(QObject* parent = nullptr);
    explicit DebouncedInvoker(int delayMs, QObject* parent = nullptr);

    void setDelayMs(int ms);
    int delayMs() const;

    void setAction(std::function<void()> action);

    void trigger();
    void cancel();

    bool isPending() const;

signals:
    void fired();

private:
    void fire();

    QTimer m_timer;
    std::function<void()> m_action;
};

} // namespace Utils::Async

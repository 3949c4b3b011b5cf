// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/async/DebouncedInvoker.hpp"

#include <algorithm>
#include <utility>

namespace Utils::Async {

DebouncedInvoker::DebouncedInvoker(QObject* parent)
    : QObject(parent)
{
    m_timer.setSingleShot(true);
    connect(&m_timer, &QTimer::timeout, this, &DebouncedInvoker::fire);
}

DebouncedInvoker::DebouncedInvoker(int delayMs, QObject* parent)
    : DebouncedInvoker(parent)
{
    setDelayMs(delayMs);
}

void DebouncedInvoker::setDelayMs(int ms)
{
    m_timer.setInterval(std::max(ms, 0));
}

int DebouncedInvoker::delayMs() const
{
    return m_timer.interval();
}

void DebouncedInvoker::setAction(std::function<void()> action)
{
    m_action = std::move(action);
}

void DebouncedInvoker::trigger()
{
    if (!m_action)
        return;
    m_timer.start();
}

void DebouncedInvoker::cancel()
{
    m_timer.stop();
}

bool DebouncedInvoker::isPending() const
{
    return m_timer.isActive();
}

void DebouncedInvoker::fire()
{
    if (m_action)
        m_action();
    emit fired();
}

} // namespace Utils::Async

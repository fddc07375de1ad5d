// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QMetaObject>
#include <QtCore/QPointer>
#include <QtCore/QString>
#include <QtCore/QThreadPool>

#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

namespace Utils::Async {

namespace detail {

// Queues `fn` onto `context`'s thread; dropped if `context` dies first.
template <typename Fn>
void deliver(const QPointer<QObject>& context, Fn&& fn)
{
    if (!context)
        return;
    QMetaObject::invokeMethod(
        context.data(),
        [context, fn = std::forward<Fn>(fn)]() mutable {
            if (context)
                fn();
        },
        Qt::QueuedConnection);
}

} // namespace detail

// Runs `work` on `pool`. Its return value reaches `done` on the thread of `context`; an exception
// thrown by `work` reaches `fail` as its what() text. Neither runs once `context` is destroyed.
template <typename Work, typename Done, typename Fail>
void run(QObject* context, Work work, Done done, Fail fail, QThreadPool* pool = QThreadPool::globalInstance())
{
    using Value = std::invoke_result_t<Work&>;
    static_assert(!std::is_void_v<Value>, "background work must produce a value");

    if (!context || !pool)
        return;

    const QPointer<QObject> guard(context);
    pool->start([guard, work = std::move(work), done = std::move(done), fail = std::move(fail)]() mutable {
        QString error;
        try {
            Value value = work();
            detail::deliver(guard, [done = std::move(done), value = std::move(value)]() mutable {
                done(std::move(value));
            });
            return;
        } catch (const std::exception& e) {
            error = QString::fromUtf8(e.what());
        }
        qCWarning(utilslog) << "Background work threw:" << error;
        detail::deliver(guard, [fail = std::move(fail), error]() mutable { fail(error); });
    });
}

} // namespace Utils::Async

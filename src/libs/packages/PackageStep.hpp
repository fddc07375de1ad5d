// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "packages/PackagesGlobal.hpp"

#include <utils/Result.hpp>
#include <utils/async/Cancellation.hpp>

#include <QtCore/QMetaType>
#include <QtCore/QString>

#include <functional>
#include <utility>

namespace Packages {

struct PACKAGES_EXPORT ProgressReport final {
    // 0..1, or negative while the amount of remaining work is unknown.
    double progress = -1.0;
    QString title;
    QString message;

    bool isIndeterminate() const noexcept { return progress < 0.0; }

    static ProgressReport indeterminate(QString title, QString message = {})
    {
        return ProgressReport{-1.0, std::move(title), std::move(message)};
    }
};

using ProgressCallback = std::function<void(const ProgressReport&)>;
using DoneCallback = std::function<void(const Utils::Result&)>;

class PACKAGES_EXPORT IPackageStep
{
public:
    virtual ~IPackageStep() = default;

    virtual QString progressTitle() const = 0;

    // `done` is invoked exactly once, possibly before execute() returns.
    virtual void execute(const Utils::Async::CancellationToken& token,
                         ProgressCallback progress,
                         DoneCallback done) = 0;
};

} // namespace Packages

Q_DECLARE_METATYPE(Packages::ProgressReport)

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "app/viewmodels/GenerationRun.hpp"

namespace Kiln::ViewModels {

GenerationRun::GenerationRun(QObject* parent)
    : QObject(parent)
{}

GenerationRun::~GenerationRun()
{
    end();
}

void GenerationRun::end()
{
    if (m_phase == Phase::Ended)
        return;
    m_phase = Phase::Ended;

    m_preview.reset();
    m_cancelRegistration.reset();
    m_client.reset();
    m_taskSubscriptions.clear();

    if (m_task) {
        m_task->disconnect(this);
        m_task->deleteLater();
        m_task.clear();
    }
}

} // namespace Kiln::ViewModels

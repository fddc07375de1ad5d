// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <inference/ApiError.hpp>

#include <QtCore/QPointer>
#include <QtCore/QUrl>
#include <QtWidgets/QWidget>

class QCheckBox;
class QComboBox;
class QDoubleSpinBox;
class QGroupBox;
class QLabel;
class QLineEdit;
class QListView;
class QPlainTextEdit;
class QProgressBar;
class QPushButton;
class QSpinBox;

namespace Kiln::ViewModels {
class InferenceTextToImageViewModel;
}

namespace Kiln::Views {

class InferencePanel final : public QWidget
{
    Q_OBJECT

public:
    explicit InferencePanel(ViewModels::InferenceTextToImageViewModel* viewModel, QWidget* parent = nullptr);

    void setBackendUrl(const QUrl& url);

private:
    void buildUi();
    void bindViewModel();

    void pullParameters();
    void pushParameters();
    void syncOptionLists();
    void syncConnectionState();
    void syncProgress();
    void syncPreview();
    void showApiError(const QString& title, const Inference::ApiError& error);

    static void fillCombo(QComboBox* combo, const QStringList& items, const QString& current, bool allowEmpty = false);

    QPointer<ViewModels::InferenceTextToImageViewModel> m_viewModel;
    bool m_pulling = false;

    QLineEdit* m_urlEdit = nullptr;
    QPushButton* m_connectButton = nullptr;

    QComboBox* m_modelCombo = nullptr;
    QComboBox* m_samplerCombo = nullptr;
    QComboBox* m_schedulerCombo = nullptr;
    QSpinBox* m_widthSpin = nullptr;
    QSpinBox* m_heightSpin = nullptr;
    QSpinBox* m_stepsSpin = nullptr;
    QDoubleSpinBox* m_cfgSpin = nullptr;
    QDoubleSpinBox* m_seedSpin = nullptr;
    QCheckBox* m_randomizeSeedCheck = nullptr;
    QSpinBox* m_batchSpin = nullptr;
    QPlainTextEdit* m_positiveEdit = nullptr;
    QPlainTextEdit* m_negativeEdit = nullptr;

    QGroupBox* m_hiresGroup = nullptr;
    QComboBox* m_upscaleCombo = nullptr;
    QDoubleSpinBox* m_hiresScaleSpin = nullptr;
    QComboBox* m_hiresSamplerCombo = nullptr;
    QSpinBox* m_hiresStepsSpin = nullptr;
    QDoubleSpinBox* m_hiresCfgSpin = nullptr;
    QDoubleSpinBox* m_hiresDenoiseSpin = nullptr;

    QPushButton* m_generateButton = nullptr;
    QPushButton* m_cancelButton = nullptr;
    QProgressBar* m_progressBar = nullptr;
    QLabel* m_progressLabel = nullptr;
    QLabel* m_previewLabel = nullptr;
    QListView* m_galleryView = nullptr;
};

} // namespace Kiln::Views

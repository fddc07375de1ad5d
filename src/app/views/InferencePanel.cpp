// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "app/views/InferencePanel.hpp"

#include "app/models/ImageGalleryModel.hpp"
#include "app/viewmodels/InferenceTextToImageViewModel.hpp"

#include <inference/InferenceClientManager.hpp>
#include <utils/ui/ErrorDetailsDialog.hpp>

#include <QtCore/QSignalBlocker>
#include <QtGui/QPixmap>
#include <QtWidgets/QCheckBox>
#include <QtWidgets/QComboBox>
#include <QtWidgets/QDoubleSpinBox>
#include <QtWidgets/QFormLayout>
#include <QtWidgets/QGroupBox>
#include <QtWidgets/QHBoxLayout>
#include <QtWidgets/QLabel>
#include <QtWidgets/QLineEdit>
#include <QtWidgets/QListView>
#include <QtWidgets/QPlainTextEdit>
#include <QtWidgets/QProgressBar>
#include <QtWidgets/QPushButton>
#include <QtWidgets/QSpinBox>
#include <QtWidgets/QSplitter>
#include <QtWidgets/QVBoxLayout>

#include <algorithm>
#include <limits>

using namespace Qt::StringLiterals;

namespace Kiln::Views {

namespace {

QSpinBox* makeSpin(int min, int max, int step, QWidget* parent)
{
    auto* spin = new QSpinBox(parent);
    spin->setRange(min, max);
    spin->setSingleStep(step);
    return spin;
}

QDoubleSpinBox* makeDoubleSpin(double min, double max, double step, int decimals, QWidget* parent)
{
    auto* spin = new QDoubleSpinBox(parent);
    spin->setRange(min, max);
    spin->setSingleStep(step);
    spin->setDecimals(decimals);
    return spin;
}

} // namespace

InferencePanel::InferencePanel(ViewModels::InferenceTextToImageViewModel* viewModel, QWidget* parent)
    : QWidget(parent)
    , m_viewModel(viewModel)
{
    buildUi();
    bindViewModel();
    syncOptionLists();
    pullParameters();
    syncConnectionState();
    syncProgress();
}

void InferencePanel::setBackendUrl(const QUrl& url)
{
    m_urlEdit->setText(url.toString());
}

void InferencePanel::buildUi()
{
    auto* root = new QVBoxLayout(this);
    root->setContentsMargins(8, 8, 8, 8);
    root->setSpacing(8);

    auto* connectionRow = new QHBoxLayout();
    m_urlEdit = new QLineEdit(this);
    m_urlEdit->setPlaceholderText(u"http://127.0.0.1:8188"_s);
    m_connectButton = new QPushButton(u"Connect"_s, this);
    connectionRow->addWidget(new QLabel(u"Backend"_s, this));
    connectionRow->addWidget(m_urlEdit, 1);
    connectionRow->addWidget(m_connectButton);
    root->addLayout(connectionRow);

    auto* splitter = new QSplitter(Qt::Horizontal, this);
    root->addWidget(splitter, 1);

    auto* settings = new QWidget(splitter);
    auto* settingsLayout = new QVBoxLayout(settings);
    settingsLayout->setContentsMargins(0, 0, 0, 0);

    auto* samplingGroup = new QGroupBox(u"Sampling"_s, settings);
    auto* samplingForm = new QFormLayout(samplingGroup);
    samplingForm->setLabelAlignment(Qt::AlignLeft | Qt::AlignVCenter);

    m_modelCombo = new QComboBox(samplingGroup);
    m_samplerCombo = new QComboBox(samplingGroup);
    m_schedulerCombo = new QComboBox(samplingGroup);
    m_widthSpin = makeSpin(64, 8192, 64, samplingGroup);
    m_heightSpin = makeSpin(64, 8192, 64, samplingGroup);
    m_stepsSpin = makeSpin(1, 200, 1, samplingGroup);
    m_cfgSpin = makeDoubleSpin(1.0, 30.0, 0.5, 1, samplingGroup);
    m_seedSpin = makeDoubleSpin(0.0, double(std::numeric_limits<quint32>::max()), 1.0, 0, samplingGroup);
    m_randomizeSeedCheck = new QCheckBox(u"Randomize"_s, samplingGroup);
    m_batchSpin = makeSpin(1, 64, 1, samplingGroup);

    auto* sizeRow = new QHBoxLayout();
    sizeRow->addWidget(m_widthSpin);
    sizeRow->addWidget(new QLabel(u"x"_s, samplingGroup));
    sizeRow->addWidget(m_heightSpin);

    auto* seedRow = new QHBoxLayout();
    seedRow->addWidget(m_seedSpin, 1);
    seedRow->addWidget(m_randomizeSeedCheck);

    samplingForm->addRow(u"Model"_s, m_modelCombo);
    samplingForm->addRow(u"Sampler"_s, m_samplerCombo);
    samplingForm->addRow(u"Scheduler"_s, m_schedulerCombo);
    samplingForm->addRow(u"Size"_s, sizeRow);
    samplingForm->addRow(u"Steps"_s, m_stepsSpin);
    samplingForm->addRow(u"CFG scale"_s, m_cfgSpin);
    samplingForm->addRow(u"Seed"_s, seedRow);
    samplingForm->addRow(u"Batch size"_s, m_batchSpin);

    m_positiveEdit = new QPlainTextEdit(settings);
    m_positiveEdit->setPlaceholderText(u"Prompt"_s);
    m_negativeEdit = new QPlainTextEdit(settings);
    m_negativeEdit->setPlaceholderText(u"Negative prompt"_s);
    m_negativeEdit->setMaximumHeight(80);

    m_hiresGroup = new QGroupBox(u"Hi-res fix"_s, settings);
    m_hiresGroup->setCheckable(true);
    auto* hiresForm = new QFormLayout(m_hiresGroup);
    m_upscaleCombo = new QComboBox(m_hiresGroup);
    m_hiresScaleSpin = makeDoubleSpin(1.0, 4.0, 0.05, 2, m_hiresGroup);
    m_hiresSamplerCombo = new QComboBox(m_hiresGroup);
    m_hiresStepsSpin = makeSpin(1, 200, 1, m_hiresGroup);
    m_hiresCfgSpin = makeDoubleSpin(1.0, 30.0, 0.5, 1, m_hiresGroup);
    m_hiresDenoiseSpin = makeDoubleSpin(0.0, 1.0, 0.05, 2, m_hiresGroup);
    hiresForm->addRow(u"Upscale method"_s, m_upscaleCombo);
    hiresForm->addRow(u"Scale"_s, m_hiresScaleSpin);
    hiresForm->addRow(u"Sampler"_s, m_hiresSamplerCombo);
    hiresForm->addRow(u"Steps"_s, m_hiresStepsSpin);
    hiresForm->addRow(u"CFG scale"_s, m_hiresCfgSpin);
    hiresForm->addRow(u"Denoise"_s, m_hiresDenoiseSpin);

    settingsLayout->addWidget(samplingGroup);
    settingsLayout->addWidget(new QLabel(u"Prompt"_s, settings));
    settingsLayout->addWidget(m_positiveEdit, 1);
    settingsLayout->addWidget(new QLabel(u"Negative prompt"_s, settings));
    settingsLayout->addWidget(m_negativeEdit);
    settingsLayout->addWidget(m_hiresGroup);

    auto* output = new QWidget(splitter);
    auto* outputLayout = new QVBoxLayout(output);
    outputLayout->setContentsMargins(0, 0, 0, 0);

    auto* actionRow = new QHBoxLayout();
    m_generateButton = new QPushButton(u"Generate"_s, output);
    m_generateButton->setDefault(true);
    m_cancelButton = new QPushButton(u"Cancel"_s, output);
    m_progressBar = new QProgressBar(output);
    m_progressBar->setTextVisible(false);
    actionRow->addWidget(m_generateButton);
    actionRow->addWidget(m_cancelButton);
    actionRow->addWidget(m_progressBar, 1);

    m_progressLabel = new QLabel(output);
    m_previewLabel = new QLabel(output);
    m_previewLabel->setAlignment(Qt::AlignCenter);
    m_previewLabel->setMinimumSize(256, 256);

    m_galleryView = new QListView(output);
    m_galleryView->setViewMode(QListView::IconMode);
    m_galleryView->setIconSize(QSize(128, 128));
    m_galleryView->setResizeMode(QListView::Adjust);
    m_galleryView->setUniformItemSizes(true);
    m_galleryView->setMaximumHeight(180);

    outputLayout->addLayout(actionRow);
    outputLayout->addWidget(m_progressLabel);
    outputLayout->addWidget(m_previewLabel, 1);
    outputLayout->addWidget(m_galleryView);

    splitter->setStretchFactor(0, 0);
    splitter->setStretchFactor(1, 1);
}

void InferencePanel::bindViewModel()
{
    if (!m_viewModel)
        return;

    ViewModels::InferenceTextToImageViewModel* vm = m_viewModel;
    Inference::InferenceClientManager* manager = vm->clientManager();

    m_galleryView->setModel(vm->gallery());

    connect(m_connectButton, &QPushButton::clicked, this, [this, manager]() {
        if (!manager)
            return;
        if (manager->isConnected() || manager->isConnecting())
            manager->disconnectFromHost();
        else
            manager->connectToHost(QUrl::fromUserInput(m_urlEdit->text().trimmed()));
    });

    if (manager) {
        connect(manager, &Inference::InferenceClientManager::isConnectedChanged, this, &InferencePanel::syncConnectionState);
        connect(manager, &Inference::InferenceClientManager::isConnectingChanged, this, &InferencePanel::syncConnectionState);
        connect(manager, &Inference::InferenceClientManager::modelsChanged, this, &InferencePanel::syncOptionLists);
        connect(manager, &Inference::InferenceClientManager::samplersChanged, this, &InferencePanel::syncOptionLists);
        connect(manager, &Inference::InferenceClientManager::schedulersChanged, this, &InferencePanel::syncOptionLists);
        connect(manager, &Inference::InferenceClientManager::upscalersChanged, this, &InferencePanel::syncOptionLists);
    }

    connect(vm, &ViewModels::InferenceTextToImageViewModel::parametersChanged, this, &InferencePanel::pullParameters);
    connect(vm, &ViewModels::InferenceTextToImageViewModel::progressChanged, this, &InferencePanel::syncProgress);
    connect(vm, &ViewModels::InferenceTextToImageViewModel::isGeneratingChanged, this, &InferencePanel::syncProgress);
    connect(vm, &ViewModels::InferenceTextToImageViewModel::previewImageChanged, this, &InferencePanel::syncPreview);
    connect(vm, &ViewModels::InferenceTextToImageViewModel::apiErrorRaised, this, &InferencePanel::showApiError);

    connect(m_generateButton, &QPushButton::clicked, vm, &ViewModels::InferenceTextToImageViewModel::generateImage);
    connect(m_cancelButton, &QPushButton::clicked, vm, &ViewModels::InferenceTextToImageViewModel::cancelGeneration);

    const auto push = [this]() { pushParameters(); };
    for (QComboBox* combo : {m_modelCombo, m_samplerCombo, m_schedulerCombo, m_upscaleCombo, m_hiresSamplerCombo})
        connect(combo, &QComboBox::currentIndexChanged, this, push);
    for (QSpinBox* spin : {m_widthSpin, m_heightSpin, m_stepsSpin, m_batchSpin, m_hiresStepsSpin})
        connect(spin, &QSpinBox::valueChanged, this, push);
    for (QDoubleSpinBox* spin : {m_cfgSpin, m_seedSpin, m_hiresScaleSpin, m_hiresCfgSpin, m_hiresDenoiseSpin})
        connect(spin, &QDoubleSpinBox::valueChanged, this, push);
    connect(m_randomizeSeedCheck, &QCheckBox::toggled, this, push);
    connect(m_hiresGroup, &QGroupBox::toggled, this, push);
    connect(m_positiveEdit, &QPlainTextEdit::textChanged, this, push);
    connect(m_negativeEdit, &QPlainTextEdit::textChanged, this, push);
}

void InferencePanel::fillCombo(QComboBox* combo, const QStringList& items, const QString& current, bool allowEmpty)
{
    const QSignalBlocker blocker(combo);
    combo->clear();
    if (allowEmpty)
        combo->addItem(u"Same as first pass"_s, QString());
    for (const QString& item : items)
        combo->addItem(item, item);

    // Keep a value the backend no longer lists visible instead of silently dropping it.
    if (!current.isEmpty() && combo->findData(current) < 0)
        combo->addItem(current, current);
    combo->setCurrentIndex(std::max(0, combo->findData(current)));
}

void InferencePanel::syncOptionLists()
{
    if (!m_viewModel || !m_viewModel->clientManager())
        return;

    const Inference::InferenceClientManager* manager = m_viewModel->clientManager();
    const Inference::TextToImageParameters& p = m_viewModel->parameters();

    m_pulling = true;
    fillCombo(m_modelCombo, manager->models(), p.modelName);
    fillCombo(m_samplerCombo, manager->samplers(), p.samplerName);
    fillCombo(m_schedulerCombo, manager->schedulers(), p.scheduler);
    fillCombo(m_upscaleCombo, manager->upscalers(), p.hires.upscaleMethod);
    fillCombo(m_hiresSamplerCombo, manager->samplers(), p.hires.samplerName, true);
    m_pulling = false;
}

void InferencePanel::pullParameters()
{
    if (!m_viewModel || m_pulling)
        return;

    m_pulling = true;
    const Inference::TextToImageParameters& p = m_viewModel->parameters();

    const auto select = [](QComboBox* combo, const QString& value) {
        const QSignalBlocker blocker(combo);
        int index = combo->findData(value);
        if (index < 0 && !value.isEmpty()) {
            combo->addItem(value, value);
            index = combo->count() - 1;
        }
        combo->setCurrentIndex(std::max(0, index));
    };
    select(m_modelCombo, p.modelName);
    select(m_samplerCombo, p.samplerName);
    select(m_schedulerCombo, p.scheduler);
    select(m_upscaleCombo, p.hires.upscaleMethod);
    select(m_hiresSamplerCombo, p.hires.samplerName);

    m_widthSpin->setValue(p.width);
    m_heightSpin->setValue(p.height);
    m_stepsSpin->setValue(p.steps);
    m_cfgSpin->setValue(p.cfgScale);
    m_seedSpin->setValue(double(p.seed));
    m_randomizeSeedCheck->setChecked(p.randomizeSeed);
    m_batchSpin->setValue(p.batchSize);
    if (m_positiveEdit->toPlainText() != p.positivePrompt)
        m_positiveEdit->setPlainText(p.positivePrompt);
    if (m_negativeEdit->toPlainText() != p.negativePrompt)
        m_negativeEdit->setPlainText(p.negativePrompt);

    m_hiresGroup->setChecked(p.hiresEnabled);
    m_hiresScaleSpin->setValue(p.hires.scale);
    m_hiresStepsSpin->setValue(p.hires.steps);
    m_hiresCfgSpin->setValue(p.hires.cfgScale);
    m_hiresDenoiseSpin->setValue(p.hires.denoise);
    m_pulling = false;
}

void InferencePanel::pushParameters()
{
    if (!m_viewModel || m_pulling)
        return;

    Inference::TextToImageParameters p = m_viewModel->parameters();
    p.modelName = m_modelCombo->currentData().toString();
    p.samplerName = m_samplerCombo->currentData().toString();
    p.scheduler = m_schedulerCombo->currentData().toString();
    p.width = m_widthSpin->value();
    p.height = m_heightSpin->value();
    p.steps = m_stepsSpin->value();
    p.cfgScale = m_cfgSpin->value();
    p.seed = qint64(m_seedSpin->value());
    p.randomizeSeed = m_randomizeSeedCheck->isChecked();
    p.batchSize = m_batchSpin->value();
    p.positivePrompt = m_positiveEdit->toPlainText();
    p.negativePrompt = m_negativeEdit->toPlainText();

    p.hiresEnabled = m_hiresGroup->isChecked();
    p.hires.upscaleMethod = m_upscaleCombo->currentData().toString();
    p.hires.scale = m_hiresScaleSpin->value();
    p.hires.samplerName = m_hiresSamplerCombo->currentData().toString();
    p.hires.steps = m_hiresStepsSpin->value();
    p.hires.cfgScale = m_hiresCfgSpin->value();
    p.hires.denoise = m_hiresDenoiseSpin->value();

    m_pulling = true;
    m_viewModel->setParameters(p);
    m_pulling = false;
}

void InferencePanel::syncConnectionState()
{
    const Inference::InferenceClientManager* manager = m_viewModel ? m_viewModel->clientManager() : nullptr;
    const bool connected = manager && manager->isConnected();
    const bool connecting = manager && manager->isConnecting();

    m_connectButton->setText(connected || connecting ? u"Disconnect"_s : u"Connect"_s);
    m_urlEdit->setEnabled(!connected && !connecting);
    m_generateButton->setEnabled(connected && m_viewModel && !m_viewModel->isGenerating());
}

void InferencePanel::syncProgress()
{
    if (!m_viewModel)
        return;

    const bool generating = m_viewModel->isGenerating();
    m_cancelButton->setEnabled(generating);
    syncConnectionState();

    if (generating && m_viewModel->progressMaximum() <= 0) {
        m_progressBar->setRange(0, 0);
    } else {
        m_progressBar->setRange(0, std::max(1, m_viewModel->progressMaximum()));
        m_progressBar->setValue(m_viewModel->progressValue());
    }
    m_progressLabel->setText(m_viewModel->progressText());
}

void InferencePanel::syncPreview()
{
    if (!m_viewModel)
        return;

    const QImage image = m_viewModel->previewImage();
    if (image.isNull()) {
        m_previewLabel->clear();
        return;
    }
    m_previewLabel->setPixmap(QPixmap::fromImage(image).scaled(m_previewLabel->size(), Qt::KeepAspectRatio,
                                                               Qt::SmoothTransformation));
}

void InferencePanel::showApiError(const QString& title, const Inference::ApiError& error)
{
    auto* dialog = new Utils::ErrorDetailsDialog(title, error.summary(), error.body, this);
    dialog->setAttribute(Qt::WA_DeleteOnClose);
    dialog->open();
}

} // namespace Kiln::Views

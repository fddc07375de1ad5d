// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QLoggingCategory>
#include <QtCore/QUrl>

#include <QtWidgets/QApplication>

#include "app/AppGlobal.hpp"
#include "app/settings/AppEnvironment.hpp"
#include "app/settings/InferenceSettings.hpp"
#include "app/settings/PackageSettings.hpp"
#include "app/viewmodels/InferenceTextToImageViewModel.hpp"
#include "app/viewmodels/PackageExtensionBrowserViewModel.hpp"
#include "app/views/InferencePanel.hpp"
#include "app/views/MainWindow.hpp"
#include "app/views/QtNotificationService.hpp"

#include <inference/InferenceClientManager.hpp>
#include <packages/GitExtensionManager.hpp>

using namespace Qt::StringLiterals;

struct CommandLineOverrides {
	QString backendUrl;
	QString packageRoot;
	QString configRoot;
};

static CommandLineOverrides parseCommandLine(const QApplication& app)
{
	QCommandLineParser parser;
	parser.setApplicationDescription(u"Text-to-image front end and extension manager for a ComfyUI backend."_s);
	parser.addHelpOption();
	parser.addVersionOption();

	const QCommandLineOption backendUrl(u"backend-url"_s, u"Backend base URL."_s, u"url"_s);
	const QCommandLineOption packageRoot(u"package-root"_s, u"Root directory of the installed package."_s,
										 u"path"_s);
	const QCommandLineOption configRoot(u"config-root"_s, u"Directory holding settings and saved state."_s,
										u"path"_s);
	parser.addOption(backendUrl);
	parser.addOption(packageRoot);
	parser.addOption(configRoot);
	parser.process(app);

	return {parser.value(backendUrl), parser.value(packageRoot), parser.value(configRoot)};
}

int main(int argc, char** argv)
{
	QCoreApplication::setAttribute(Qt::AA_DontUseNativeMenuBar);

	QApplication app(argc, argv);
	QApplication::setOrganizationName(u"Kiln"_s);
	QApplication::setApplicationName(u"Kiln"_s);
	QApplication::setApplicationVersion(u"0.1.0"_s);

	const CommandLineOverrides overrides = parseCommandLine(app);

	Utils::Environment env = Kiln::Settings::makeEnvironment(overrides.configRoot);

	// Overrides apply to this session only; the stored settings are written back untouched.
	const Kiln::Settings::InferenceSettings storedInference = Kiln::Settings::InferenceSettings::load(env);
	const Kiln::Settings::PackageSettings storedPackages = Kiln::Settings::PackageSettings::load(env);

	Kiln::Settings::InferenceSettings inferenceSettings = storedInference;
	if (!overrides.backendUrl.isEmpty()) {
		const QUrl url = QUrl::fromUserInput(overrides.backendUrl);
		if (!url.isValid()) {
			qCCritical(applog).noquote() << "Invalid backend URL:" << overrides.backendUrl;
			return EXIT_FAILURE;
		}
		inferenceSettings.baseUrl = url;
		inferenceSettings.connectOnStart = true;
	}

	Kiln::Settings::PackageSettings packageSettings = storedPackages;
	if (!overrides.packageRoot.isEmpty())
		packageSettings.rootPath = QDir(overrides.packageRoot).absolutePath();

	Inference::InferenceClientManager clientManager;
	clientManager.setOutputImagesDir(inferenceSettings.outputImagesDir);

	Packages::GitExtensionManager extensionManager(packageSettings.manifestLocations);

	Kiln::Views::MainWindow window;

	Kiln::ViewModels::InferenceTextToImageViewModel inferenceViewModel(&clientManager, window.notifications());
	inferenceViewModel.loadState(env);

	Kiln::ViewModels::PackageExtensionBrowserViewModel extensionViewModel;
	if (packageSettings.hasPackage()) {
		Packages::PackagePair pair;
		pair.packageName = packageSettings.packageName;
		pair.extensionManager = &extensionManager;
		pair.installed = packageSettings.installedPackage();
		extensionViewModel.setPackagePair(pair);
	} else {
		qCInfo(applog) << "No package root configured; extension browser is idle.";
	}

	window.setViewModels(&inferenceViewModel, &extensionViewModel);
	window.inferencePanel()->setBackendUrl(inferenceSettings.baseUrl);
	window.show();

	if (inferenceSettings.connectOnStart)
		clientManager.connectToHost(inferenceSettings.baseUrl);

	if (const Utils::Result refreshed = extensionViewModel.refresh(); !refreshed)
		window.notifications()->show(u"Extensions"_s, refreshed.message(),
									 Kiln::Services::INotificationService::Severity::Warning);

	QObject::connect(&app, &QCoreApplication::aboutToQuit, &app, [&]() {
		if (const Utils::Result saved = inferenceViewModel.saveState(env); !saved)
			qCWarning(applog).noquote() << "Failed to save generation state:" << saved.message();
		storedInference.save(env);
		storedPackages.save(env);
	});

	return app.exec();
}

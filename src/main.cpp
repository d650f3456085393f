#include <memory>
#include <QApplication>
#include <QTranslator>
#include <QLocale>
#include <QDebug>
#include <QMessageBox>
#include "ComponentCollection.hpp"
#include "InstallConfiguration.hpp"
#include "MultiLogger.hpp"
#include "Settings.hpp"
#include "Comm/AdbBridgeClient.hpp"
#include "Core/InstallCoordinator.hpp"
#include "UI/WndInstaller.hpp"





/** Installs the UI translation for the system locale, if one is found.
The translations are looked up in the resources, then in the "translations" subfolder of the current
folder and of the executable's folder. */
static void installTranslation(QApplication & aApp)
{
	const QStringList folders
	{
		QStringLiteral(":/translations"),
		QStringLiteral("translations"),
		QCoreApplication::applicationDirPath() + "/translations",
	};
	auto locale = QLocale::system();
	auto translator = std::make_unique<QTranslator>(&aApp);
	for (const auto & folder: folders)
	{
		if (translator->load(locale, "ApkDrop", "_", folder))
		{
			qDebug() << "Using translation " << locale.name() << " from " << folder;
			aApp.installTranslator(translator.release());
			return;
		}
	}
	qDebug() << "No translation for " << locale.name() << ", the UI stays in English.";
}





/** Creates the components making up the app, in the order in which they need each other during construction.
The settings are initialized in between, since the loggers and the engine read them. */
static std::shared_ptr<InstallCoordinator> createComponents(ComponentCollection & aComponents)
{
	auto conf = std::make_shared<InstallConfiguration>(aComponents);
	Settings::init(conf->dataLocation("ApkDrop.ini"));
	conf->loadFromSettings();
	aComponents.addComponent(conf);

	auto logs = aComponents.addNew<MultiLogger>(conf->logsFolder());
	logs->mainLogger().log("ApkDrop %1 starting; data in %2 (portable: %3)",
		QCoreApplication::applicationVersion(), conf->dataLocation(""), conf->isPortable()
	);

	aComponents.addNew<AdbBridgeClient>();
	return aComponents.addNew<InstallCoordinator>();
}





int main(int argc, char *argv[])
{
	QApplication app(argc, argv);
	app.setApplicationName("ApkDrop");
	app.setApplicationVersion("1.0");

	try
	{
		installTranslation(app);

		ComponentCollection cc;
		auto coordinator = createComponents(cc);
		auto & log = cc.logger("main");
		cc.start();

		int exitCode;
		{
			WndInstaller wnd(cc);
			wnd.show();
			exitCode = app.exec();
			log.log("Main loop finished with code %1, shutting down", exitCode);

			// The window still listens, so that the install in progress is reported before it closes:
			coordinator->shutdown();
		}
		cc.stop();
		Settings::sync();
		log.log("Shutdown complete");
		return exitCode;
	}
	catch (const std::exception & exc)
	{
		qWarning() << "Fatal error: " << exc.what();
		QMessageBox::critical(
			nullptr,
			QApplication::tr("ApkDrop: Fatal error"),
			QApplication::tr("ApkDrop cannot continue:\n\n%1").arg(QString::fromUtf8(exc.what()))
		);
		return 1;
	}
}

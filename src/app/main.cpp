#include <QtCore/QCoreApplication>
#include <QtCore/QStringList>
#include <QtCore/QDebug>
#include <QtCore/QTimer>

#include <QtWidgets/QApplication>

#include <cstdio>

#include "reader/LogHandler.hpp"
#include "reader/MainWindow.hpp"
#include "reader/ReaderConstants.hpp"
#include "reader/ReaderGlobal.hpp"
#include "reader/ShellIntegration.hpp"
#include "reader/StartupOptions.hpp"
#include "session/ConfigStore.hpp"
#include "session/SessionState.hpp"

using namespace Reader;

static void printMessage(const QString& text, FILE* stream)
{
	const QByteArray local = text.toLocal8Bit();
	std::fprintf(stream, "%s\n", local.constData());
	std::fflush(stream);
}

int main(int argc, char** argv)
{
	QApplication app(argc, argv);
	QCoreApplication::setOrganizationName(Constants::ORGANIZATION_NAME);
	QCoreApplication::setApplicationName(Constants::APPLICATION_NAME);
	QCoreApplication::setApplicationVersion(Constants::APPLICATION_VERSION);
	QGuiApplication::setApplicationDisplayName(Constants::APPLICATION_DISPLAY_NAME);

	const StartupOptions options = StartupOptions::parse(app.arguments());
	switch (options.action) {
	case StartupOptions::Action::ShowHelp:
	case StartupOptions::Action::ShowVersion:
		printMessage(options.message, stdout);
		return EXIT_SUCCESS;
	case StartupOptions::Action::Error:
		printMessage(options.message, stderr);
		return EXIT_FAILURE;
	case StartupOptions::Action::Run:
		break;
	}

	const Utils::Result logging = installLogHandler();
	if (!logging)
		qCWarning(readerlog).noquote() << "File logging disabled:" << logging.message();
	qCInfo(readerlog) << "Starting" << QCoreApplication::applicationName()
	                  << QCoreApplication::applicationVersion();

	Session::SessionState session{Session::ConfigStore(Session::ConfigStore::makeDocumentStore())};
	QtShellIntegration shell;

	MainWindow window(session, shell);
	window.show();
	window.restoreSession();

	if (!options.filePath.isEmpty()) {
		QTimer::singleShot(0, &window, [&window, path = options.filePath] { window.openFile(path); });
	} else if (options.hasInvalidPath()) {
		QTimer::singleShot(0, &window, [&window, path = options.requestedPath] {
			window.showInvalidPathWarning(path);
		});
	}

	QObject::connect(&app, &QCoreApplication::aboutToQuit, &session, [&session] {
		const Utils::Result flushed = session.flush();
		if (!flushed)
			qCWarning(readerlog).noquote() << "Final session flush failed:" << flushed.message();
	});

	const int code = app.exec();
	qCInfo(readerlog) << "Exiting with code" << code;
	uninstallLogHandler();
	return code;
}

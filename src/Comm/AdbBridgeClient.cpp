#include "AdbBridgeClient.hpp"
#include <algorithm>
#include <limits>
#include <QDir>
#include <QFileInfo>
#include <QHostAddress>
#include <QStandardPaths>
#include <QTcpSocket>
#include "../Settings.hpp"





/** The port on which the ADB server listens on a computer. */
#define ADB_LOCAL_PORT 5037

/** The maximum time for the simple queries (version, getprop), in msec. */
#define ADB_QUERY_TIMEOUT 5000

/** The defaults for the Bridge/ListTimeoutMs and Bridge/InstallTimeoutMs settings, in msec. */
#define DEFAULT_LIST_TIMEOUT 10000
#define DEFAULT_INSTALL_TIMEOUT 60000





/** Returns the numerical value represented by the specified hex character.
Unknown characters are considered to be zero. */
static uint8_t hexValue(char aChar)
{
	if ((aChar >= '0') && (aChar <= '9'))
	{
		return static_cast<uint8_t>(aChar - '0');
	}
	if ((aChar >= 'a') && (aChar <= 'f'))
	{
		return static_cast<uint8_t>(aChar - 'a' + 10);
	}
	if ((aChar >= 'A') && (aChar <= 'F'))
	{
		return static_cast<uint8_t>(aChar - 'A' + 10);
	}
	return 0;
}





/** Returns the time left until the deadline, in msec, suitable for the QAbstractSocket::waitFor*() functions. */
static int remainingMsec(const QDeadlineTimer & aDeadline)
{
	return static_cast<int>(std::min<qint64>(
		std::max<qint64>(aDeadline.remainingTime(), 0),
		std::numeric_limits<int>::max()
	));
}





////////////////////////////////////////////////////////////////////////////////
// AdbBridgeClient:

AdbBridgeClient::AdbBridgeClient(ComponentCollection & aComponents):
	Super(aComponents),
	mServerPort(ADB_LOCAL_PORT),
	mListTimeoutMsec(DEFAULT_LIST_TIMEOUT),
	mInstallTimeoutMsec(DEFAULT_INSTALL_TIMEOUT),
	mShouldReplaceExisting(true),
	mLogger(aComponents.logger("AdbBridgeClient"))
{
	requireForStart(ComponentCollection::ckMultiLogger);
}





void AdbBridgeClient::start()
{
	mAdbPath = findAdbExecutable(Settings::loadValue("Bridge", "AdbPath").toString());
	auto port = loadPositiveSetting("ServerPort", ADB_LOCAL_PORT);
	if (port > std::numeric_limits<quint16>::max())
	{
		mLogger.log("Invalid Bridge/ServerPort %1, using %2 instead.", port, ADB_LOCAL_PORT);
		port = ADB_LOCAL_PORT;
	}
	mServerPort = static_cast<quint16>(port);
	mListTimeoutMsec = loadPositiveSetting("ListTimeoutMs", DEFAULT_LIST_TIMEOUT);
	mInstallTimeoutMsec = loadPositiveSetting("InstallTimeoutMs", DEFAULT_INSTALL_TIMEOUT);
	mShouldReplaceExisting = Settings::loadValue("Install", "ReplaceExisting", mShouldReplaceExisting).toBool();

	if (mAdbPath.isEmpty())
	{
		mLogger.log("ADB executable not found; install the Android SDK platform-tools, or set Bridge/AdbPath in the settings.");
		return;
	}
	if (isAdbAvailable())
	{
		mLogger.log("Using ADB at %1", mAdbPath);
	}
	else
	{
		mLogger.log("ADB at %1 cannot be run, the device status will show a bridge error.", mAdbPath);
	}
}





int AdbBridgeClient::loadPositiveSetting(const QString & aKey, int aDefault)
{
	auto value = Settings::loadValue("Bridge", aKey, aDefault);
	bool isOk = false;
	auto res = value.toInt(&isOk);
	if (!isOk || (res <= 0))
	{
		mLogger.log("Invalid Bridge/%1 value \"%2\" in the settings, using %3 instead.", aKey, value.toString(), aDefault);
		return aDefault;
	}
	return res;
}





AdbBridgeClient::DeviceEntries AdbBridgeClient::listDevices()
{
	QDeadlineTimer deadline(mListTimeoutMsec);
	QTcpSocket socket;
	connectToServer(socket, deadline);
	writeHex4(socket, "host:devices");
	/*
	Expected response:
	OKAY
	<len><ID>\t<status>\n<ID>\t<status>...
	(socket close)
	*/

	auto status = readExactly(socket, 4, deadline);
	if (status == "FAIL")
	{
		auto length = hex4ToNumber(readExactly(socket, 4, deadline));
		auto reason = readExactly(socket, length, deadline);
		throw BridgeUnavailableError("The ADB server refused to list the devices: %1", QString::fromUtf8(reason));
	}
	if (status != "OKAY")
	{
		throw BridgeUnavailableError("Malformed response received from the ADB server: %1", QString::fromLatin1(status.toHex()));
	}
	auto length = hex4ToNumber(readExactly(socket, 4, deadline));
	auto deviceTable = readExactly(socket, length, deadline);
	socket.abort();
	return parseDeviceList(deviceTable);
}





void AdbBridgeClient::install(const QString & aFilePath, const QByteArray & aTargetDeviceID)
{
	if (!QFileInfo(aFilePath).isFile())
	{
		throw InstallRejectedError(mLogger, "The package file doesn't exist: %1", aFilePath);
	}

	QStringList args;
	if (!aTargetDeviceID.isEmpty())
	{
		args << "-s" << QString::fromUtf8(aTargetDeviceID);
	}
	args << "install";
	if (mShouldReplaceExisting)
	{
		args << "-r";
	}
	args << aFilePath;

	mLogger.log("Installing %1 onto device %2...", aFilePath, aTargetDeviceID);
	auto res = runAdb(args, mInstallTimeoutMsec);
	if ((res.mExitCode == 0) && res.mStdOut.contains("Success"))
	{
		mLogger.log("Installed %1 successfully.", aFilePath);
		return;
	}

	// Report an error based on ADB output:
	auto output = QString::fromUtf8(res.mStdErr + res.mStdOut).trimmed();
	if (output.contains("unauthorized", Qt::CaseInsensitive))
	{
		throw DeviceUnauthorizedError(mLogger, "The device is not authorized for debugging, confirm the prompt on the device:\n%1", output);
	}
	throw InstallRejectedError(mLogger, "ADB failed to install the package (exit code %1):\n%2", res.mExitCode, output);
}





QString AdbBridgeClient::deviceFriendlyName(const QByteArray & aDeviceID)
{
	try
	{
		auto model = getProp(aDeviceID, "ro.product.model");
		auto brand = getProp(aDeviceID, "ro.product.brand");
		if (!model.isEmpty())
		{
			if (!brand.isEmpty() && !model.contains(brand, Qt::CaseInsensitive))
			{
				return brand + " " + model;
			}
			return model;
		}

		// Fall back to the other properties:
		for (const auto & propName: {"ro.product.name", "ro.product.device"})
		{
			auto value = getProp(aDeviceID, propName);
			if (!value.isEmpty())
			{
				return value;
			}
		}
	}
	catch (const std::exception & exc)
	{
		mLogger.log("Cannot query the name of device %1: %2", aDeviceID, exc.what());
	}
	return QString::fromUtf8(aDeviceID);
}





bool AdbBridgeClient::isAdbAvailable()
{
	try
	{
		auto res = runAdb({"version"}, ADB_QUERY_TIMEOUT);
		if (res.mExitCode != 0)
		{
			mLogger.log("ADB version check failed, exit code %1: %2", res.mExitCode, QString::fromUtf8(res.mStdErr));
			return false;
		}
		return true;
	}
	catch (const BridgeUnavailableError & exc)
	{
		mLogger.log("ADB is not available: %1", exc.message());
		return false;
	}
}





QString AdbBridgeClient::findAdbExecutable(const QString & aConfiguredPath)
{
	#ifdef Q_OS_WIN
		static const QString exeName("adb.exe");
	#else
		static const QString exeName("adb");
	#endif

	if (!aConfiguredPath.isEmpty())
	{
		QFileInfo fi(aConfiguredPath);
		if (fi.isFile() && fi.isExecutable())
		{
			return fi.absoluteFilePath();
		}
		qWarning() << "The configured ADB path is not an executable file: " << aConfiguredPath;
	}

	auto inPath = QStandardPaths::findExecutable("adb");
	if (!inPath.isEmpty())
	{
		return inPath;
	}

	QStringList folders;
	for (const auto & envVarName: {"ANDROID_SDK_ROOT", "ANDROID_HOME"})
	{
		auto sdkPath = qEnvironmentVariable(envVarName);
		if (!sdkPath.isEmpty())
		{
			folders << sdkPath + "/platform-tools";
		}
	}
	auto home = QDir::homePath();
	folders
		<< home + "/Android/Sdk/platform-tools"
		<< home + "/Library/Android/sdk/platform-tools"
		<< home + "/AppData/Local/Android/Sdk/platform-tools"
		<< "C:/Android/Sdk/platform-tools"
		<< QCoreApplication::applicationDirPath() + "/platform-tools";
	for (const auto & folder: folders)
	{
		QFileInfo fi(folder + "/" + exeName);
		if (fi.isFile() && fi.isExecutable())
		{
			return fi.absoluteFilePath();
		}
	}
	return QString();
}





AdbBridgeClient::DeviceEntries AdbBridgeClient::parseDeviceList(const QByteArray & aDeviceTable)
{
	DeviceEntries res;
	for (const auto & rawLine: aDeviceTable.split('\n'))
	{
		auto line = rawLine.trimmed();
		if (line.isEmpty())
		{
			continue;
		}
		auto parts = line.split('\t');
		if ((parts.size() < 2) || parts[0].isEmpty())
		{
			qDebug() << "Bad DeviceList line received: " << line;
			continue;
		}
		const auto & status = parts[1];
		if (status == "device")
		{
			res.emplace_back(parts[0], DeviceEntry::esReady);
		}
		else if ((status == "authorizing") || (status == "unauthorized"))
		{
			res.emplace_back(parts[0], DeviceEntry::esUnauthorized);
		}
		else
		{
			res.emplace_back(parts[0], DeviceEntry::esOffline);
		}
	}
	return res;
}





QByteArray AdbBridgeClient::numberToHex4(uint16_t aNumber)
{
	static const char hexChars[] = "0123456789ABCDEF";
	QByteArray res;
	res.resize(4);
	for (int i = 0; i < 4; ++i)
	{
		auto v = aNumber % 16;
		aNumber = aNumber >> 4;
		res[3 - i] = hexChars[v];
	}
	return res;
}





uint16_t AdbBridgeClient::hex4ToNumber(const QByteArray & aHex4EncodedNumber)
{
	uint16_t res = 0;
	for (int i = 0; i < 4; ++i)
	{
		auto val = (i < aHex4EncodedNumber.size()) ? hexValue(aHex4EncodedNumber[i]) : 0;
		res = static_cast<uint16_t>(res * 16 + val);
	}
	return res;
}





QString AdbBridgeClient::processErrorText(QProcess::ProcessError aProcessError)
{
	switch (aProcessError)
	{
		case QProcess::FailedToStart: return tr("The underlying ADB process failed to start.");
		case QProcess::Crashed:       return tr("The underlying ADB process crashed.");
		case QProcess::Timedout:      return tr("The underlying ADB process seems to have frozen.");
		case QProcess::WriteError:    return tr("Failed to send data to the underlying ADB process.");
		case QProcess::ReadError:     return tr("Failed to read data from the underlying ADB process.");
		case QProcess::UnknownError:  return tr("Unknown error in the underlying ADB process.");
	}
	return tr("Unknown error in the underlying ADB process.");
}





AdbBridgeClient::ProcessResult AdbBridgeClient::runAdb(const QStringList & aArgs, int aTimeoutMsec)
{
	if (mAdbPath.isEmpty())
	{
		throw BridgeUnavailableError("The ADB executable was not found. Install the Android SDK platform-tools, or set Bridge/AdbPath in the settings.");
	}

	QProcess proc;
	proc.setProgram(mAdbPath);
	proc.setArguments(aArgs);
	proc.setStandardInputFile(QProcess::nullDevice());
	proc.start();
	if (!proc.waitForStarted(aTimeoutMsec))
	{
		throw BridgeUnavailableError("Cannot run %1: %2", mAdbPath, processErrorText(proc.error()));
	}
	if (!proc.waitForFinished(aTimeoutMsec))
	{
		proc.kill();
		proc.waitForFinished(1000);
		throw BridgeUnavailableError("ADB didn't finish \"%1\" within %2 seconds.", aArgs.join(' '), aTimeoutMsec / 1000);
	}
	if (proc.exitStatus() != QProcess::NormalExit)
	{
		throw BridgeUnavailableError(processErrorText(QProcess::Crashed));
	}
	return {proc.exitCode(), proc.readAllStandardOutput(), proc.readAllStandardError()};
}





void AdbBridgeClient::connectToServer(QTcpSocket & aSocket, const QDeadlineTimer & aDeadline)
{
	aSocket.connectToHost(QHostAddress::LocalHost, mServerPort);
	if (aSocket.waitForConnected(remainingMsec(aDeadline)))
	{
		return;
	}

	// The ADB server is probably not running, try starting it:
	qDebug() << "Cannot connect to the ADB server: " << aSocket.errorString();
	aSocket.abort();
	auto res = runAdb({"start-server"}, remainingMsec(aDeadline));
	if (res.mExitCode != 0)
	{
		throw BridgeUnavailableError("Failed to start the ADB server: %1", QString::fromUtf8(res.mStdErr).trimmed());
	}
	aSocket.connectToHost(QHostAddress::LocalHost, mServerPort);
	if (!aSocket.waitForConnected(remainingMsec(aDeadline)))
	{
		throw BridgeUnavailableError("Cannot connect to the ADB server on port %1: %2", mServerPort, aSocket.errorString());
	}
}





void AdbBridgeClient::writeHex4(QTcpSocket & aSocket, const QByteArray & aMessage)
{
	auto len = aMessage.length();
	if (len > std::numeric_limits<uint16_t>::max())
	{
		throw LogicError("ADB message too long: %1 bytes", len);
	}
	aSocket.write(numberToHex4(static_cast<uint16_t>(len)));
	aSocket.write(aMessage);
	aSocket.flush();
}





QByteArray AdbBridgeClient::readExactly(QTcpSocket & aSocket, int aNumBytes, const QDeadlineTimer & aDeadline)
{
	QByteArray res;
	while (res.size() < aNumBytes)
	{
		res.append(aSocket.read(aNumBytes - res.size()));
		if (res.size() >= aNumBytes)
		{
			break;
		}
		if (aDeadline.hasExpired())
		{
			throw BridgeUnavailableError("The ADB server didn't respond in time.");
		}
		if (!aSocket.waitForReadyRead(remainingMsec(aDeadline)) && (aSocket.bytesAvailable() == 0))
		{
			if (aDeadline.hasExpired())
			{
				throw BridgeUnavailableError("The ADB server didn't respond in time.");
			}
			throw BridgeUnavailableError("The ADB server closed the connection: %1", aSocket.errorString());
		}
	}
	return res;
}





QString AdbBridgeClient::getProp(const QByteArray & aDeviceID, const QString & aPropName)
{
	auto res = runAdb({"-s", QString::fromUtf8(aDeviceID), "shell", "getprop", aPropName}, ADB_QUERY_TIMEOUT);
	if (res.mExitCode != 0)
	{
		return QString();
	}
	return QString::fromUtf8(res.mStdOut).trimmed();
}

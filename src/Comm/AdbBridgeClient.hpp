#pragma once

#include <QCoreApplication>
#include <QDeadlineTimer>
#include <QProcess>
#include <QStringList>
#include "BridgeClient.hpp"





// fwd:
class QTcpSocket;





/** Implements the BridgeClient interface using the Android Debug Bridge.
The device list is queried directly from the local ADB server, using its socket protocol ("host:devices").
If the server is not running, it is started using the ADB executable ("adb start-server").
Installing a package and querying the device properties is done by running the ADB executable.
Each operation uses its own socket / process, so the operations can run on multiple threads at once. */
class AdbBridgeClient:
	public BridgeClient
{
	using Super = BridgeClient;
	Q_DECLARE_TR_FUNCTIONS(AdbBridgeClient)


public:

	explicit AdbBridgeClient(ComponentCollection & aComponents);

	// ComponentCollection::Component overrides:
	virtual void start() override;

	// BridgeClient overrides:
	virtual DeviceEntries listDevices() override;
	virtual void install(const QString & aFilePath, const QByteArray & aTargetDeviceID) override;
	virtual QString deviceFriendlyName(const QByteArray & aDeviceID) override;

	/** Returns true if the ADB executable can be run ("adb version" succeeds within 5 seconds). */
	bool isAdbAvailable();

	/** Returns the full path to the ADB executable in use, empty if none was found. */
	const QString & adbExecutable() const { return mAdbPath; }

	int listTimeoutMsec() const { return mListTimeoutMsec; }
	int installTimeoutMsec() const { return mInstallTimeoutMsec; }
	quint16 serverPort() const { return mServerPort; }

	/** Searches for the ADB executable.
	Tries, in this order: aConfiguredPath, the PATH, the Android SDK pointed to by the ANDROID_SDK_ROOT and
	ANDROID_HOME env vars, the default SDK locations and finally the portable "platform-tools" folder next to
	the app's executable.
	Returns the full path to the executable, or an empty string if not found. */
	static QString findAdbExecutable(const QString & aConfiguredPath);

	/** Parses the device table sent by the ADB server (and printed by "adb devices").
	Each line is "<ID>\t<state>"; unparsable lines are skipped. */
	static DeviceEntries parseDeviceList(const QByteArray & aDeviceTable);

	/** Returns the specified number as a hex4-encoded string (such as "000C"). */
	static QByteArray numberToHex4(uint16_t aNumber);

	/** Converts the hex4-encoded number (such as "000c") to the number it represents.
	Characters that are invalid are considered to be zeroes. */
	static uint16_t hex4ToNumber(const QByteArray & aHex4EncodedNumber);

	/** Returns the user-visible description of the QProcess error. */
	static QString processErrorText(QProcess::ProcessError aProcessError);


protected:

	/** The result of a finished ADB process. */
	struct ProcessResult
	{
		int mExitCode;
		QByteArray mStdOut;
		QByteArray mStdErr;
	};


	/** The full path to the ADB executable; empty if not found. */
	QString mAdbPath;

	/** The TCP port on which the local ADB server listens. */
	quint16 mServerPort;

	/** The maximum time that listDevices() may take, including starting the ADB server. */
	int mListTimeoutMsec;

	/** The maximum time that a single install may take before the ADB process is killed. */
	int mInstallTimeoutMsec;

	/** If true, the packages are installed with the "-r" switch (replace the existing app, keep its data). */
	bool mShouldReplaceExisting;

	/** The logger used for all messages produced by this class. */
	Logger & mLogger;


	/** Returns the positive integer stored in the "Bridge" section under aKey.
	A missing, non-numeric or non-positive value is logged and aDefault is returned instead. */
	int loadPositiveSetting(const QString & aKey, int aDefault);

	/** Runs the ADB executable with the specified args and waits for it to finish.
	Throws a BridgeUnavailableError if the executable is not available, fails to start, crashes or times out
	(the process is killed on timeout). */
	ProcessResult runAdb(const QStringList & aArgs, int aTimeoutMsec);

	/** Connects the socket to the local ADB server.
	If the connection fails, tries to start the server once and connects again.
	Throws a BridgeUnavailableError if the connection cannot be made before the deadline. */
	void connectToServer(QTcpSocket & aSocket, const QDeadlineTimer & aDeadline);

	/** Writes the hex4-formatted length and then the message to the socket. */
	void writeHex4(QTcpSocket & aSocket, const QByteArray & aMessage);

	/** Reads exactly the specified number of bytes from the socket, waiting for them as needed.
	Throws a BridgeUnavailableError if the data doesn't arrive before the deadline or the socket is closed. */
	QByteArray readExactly(QTcpSocket & aSocket, int aNumBytes, const QDeadlineTimer & aDeadline);

	/** Returns the value of the specified system property on the device ("adb shell getprop").
	Returns an empty string if the property is not set or the query fails with a non-zero exit code.
	Throws a BridgeUnavailableError if ADB cannot be run. */
	QString getProp(const QByteArray & aDeviceID, const QString & aPropName);
};

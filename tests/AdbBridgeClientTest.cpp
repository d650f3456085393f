#include <future>
#include <memory>
#include <thread>
#include <QFile>
#include <QTcpServer>
#include <QTcpSocket>
#include <gtest/gtest.h>
#include "Comm/AdbBridgeClient.hpp"
#include "TestHelpers.hpp"

using DeviceEntry = BridgeClient::DeviceEntry;





TEST(AdbBridgeClientParseTest, ParsesTheDeviceTable)
{
	auto devices = AdbBridgeClient::parseDeviceList(
		"emulator-5554\tdevice\n"
		"R58M12345\tunauthorized\n"
		"0123456789ABCDEF\tauthorizing\n"
		"192.168.1.5:5555\toffline\n"
		"ZX1G22\trecovery\n"
	);
	ASSERT_EQ(devices.size(), 5u);
	EXPECT_EQ(devices[0].mID, "emulator-5554");
	EXPECT_EQ(devices[0].mState, DeviceEntry::esReady);
	EXPECT_EQ(devices[1].mState, DeviceEntry::esUnauthorized);
	EXPECT_EQ(devices[2].mState, DeviceEntry::esUnauthorized);
	EXPECT_EQ(devices[3].mID, "192.168.1.5:5555");
	EXPECT_EQ(devices[3].mState, DeviceEntry::esOffline);
	EXPECT_EQ(devices[4].mState, DeviceEntry::esOffline);
}





TEST(AdbBridgeClientParseTest, SkipsEmptyAndMalformedLines)
{
	EXPECT_TRUE(AdbBridgeClient::parseDeviceList("").empty());
	auto devices = AdbBridgeClient::parseDeviceList("\r\n\ngarbage\nabc\tdevice\r\n\n");
	ASSERT_EQ(devices.size(), 1u);
	EXPECT_EQ(devices[0].mID, "abc");
	EXPECT_TRUE(devices[0].isReady());
}





TEST(AdbBridgeClientParseTest, Hex4)
{
	EXPECT_EQ(AdbBridgeClient::numberToHex4(0), "0000");
	EXPECT_EQ(AdbBridgeClient::numberToHex4(12), "000C");
	EXPECT_EQ(AdbBridgeClient::numberToHex4(0xabcd), "ABCD");
	EXPECT_EQ(AdbBridgeClient::hex4ToNumber("000c"), 12);
	EXPECT_EQ(AdbBridgeClient::hex4ToNumber("FFFF"), 0xffff);
	EXPECT_EQ(AdbBridgeClient::hex4ToNumber("00x1"), 1);
}





////////////////////////////////////////////////////////////////////////////////
// AdbBridgeClientTest:

/** Provides an AdbBridgeClient in a ComponentCollection with temporary settings and logs. */
class AdbBridgeClientTest:
	public CoreTest
{
protected:

	std::shared_ptr<AdbBridgeClient> mClient;


	virtual void SetUp() override
	{
		CoreTest::SetUp();
		mClient = mComponents->addNew<AdbBridgeClient>();
	}


	virtual void TearDown() override
	{
		mClient.reset();
		CoreTest::TearDown();
	}


	/** Runs a single-connection fake ADB server on a background thread.
	The server reads the request, stores it into aRequest, sends aResponse and closes the connection.
	Returns the port on which the server listens. */
	quint16 startFakeServer(const QByteArray & aResponse, QByteArray & aRequest, std::thread & aThread)
	{
		std::promise<quint16> portPromise;
		auto portFuture = portPromise.get_future();
		aThread = std::thread([&aResponse, &aRequest, &portPromise]()
			{
				QTcpServer server;
				if (!server.listen(QHostAddress::LocalHost, 0))
				{
					portPromise.set_value(0);
					return;
				}
				portPromise.set_value(server.serverPort());
				if (!server.waitForNewConnection(5000))
				{
					return;
				}
				std::unique_ptr<QTcpSocket> sock(server.nextPendingConnection());
				QByteArray request;
				while ((request.size() < 16) && sock->waitForReadyRead(5000))
				{
					request.append(sock->readAll());
				}
				aRequest = request;
				sock->write(aResponse);
				sock->waitForBytesWritten(5000);
				sock->disconnectFromHost();
				if (sock->state() != QAbstractSocket::UnconnectedState)
				{
					sock->waitForDisconnected(1000);
				}
			}
		);
		return portFuture.get();
	}
};





TEST_F(AdbBridgeClientTest, ListsDevicesFromTheServer)
{
	QByteArray table("emulator-5554\tdevice\nR58M12345\tunauthorized\n");
	QByteArray response = "OKAY" + AdbBridgeClient::numberToHex4(static_cast<uint16_t>(table.size())) + table;
	QByteArray request;
	std::thread serverThread;
	auto port = startFakeServer(response, request, serverThread);
	ASSERT_NE(port, 0);
	Settings::saveValue("Bridge", "ServerPort", port);
	mComponents->start();

	auto devices = mClient->listDevices();
	serverThread.join();
	EXPECT_EQ(request, "000Chost:devices");
	ASSERT_EQ(devices.size(), 2u);
	EXPECT_EQ(devices[0].mID, "emulator-5554");
	EXPECT_TRUE(devices[0].isReady());
	EXPECT_EQ(devices[1].mState, DeviceEntry::esUnauthorized);
}





TEST_F(AdbBridgeClientTest, ServerRefusalIsBridgeError)
{
	QByteArray reason("unknown host service");
	QByteArray response = "FAIL" + AdbBridgeClient::numberToHex4(static_cast<uint16_t>(reason.size())) + reason;
	QByteArray request;
	std::thread serverThread;
	auto port = startFakeServer(response, request, serverThread);
	ASSERT_NE(port, 0);
	Settings::saveValue("Bridge", "ServerPort", port);
	mComponents->start();

	try
	{
		mClient->listDevices();
		ADD_FAILURE() << "listDevices() should have thrown";
	}
	catch (const BridgeUnavailableError & exc)
	{
		EXPECT_TRUE(exc.message().contains("unknown host service"));
	}
	serverThread.join();
}





TEST_F(AdbBridgeClientTest, MissingPackageIsRejected)
{
	EXPECT_THROW(mClient->install(mTempDir.filePath("missing.apk"), "dev1"), InstallRejectedError);
}





TEST_F(AdbBridgeClientTest, WithoutAdbEverythingDegrades)
{
	// Not started, so no ADB executable has been looked up:
	EXPECT_TRUE(mClient->adbExecutable().isEmpty());
	EXPECT_FALSE(mClient->isAdbAvailable());
	EXPECT_EQ(mClient->deviceFriendlyName("dev1"), "dev1");

	QFile f(mTempDir.filePath("app.apk"));
	ASSERT_TRUE(f.open(QIODevice::WriteOnly));
	f.write("PK");
	f.close();
	EXPECT_THROW(mClient->install(f.fileName(), "dev1"), BridgeUnavailableError);
}





#ifndef Q_OS_WIN
TEST_F(AdbBridgeClientTest, FindAdbHonorsTheConfiguredPath)
{
	auto adbPath = mTempDir.filePath("adb");
	QFile f(adbPath);
	ASSERT_TRUE(f.open(QIODevice::WriteOnly));
	f.write("#!/bin/sh\nexit 0\n");
	f.close();
	ASSERT_TRUE(f.setPermissions(f.permissions() | QFile::ExeOwner | QFile::ExeUser));

	EXPECT_EQ(AdbBridgeClient::findAdbExecutable(adbPath), adbPath);
}
#endif





TEST_F(AdbBridgeClientTest, InvalidSettingsFallBackToDefaults)
{
	Settings::saveValue("Bridge", "InstallTimeoutMs", -1);
	Settings::saveValue("Bridge", "ListTimeoutMs", 1500);
	Settings::saveValue("Bridge", "ServerPort", 70000);
	mClient->start();

	EXPECT_EQ(mClient->installTimeoutMsec(), 60000);
	EXPECT_EQ(mClient->listTimeoutMsec(), 1500);
	EXPECT_EQ(mClient->serverPort(), 5037);

	Settings::saveValue("Bridge", "InstallTimeoutMs", "soon");
	Settings::saveValue("Bridge", "ListTimeoutMs", 0);
	mClient->start();
	EXPECT_EQ(mClient->installTimeoutMsec(), 60000);
	EXPECT_EQ(mClient->listTimeoutMsec(), 10000);
}

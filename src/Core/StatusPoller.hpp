#pragma once

#include <atomic>
#include <map>
#include <QThread>
#include "DeviceStatus.hpp"
#include "../Comm/BridgeClient.hpp"





// fwd:
class Logger;
class QTimer;





/** Periodically queries the bridge for the attached devices and publishes the resulting DeviceState.
Runs in its own thread; the state is published through the deviceStateChanged() signal only when it differs
from the previously published one (status or device ID), the first poll always publishes.
If a poll takes longer than the polling interval, the ticks that fell into the overrun are skipped
(not queued) and counted. */
class StatusPoller:
	public QThread
{
	using Super = QThread;

	Q_OBJECT


public:

	/** Specifies how the device to install onto is selected when multiple devices are attached. */
	enum MultiDevicePolicy
	{
		mdpFirstReady,       ///< The first ready device is selected; if none is ready, the first device (unauthorized)
		mdpPreferredTarget,  ///< Only the configured preferred device is considered
	};


	StatusPoller(
		BridgeClient & aBridge,
		Logger & aLogger,
		MultiDevicePolicy aPolicy = mdpFirstReady,
		const QByteArray & aPreferredTargetID = QByteArray()
	);

	virtual ~StatusPoller() override;

	/** Starts the polling thread. The first poll is done immediately, then every aIntervalMsec. */
	void startPolling(int aIntervalMsec);

	/** Stops the polling and waits for the thread to finish.
	If a poll is in progress, waits for it to complete (bounded by the bridge's own timeout). */
	void stop();

	/** Classifies the device list into a DeviceState, using the specified multi-device policy.
	With mdpPreferredTarget and an empty aPreferredTargetID, behaves as mdpFirstReady.
	The returned state carries no friendly name. */
	static DeviceState classify(
		const BridgeClient::DeviceEntries & aDevices,
		MultiDevicePolicy aPolicy,
		const QByteArray & aPreferredTargetID
	);

	/** Converts the policy name, as stored in the settings, into the enum value.
	Unknown names are reported with a warning and mapped to mdpFirstReady. */
	static MultiDevicePolicy policyFromString(const QString & aPolicyName);

	/** Returns the number of ticks skipped so far due to a poll running longer than the interval. */
	int numSkippedTicks() const { return mNumSkippedTicks.load(); }

	/** Returns the number of polls executed so far. */
	int numPolls() const { return mNumPolls.load(); }


protected:

	/** The bridge used for querying the devices. */
	BridgeClient & mBridge;

	/** The logger used for all messages produced by this class. */
	Logger & mLogger;

	MultiDevicePolicy mPolicy;

	/** The device to select, for mdpPreferredTarget. */
	QByteArray mPreferredTargetID;

	/** The polling interval, set by startPolling(). */
	int mIntervalMsec;

	std::atomic<int> mNumSkippedTicks;
	std::atomic<int> mNumPolls;

	/** The last published state.
	Accessed only from the polling thread. */
	DeviceState mLastState;

	/** Set once the first state has been published.
	Accessed only from the polling thread. */
	bool mHasPublished;

	/** Friendly names of the devices queried so far, map of DeviceID -> name.
	Accessed only from the polling thread. */
	std::map<QByteArray, QString> mDeviceNames;


	// QThread overrides:
	virtual void run() override;

	/** Executes a single poll and measures its duration.
	If the poll overran the interval, counts the skipped ticks and restarts aTimer, so that the overdue tick
	is dropped. */
	void tick(QTimer & aTimer);

	/** Queries the device list, classifies it and publishes the result, if it changed. */
	void pollOnce();

	/** Returns the friendly name of the specified device, querying the bridge only the first time. */
	QString friendlyName(const QByteArray & aDeviceID);


Q_SIGNALS:

	/** Emitted in the polling thread when the classified state differs from the previously published one. */
	void deviceStateChanged(const DeviceState & aNewState);
};

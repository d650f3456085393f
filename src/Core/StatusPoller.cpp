#include "StatusPoller.hpp"
#include <QElapsedTimer>
#include <QTimer>
#include "../Exception.hpp"
#include "../Logger.hpp"





StatusPoller::StatusPoller(
	BridgeClient & aBridge,
	Logger & aLogger,
	MultiDevicePolicy aPolicy,
	const QByteArray & aPreferredTargetID
):
	mBridge(aBridge),
	mLogger(aLogger),
	mPolicy(aPolicy),
	mPreferredTargetID(aPreferredTargetID),
	mIntervalMsec(2000),
	mNumSkippedTicks(0),
	mNumPolls(0),
	mHasPublished(false)
{
	setObjectName("StatusPoller");
}





StatusPoller::~StatusPoller()
{
	stop();
}





void StatusPoller::startPolling(int aIntervalMsec)
{
	if (isRunning())
	{
		throw LogicError("The status poller is already running.");
	}
	if (aIntervalMsec <= 0)
	{
		throw LogicError("Invalid polling interval: %1 msec", aIntervalMsec);
	}
	mIntervalMsec = aIntervalMsec;
	QThread::start();
}





void StatusPoller::stop()
{
	QThread::quit();
	QThread::wait();
}





DeviceState StatusPoller::classify(
	const BridgeClient::DeviceEntries & aDevices,
	MultiDevicePolicy aPolicy,
	const QByteArray & aPreferredTargetID
)
{
	if ((aPolicy == mdpPreferredTarget) && !aPreferredTargetID.isEmpty())
	{
		for (const auto & dev: aDevices)
		{
			if (dev.mID == aPreferredTargetID)
			{
				return DeviceState(dev.isReady() ? dsConnected : dsUnauthorized, dev.mID);
			}
		}
		return DeviceState();
	}

	if (aDevices.empty())
	{
		return DeviceState();
	}
	for (const auto & dev: aDevices)
	{
		if (dev.isReady())
		{
			return DeviceState(dsConnected, dev.mID);
		}
	}
	return DeviceState(dsUnauthorized, aDevices.front().mID);
}





StatusPoller::MultiDevicePolicy StatusPoller::policyFromString(const QString & aPolicyName)
{
	if (aPolicyName.compare("PreferredTarget", Qt::CaseInsensitive) == 0)
	{
		return mdpPreferredTarget;
	}
	if (!aPolicyName.isEmpty() && (aPolicyName.compare("FirstReady", Qt::CaseInsensitive) != 0))
	{
		qWarning() << "Unknown multi-device policy, using FirstReady: " << aPolicyName;
	}
	return mdpFirstReady;
}





void StatusPoller::run()
{
	mLogger.log("Polling started, interval %1 msec.", mIntervalMsec);

	QTimer timer;
	connect(&timer, &QTimer::timeout, &timer, [this, &timer]()
		{
			tick(timer);
		}
	);
	timer.start(mIntervalMsec);
	tick(timer);

	exec();

	timer.stop();
	mLogger.log("Polling stopped after %1 polls, %2 skipped ticks.", mNumPolls.load(), mNumSkippedTicks.load());
}





void StatusPoller::tick(QTimer & aTimer)
{
	QElapsedTimer elapsed;
	elapsed.start();
	pollOnce();
	auto duration = elapsed.elapsed();
	if (duration < mIntervalMsec)
	{
		return;
	}

	// The poll overran, drop the ticks that have become due in the meantime:
	auto numSkipped = static_cast<int>(duration / mIntervalMsec);
	mNumSkippedTicks += numSkipped;
	mLogger.log("The poll took %1 msec, skipping %2 tick(s).", duration, numSkipped);
	aTimer.start(mIntervalMsec);
}





void StatusPoller::pollOnce()
{
	mNumPolls += 1;
	DeviceState state;
	try
	{
		state = classify(mBridge.listDevices(), mPolicy, mPreferredTargetID);
	}
	catch (const std::exception & exc)
	{
		if (!mHasPublished || (mLastState.status() != dsBridgeError))
		{
			mLogger.log("Cannot list the devices: %1", exc.what());
		}
		state = DeviceState(dsBridgeError, QByteArray());
	}

	if (mHasPublished && state.isSameAs(mLastState))
	{
		return;
	}
	if (state.status() == dsConnected)
	{
		state = state.withDeviceName(friendlyName(state.deviceID()));
	}
	mLogger.log("Device state changed: %1", state);
	mLastState = state;
	mHasPublished = true;
	Q_EMIT deviceStateChanged(state);
}





QString StatusPoller::friendlyName(const QByteArray & aDeviceID)
{
	auto itr = mDeviceNames.find(aDeviceID);
	if (itr != mDeviceNames.end())
	{
		return itr->second;
	}
	auto name = mBridge.deviceFriendlyName(aDeviceID);
	mDeviceNames[aDeviceID] = name;
	return name;
}

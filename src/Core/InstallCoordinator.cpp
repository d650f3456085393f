#include "InstallCoordinator.hpp"
#include <QCoreApplication>
#include "InstallWorker.hpp"
#include "StatusPoller.hpp"
#include "../Comm/BridgeClient.hpp"
#include "../Settings.hpp"





const int InstallCoordinator::DEFAULT_POLL_INTERVAL_MSEC;





InstallCoordinator::InstallCoordinator(ComponentCollection & aComponents):
	ComponentSuper(aComponents),
	mLogger(aComponents.logger("InstallCoordinator")),
	mState(csIdle),
	mPollIntervalMsec(DEFAULT_POLL_INTERVAL_MSEC)
{
	requireForStart(ComponentCollection::ckMultiLogger);
	requireForStart(ComponentCollection::ckBridgeClient);

	setObjectName("InstallCoordinator");
	qRegisterMetaType<DeviceState>();
	qRegisterMetaType<InstallRequest>();
	qRegisterMetaType<InstallOutcome>();
	qRegisterMetaType<CoreEvent>();
	qRegisterMetaType<InstallCoordinator::State>();
}





InstallCoordinator::~InstallCoordinator()
{
	if (mState.load() != csStopped)
	{
		shutdown();
	}
}





void InstallCoordinator::start()
{
	if (mState.load() != csIdle)
	{
		throw LogicError("The install coordinator has already been started (state %1).", stateToString(mState.load()));
	}

	auto intervalMsec = Settings::loadValue("Poll", "IntervalMs", DEFAULT_POLL_INTERVAL_MSEC).toInt();
	if (intervalMsec <= 0)
	{
		mLogger.log("Invalid poll interval %1 in the settings, using %2 msec instead.", intervalMsec, DEFAULT_POLL_INTERVAL_MSEC);
		intervalMsec = DEFAULT_POLL_INTERVAL_MSEC;
	}
	mPollIntervalMsec = intervalMsec;
	auto policy = StatusPoller::policyFromString(Settings::loadValue("Bridge", "MultiDevicePolicy", "FirstReady").toString());
	auto targetDevice = Settings::loadValue("Bridge", "TargetDevice").toByteArray();
	mLogger.log("Starting: poll interval %1 msec, multi-device policy %2, target device \"%3\".",
		intervalMsec, static_cast<int>(policy), targetDevice
	);

	mBridge = mComponents.get<BridgeClient>();
	mPoller.reset(new StatusPoller(*mBridge, mComponents.logger("StatusPoller"), policy, targetDevice));
	mWorker.reset(new InstallWorker(mQueue, *mBridge, mComponents.logger("InstallWorker")));
	connect(mPoller.get(), &StatusPoller::deviceStateChanged, this, &InstallCoordinator::onDeviceStateChanged, Qt::QueuedConnection);
	connect(mWorker.get(), &InstallWorker::installStarted,    this, &InstallCoordinator::onInstallStarted,     Qt::QueuedConnection);
	connect(mWorker.get(), &InstallWorker::installFinished,   this, &InstallCoordinator::onInstallFinished,    Qt::QueuedConnection);
	connect(mWorker.get(), &InstallWorker::idle,              this, &InstallCoordinator::onWorkerIdle,         Qt::QueuedConnection);

	setState(csRunning);
	mWorker->start();
	mPoller->startPolling(intervalMsec);
}





void InstallCoordinator::stop()
{
	shutdown();
}





void InstallCoordinator::enqueueInstall(const QStringList & aFilePaths, const QByteArray & aTargetDeviceID)
{
	auto state = mState.load();
	if ((state == csShuttingDown) || (state == csStopped))
	{
		throw LogicError("Cannot enqueue installs, the install coordinator is %1.", stateToString(state));
	}

	std::vector<InstallRequest> batch;
	batch.reserve(static_cast<size_t>(aFilePaths.size()));
	for (const auto & fileName: aFilePaths)
	{
		batch.emplace_back(fileName, aTargetDeviceID);
	}
	mQueue.enqueue(batch);
	mLogger.log("Enqueued %1 package(s) for device %2: %3", batch.size(), aTargetDeviceID, aFilePaths);
}





QMetaObject::Connection InstallCoordinator::subscribe(QObject * aContext, EventHandler aHandler)
{
	if (aContext == nullptr)
	{
		throw LogicError("Cannot subscribe without a context object.");
	}
	return connect(this, &InstallCoordinator::eventOccurred, aContext, std::move(aHandler));
}





void InstallCoordinator::unsubscribe(const QMetaObject::Connection & aSubscription)
{
	disconnect(aSubscription);
}





void InstallCoordinator::shutdown()
{
	if (mState.load() == csStopped)
	{
		return;
	}
	mLogger.log("Shutting down...");
	setState(csShuttingDown);

	if (mPoller != nullptr)
	{
		mPoller->stop();
	}
	auto discarded = mQueue.closeAndClear();
	for (const auto & req: discarded)
	{
		mLogger.log("Discarding the queued request %1", req);
	}
	if (mWorker != nullptr)
	{
		// Wait for the install in progress:
		mWorker->wait();
	}

	// Deliver the reports still in transit from the poller and the worker:
	QCoreApplication::sendPostedEvents(this, QEvent::MetaCall);

	setState(csStopped);
	mLogger.log("Shut down, %1 request(s) discarded.", discarded.size());
}





DeviceState InstallCoordinator::currentDeviceState() const
{
	QMutexLocker lock(&mMtxDeviceState);
	return mDeviceState;
}





int InstallCoordinator::numSkippedPollTicks() const
{
	if (mPoller == nullptr)
	{
		return 0;
	}
	return mPoller->numSkippedTicks();
}





QString InstallCoordinator::stateToString(State aState)
{
	switch (aState)
	{
		case csIdle:         return QString::fromUtf8("idle");
		case csRunning:      return QString::fromUtf8("running");
		case csInstalling:   return QString::fromUtf8("installing");
		case csShuttingDown: return QString::fromUtf8("shutting down");
		case csStopped:      return QString::fromUtf8("stopped");
	}
	return QString::fromUtf8("<unknown state %1>").arg(static_cast<int>(aState));
}





void InstallCoordinator::setState(State aNewState)
{
	auto oldState = mState.exchange(aNewState);
	if (oldState == aNewState)
	{
		return;
	}
	mLogger.log("State changed from %1 to %2.", stateToString(oldState), stateToString(aNewState));
	Q_EMIT stateChanged(aNewState);
}





void InstallCoordinator::onDeviceStateChanged(const DeviceState & aNewState)
{
	{
		QMutexLocker lock(&mMtxDeviceState);
		mDeviceState = aNewState;
	}
	Q_EMIT eventOccurred(CoreEvent::deviceStateChanged(aNewState));
}





void InstallCoordinator::onInstallStarted(const InstallRequest & aRequest)
{
	auto state = mState.load();
	if ((state == csRunning) || (state == csIdle))
	{
		setState(csInstalling);
	}
	Q_EMIT eventOccurred(CoreEvent::installStarted(aRequest));
}





void InstallCoordinator::onInstallFinished(const InstallOutcome & aOutcome)
{
	mLogger.log("Finished: %1", aOutcome);
	Q_EMIT eventOccurred(CoreEvent::installFinished(aOutcome));
}





void InstallCoordinator::onWorkerIdle()
{
	if (mState.load() == csInstalling)
	{
		setState(csRunning);
	}
}

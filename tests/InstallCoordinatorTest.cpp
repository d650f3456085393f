#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "Core/InstallCoordinator.hpp"
#include "FakeBridgeClient.hpp"
#include "TestHelpers.hpp"





/** Runs a complete InstallCoordinator over a FakeBridgeClient and collects its events. */
class InstallCoordinatorTest:
	public CoreTest
{
protected:

	std::shared_ptr<FakeBridgeClient> mBridge;
	std::shared_ptr<InstallCoordinator> mCoordinator;

	/** The subscription context, living in the test thread. */
	std::unique_ptr<QObject> mReceiver;

	std::vector<CoreEvent> mEvents;
	std::vector<InstallCoordinator::State> mStates;


	virtual void SetUp() override
	{
		CoreTest::SetUp();
		Settings::saveValue("Poll", "IntervalMs", 20);
		mBridge = mComponents->addNew<FakeBridgeClient>();
		mCoordinator = mComponents->addNew<InstallCoordinator>();
		mReceiver.reset(new QObject);
		mCoordinator->subscribe(mReceiver.get(), [this](const CoreEvent & aEvent)
			{
				mEvents.push_back(aEvent);
			}
		);
		QObject::connect(mCoordinator.get(), &InstallCoordinator::stateChanged, mReceiver.get(),
			[this](InstallCoordinator::State aState)
			{
				mStates.push_back(aState);
			}
		);
		mComponents->start();
	}


	virtual void TearDown() override
	{
		mBridge->openGate();
		mCoordinator->shutdown();
		mReceiver.reset();
		mCoordinator.reset();
		mBridge.reset();
		CoreTest::TearDown();
	}


	/** Returns the events of the specified kind, in the order received. */
	std::vector<CoreEvent> eventsOfKind(CoreEvent::Kind aKind) const
	{
		std::vector<CoreEvent> res;
		for (const auto & ev: mEvents)
		{
			if (ev.kind() == aKind)
			{
				res.push_back(ev);
			}
		}
		return res;
	}


	/** Returns the file names of the finished requests, in the order received. */
	QStringList finishedFiles() const
	{
		QStringList res;
		for (const auto & ev: eventsOfKind(CoreEvent::ekInstallFinished))
		{
			res.append(ev.request().filePath());
		}
		return res;
	}


	size_t numFinished() const
	{
		return eventsOfKind(CoreEvent::ekInstallFinished).size();
	}
};





TEST_F(InstallCoordinatorTest, PublishesTheDeviceState)
{
	ASSERT_TRUE(waitUntil([this]() { return !eventsOfKind(CoreEvent::ekDeviceStateChanged).empty(); }));
	auto ev = eventsOfKind(CoreEvent::ekDeviceStateChanged).front();
	EXPECT_EQ(ev.deviceState().status(), dsConnected);
	EXPECT_EQ(ev.deviceState().deviceID(), "fake-device");
	EXPECT_EQ(ev.deviceState().deviceName(), "Fake fake-device");
	EXPECT_EQ(mCoordinator->currentDeviceState().status(), dsConnected);
}





TEST_F(InstallCoordinatorTest, InstallsInOrderOneAtATime)
{
	QStringList files{"a.apk", "b.apk", "c.apk", "d.apk", "e.apk"};
	mCoordinator->enqueueInstall(files, "fake-device");
	ASSERT_TRUE(waitUntil([this]() { return (numFinished() == 5); }));

	EXPECT_EQ(finishedFiles(), files);
	EXPECT_EQ(mBridge->installedFiles(), files);
	EXPECT_EQ(mBridge->maxInstallInFlight(), 1);

	// Each start is followed by its finish before the next start:
	QStringList installEvents;
	for (const auto & ev: mEvents)
	{
		if (ev.kind() == CoreEvent::ekInstallStarted)
		{
			installEvents.append("s:" + ev.request().filePath());
		}
		else if (ev.kind() == CoreEvent::ekInstallFinished)
		{
			installEvents.append("f:" + ev.request().filePath());
		}
	}
	QStringList expected;
	for (const auto & f: files)
	{
		expected << "s:" + f << "f:" + f;
	}
	EXPECT_EQ(installEvents, expected);
	for (const auto & ev: eventsOfKind(CoreEvent::ekInstallFinished))
	{
		EXPECT_TRUE(ev.outcome().succeeded());
	}
}





TEST_F(InstallCoordinatorTest, ConcurrentEnqueueKeepsSingleInstallInFlight)
{
	static const int NUM_THREADS = 4;
	static const int NUM_PER_THREAD = 5;
	mBridge->mInstallDelayMsec = 2;
	std::vector<std::thread> producers;
	for (int t = 0; t < NUM_THREADS; ++t)
	{
		producers.emplace_back([this, t]()
			{
				for (int i = 0; i < NUM_PER_THREAD; ++i)
				{
					mCoordinator->enqueueInstall({QString("t%1-%2.apk").arg(t).arg(i)}, "fake-device");
				}
			}
		);
	}
	for (auto & thr: producers)
	{
		thr.join();
	}
	ASSERT_TRUE(waitUntil([this]() { return (numFinished() == NUM_THREADS * NUM_PER_THREAD); }));
	EXPECT_EQ(mBridge->maxInstallInFlight(), 1);

	// The per-thread order is kept:
	auto finished = finishedFiles();
	for (int t = 0; t < NUM_THREADS; ++t)
	{
		int lastIndex = -1;
		for (int i = 0; i < NUM_PER_THREAD; ++i)
		{
			auto idx = finished.indexOf(QString("t%1-%2.apk").arg(t).arg(i));
			ASSERT_GE(idx, 0);
			EXPECT_GT(idx, lastIndex);
			lastIndex = idx;
		}
	}
}





TEST_F(InstallCoordinatorTest, FailureIsReportedAndTheRestIsInstalled)
{
	mBridge->failInstallOf("b.apk");
	mCoordinator->enqueueInstall({"a.apk", "b.apk", "c.apk"}, "fake-device");
	ASSERT_TRUE(waitUntil([this]() { return (numFinished() == 3); }));

	auto finished = eventsOfKind(CoreEvent::ekInstallFinished);
	EXPECT_EQ(finished[0].request().filePath(), "a.apk");
	EXPECT_TRUE(finished[0].outcome().succeeded());
	EXPECT_EQ(finished[1].request().filePath(), "b.apk");
	EXPECT_FALSE(finished[1].outcome().succeeded());
	EXPECT_TRUE(finished[1].outcome().message().contains("INSTALL_FAILED_INVALID_APK"));
	EXPECT_EQ(finished[2].request().filePath(), "c.apk");
	EXPECT_TRUE(finished[2].outcome().succeeded());
}





TEST_F(InstallCoordinatorTest, ShutdownFinishesTheInstallInProgressAndDiscardsTheRest)
{
	mBridge->closeGate();
	mCoordinator->enqueueInstall({"a.apk", "b.apk", "c.apk"}, "fake-device");
	ASSERT_TRUE(waitUntil([this]() { return (mBridge->installInFlight() == 1); }));

	std::thread gateOpener([this]()
		{
			QThread::msleep(100);
			mBridge->openGate();
		}
	);
	mCoordinator->shutdown();
	gateOpener.join();

	// The outcome of the install in progress has been delivered by shutdown() itself:
	auto finished = eventsOfKind(CoreEvent::ekInstallFinished);
	ASSERT_EQ(finished.size(), 1u);
	EXPECT_EQ(finished[0].request().filePath(), "a.apk");
	EXPECT_TRUE(finished[0].outcome().succeeded());
	EXPECT_EQ(mBridge->numInstallCalls(), 1);
	EXPECT_EQ(mCoordinator->state(), InstallCoordinator::csStopped);
	EXPECT_EQ(mCoordinator->numQueued(), 0u);

	// Nothing more arrives later:
	pumpEvents(100);
	EXPECT_EQ(numFinished(), 1u);
	EXPECT_EQ(mBridge->numInstallCalls(), 1);
}





TEST_F(InstallCoordinatorTest, EnqueueAfterShutdownThrows)
{
	mCoordinator->shutdown();
	EXPECT_THROW(mCoordinator->enqueueInstall({"a.apk"}, "fake-device"), LogicError);
	EXPECT_EQ(mBridge->numInstallCalls(), 0);
}





TEST_F(InstallCoordinatorTest, StateTransitions)
{
	EXPECT_EQ(mCoordinator->state(), InstallCoordinator::csRunning);
	mCoordinator->enqueueInstall({"a.apk", "b.apk"}, "fake-device");
	ASSERT_TRUE(waitUntil([this]() { return (numFinished() == 2); }));
	ASSERT_TRUE(waitUntil([this]() { return (mCoordinator->state() == InstallCoordinator::csRunning); }));
	mCoordinator->shutdown();
	pumpEvents(20);

	std::vector<InstallCoordinator::State> expected
	{
		InstallCoordinator::csRunning,
		InstallCoordinator::csInstalling,
		InstallCoordinator::csRunning,
		InstallCoordinator::csShuttingDown,
		InstallCoordinator::csStopped,
	};
	EXPECT_EQ(mStates, expected);
}





TEST_F(InstallCoordinatorTest, UnsubscribedHandlerGetsNoMoreEvents)
{
	int numReceived = 0;
	QObject context;
	auto subscription = mCoordinator->subscribe(&context, [&numReceived](const CoreEvent &)
		{
			numReceived += 1;
		}
	);
	mCoordinator->enqueueInstall({"a.apk"}, "fake-device");
	ASSERT_TRUE(waitUntil([this]() { return (numFinished() == 1); }));
	auto numBefore = numReceived;
	EXPECT_GE(numBefore, 2);

	mCoordinator->unsubscribe(subscription);
	mCoordinator->enqueueInstall({"b.apk"}, "fake-device");
	ASSERT_TRUE(waitUntil([this]() { return (numFinished() == 2); }));
	EXPECT_EQ(numReceived, numBefore);
}





TEST_F(InstallCoordinatorTest, PollingContinuesDuringInstallAndEventsKeepTheirOrder)
{
	ASSERT_TRUE(waitUntil([this]() { return (mCoordinator->currentDeviceState().status() == dsConnected); }));

	mBridge->closeGate();
	mCoordinator->enqueueInstall({"a.apk"}, "fake-device");
	ASSERT_TRUE(waitUntil([this]() { return (mBridge->installInFlight() == 1); }));

	// The device disappears while the install is held at the gate:
	mBridge->setListDevicesHandler([]() { return FakeBridgeClient::DeviceEntries(); });
	ASSERT_TRUE(waitUntil([this]() { return (mCoordinator->currentDeviceState().status() == dsAbsent); }));
	EXPECT_EQ(mBridge->installInFlight(), 1);
	EXPECT_EQ(numFinished(), 0u);
	EXPECT_EQ(mCoordinator->state(), InstallCoordinator::csInstalling);

	mBridge->openGate();
	ASSERT_TRUE(waitUntil([this]() { return (numFinished() == 1); }));

	// The events arrive in the order they were produced: start, device gone, finish:
	int idxStarted = -1, idxAbsent = -1, idxFinished = -1;
	for (size_t i = 0; i < mEvents.size(); ++i)
	{
		const auto & ev = mEvents[i];
		switch (ev.kind())
		{
			case CoreEvent::ekInstallStarted:  idxStarted = static_cast<int>(i); break;
			case CoreEvent::ekInstallFinished: idxFinished = static_cast<int>(i); break;
			case CoreEvent::ekDeviceStateChanged:
			{
				if (ev.deviceState().status() == dsAbsent)
				{
					idxAbsent = static_cast<int>(i);
				}
				break;
			}
		}
	}
	ASSERT_GE(idxStarted, 0);
	EXPECT_LT(idxStarted, idxAbsent);
	EXPECT_LT(idxAbsent, idxFinished);
	EXPECT_EQ(finishedFiles(), QStringList({"a.apk"}));
}





/** Starts the InstallCoordinator with the settings prepared by the test. */
class InstallCoordinatorSettingsTest:
	public CoreTest
{
};





TEST_F(InstallCoordinatorSettingsTest, InvalidPollIntervalFallsBackToDefault)
{
	Settings::saveValue("Poll", "IntervalMs", 0);
	auto bridge = mComponents->addNew<FakeBridgeClient>();
	auto coordinator = mComponents->addNew<InstallCoordinator>();
	ASSERT_NO_THROW(mComponents->start());

	EXPECT_EQ(coordinator->state(), InstallCoordinator::csRunning);
	EXPECT_EQ(coordinator->pollIntervalMsec(), InstallCoordinator::DEFAULT_POLL_INTERVAL_MSEC);

	// The first poll is done right away, regardless of the interval:
	EXPECT_TRUE(waitUntil([&coordinator]() { return (coordinator->currentDeviceState().status() == dsConnected); }));
	EXPECT_EQ(coordinator->numSkippedPollTicks(), 0);
	coordinator->shutdown();
	EXPECT_EQ(coordinator->state(), InstallCoordinator::csStopped);
}

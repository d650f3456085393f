#pragma once

#include <functional>
#include <memory>
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QTemporaryDir>
#include <QThread>
#include <gtest/gtest.h>
#include "ComponentCollection.hpp"
#include "MultiLogger.hpp"
#include "Settings.hpp"





/** Processes the Qt events until the predicate returns true or the timeout elapses.
Returns the final value of the predicate. */
inline bool waitUntil(const std::function<bool()> & aPredicate, int aTimeoutMsec = 5000)
{
	QElapsedTimer timer;
	timer.start();
	while (!aPredicate())
	{
		if (timer.elapsed() > aTimeoutMsec)
		{
			return aPredicate();
		}
		QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
		QThread::msleep(1);
	}
	return true;
}





/** Processes the Qt events for the specified time. */
inline void pumpEvents(int aMsec)
{
	QElapsedTimer timer;
	timer.start();
	while (timer.elapsed() < aMsec)
	{
		QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
		QThread::msleep(1);
	}
}





/** The base fixture for the tests needing the app infrastructure.
Provides a temporary folder with the settings file and the logs, and a ComponentCollection containing
a MultiLogger writing into that folder. */
class CoreTest:
	public ::testing::Test
{
protected:

	QTemporaryDir mTempDir;

	/** Declared before mComponents, so that the logs outlive all the other components. */
	std::shared_ptr<MultiLogger> mMultiLogger;

	std::unique_ptr<ComponentCollection> mComponents;


	virtual void SetUp() override
	{
		ASSERT_TRUE(mTempDir.isValid());
		Settings::init(mTempDir.filePath("ApkDrop.ini"));
		mComponents.reset(new ComponentCollection);
		mMultiLogger = mComponents->addNew<MultiLogger>(mTempDir.filePath("logs"));
	}


	virtual void TearDown() override
	{
		mComponents.reset();
	}


	/** Returns the logger of the specified name, writing into the temporary folder. */
	Logger & logger(const QString & aName)
	{
		return mMultiLogger->logger(aName);
	}
};

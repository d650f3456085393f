#include "InstallWorker.hpp"
#include <QElapsedTimer>
#include "InstallQueue.hpp"
#include "../Comm/BridgeClient.hpp"
#include "../Logger.hpp"





InstallWorker::InstallWorker(InstallQueue & aQueue, BridgeClient & aBridge, Logger & aLogger):
	mQueue(aQueue),
	mBridge(aBridge),
	mLogger(aLogger),
	mNumProcessed(0)
{
	setObjectName("InstallWorker");
}





InstallWorker::~InstallWorker()
{
	mQueue.close();
	QThread::wait();
}





void InstallWorker::run()
{
	mLogger.log("Worker started.");
	InstallRequest request;
	while (true)
	{
		if (mQueue.isEmpty())
		{
			Q_EMIT idle();
		}
		if (!mQueue.dequeueBlocking(request))
		{
			break;
		}
		Q_EMIT installStarted(request);
		auto outcome = process(request);
		mNumProcessed += 1;
		Q_EMIT installFinished(outcome);
	}
	mLogger.log("Worker finished, %1 requests processed.", mNumProcessed.load());
}





InstallOutcome InstallWorker::process(const InstallRequest & aRequest)
{
	mLogger.log("Installing %1 onto %2...", aRequest.filePath(), aRequest.targetDeviceID());
	QElapsedTimer elapsed;
	elapsed.start();
	try
	{
		mBridge.install(aRequest.filePath(), aRequest.targetDeviceID());
	}
	catch (const std::exception & exc)
	{
		mLogger.log("Install of %1 failed after %2 msec: %3", aRequest.filePath(), elapsed.elapsed(), exc.what());
		return InstallOutcome::failure(aRequest, QString::fromUtf8(exc.what()));
	}
	catch (...)
	{
		mLogger.log("Install of %1 failed after %2 msec with an unknown error.", aRequest.filePath(), elapsed.elapsed());
		return InstallOutcome::failure(aRequest, tr("The install failed with an unknown error."));
	}
	mLogger.log("Install of %1 succeeded in %2 msec.", aRequest.filePath(), elapsed.elapsed());
	return InstallOutcome::success(aRequest);
}

#pragma once

#include <atomic>
#include <QThread>
#include "InstallRequest.hpp"





// fwd:
class BridgeClient;
class InstallQueue;
class Logger;





/** The single consumer of the InstallQueue.
Runs in its own thread, takes the requests from the queue one by one and installs them through the bridge,
so that there is never more than one install in progress.
Each request produces exactly one InstallOutcome; failures reported by the bridge don't stop the processing
of the remaining requests.
The thread terminates once the queue is closed and drained. */
class InstallWorker:
	public QThread
{
	using Super = QThread;

	Q_OBJECT


public:

	InstallWorker(InstallQueue & aQueue, BridgeClient & aBridge, Logger & aLogger);

	/** Closes the queue and waits for the thread to finish (including the install in progress). */
	virtual ~InstallWorker() override;

	/** Returns the number of requests processed so far (both succeeded and failed). */
	int numProcessed() const { return mNumProcessed.load(); }


protected:

	/** The queue from which the requests are taken. */
	InstallQueue & mQueue;

	/** The bridge used for installing. */
	BridgeClient & mBridge;

	/** The logger used for all messages produced by this class. */
	Logger & mLogger;

	std::atomic<int> mNumProcessed;


	// QThread overrides:
	virtual void run() override;

	/** Installs the single request through the bridge and returns its outcome. Never throws. */
	InstallOutcome process(const InstallRequest & aRequest);


Q_SIGNALS:

	/** Emitted in the worker thread whenever the worker finds the queue empty and is about to wait. */
	void idle();

	/** Emitted in the worker thread just before the bridge is asked to install the request. */
	void installStarted(const InstallRequest & aRequest);

	/** Emitted in the worker thread once the request has been processed. */
	void installFinished(const InstallOutcome & aOutcome);
};

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <QObject>
#include <QMutex>
#include <QStringList>
#include "CoreEvent.hpp"
#include "InstallQueue.hpp"
#include "../ComponentCollection.hpp"





// fwd:
class BridgeClient;
class InstallWorker;
class StatusPoller;





/** The core of the app: owns the status poller, the install queue and the install worker, and merges their
reports into a single ordered stream of CoreEvent values that the UI subscribes to.
The coordinator lives in the thread that created it (the UI thread); the poller and the worker report to it
through queued signals, so the subscribers are always called in the coordinator's (or their context's) thread,
in the order in which the events were produced. */
class InstallCoordinator:
	public QObject,
	public ComponentCollection::Component<ComponentCollection::ckInstallCoordinator>
{
	using Super = QObject;
	using ComponentSuper = ComponentCollection::Component<ComponentCollection::ckInstallCoordinator>;

	Q_OBJECT


public:

	/** The lifecycle state of the coordinator. */
	enum State
	{
		csIdle,          ///< Created, not started yet
		csRunning,       ///< Polling, the worker is waiting for requests
		csInstalling,    ///< Polling, the worker is processing requests
		csShuttingDown,  ///< shutdown() is in progress
		csStopped,       ///< Terminal
	};
	Q_ENUM(State)


	/** The poll interval used when the "Poll/IntervalMs" setting is missing or invalid. */
	static const int DEFAULT_POLL_INTERVAL_MSEC = 2000;


	/** The callback receiving the events. */
	using EventHandler = std::function<void(const CoreEvent &)>;


	explicit InstallCoordinator(ComponentCollection & aComponents);

	virtual ~InstallCoordinator() override;

	// ComponentCollection::Component overrides:

	/** Reads the settings, starts the poller and the worker. */
	virtual void start() override;

	/** Calls shutdown(). */
	virtual void stop() override;

	/** Queues the specified packages for installation onto the specified device, in the specified order.
	The packages are queued as a single batch, so batches enqueued concurrently don't interleave.
	Can be called from any thread; does no device I/O, returns immediately.
	Throws a LogicError if the coordinator is shutting down or stopped. */
	void enqueueInstall(const QStringList & aFilePaths, const QByteArray & aTargetDeviceID);

	/** Registers the handler to receive all future events.
	The handler is called in aContext's thread; the subscription is removed automatically when aContext
	is destroyed.
	Returns the connection that can be used for unsubscribe(). */
	QMetaObject::Connection subscribe(QObject * aContext, EventHandler aHandler);

	/** Removes the subscription previously made by subscribe(). */
	void unsubscribe(const QMetaObject::Connection & aSubscription);

	/** Stops the poller, discards all the requests that haven't been started yet, waits for the install
	in progress to finish and delivers its outcome (and any other pending events) to the subscribers.
	Must be called from the coordinator's thread. Calling it repeatedly is harmless. */
	void shutdown();

	/** Returns the last published device state. */
	DeviceState currentDeviceState() const;

	State state() const { return mState.load(); }

	/** Returns the poll interval in use, valid after start(). */
	int pollIntervalMsec() const { return mPollIntervalMsec; }

	/** Returns the number of poller ticks skipped due to slow polls. */
	int numSkippedPollTicks() const;

	/** Returns the number of requests waiting in the queue (not including the one being installed). */
	size_t numQueued() const { return mQueue.size(); }

	/** Returns the textual representation of the state, used in logs. */
	static QString stateToString(State aState);


protected:

	/** The logger used for all messages produced by this class. */
	Logger & mLogger;

	/** The bridge used by the poller and the worker, kept alive for as long as they may run. */
	std::shared_ptr<BridgeClient> mBridge;

	/** The requests waiting for the worker. */
	InstallQueue mQueue;

	std::unique_ptr<StatusPoller> mPoller;

	/** The worker; declared after mQueue so that it is destroyed before the queue. */
	std::unique_ptr<InstallWorker> mWorker;

	std::atomic<State> mState;

	int mPollIntervalMsec;

	/** The last device state reported by the poller.
	Written only in the coordinator's thread, protected by mMtxDeviceState for the readers in other threads. */
	DeviceState mDeviceState;

	mutable QMutex mMtxDeviceState;


	/** Changes the state and emits stateChanged(), if the state differs. */
	void setState(State aNewState);


protected Q_SLOTS:

	/** Stores the new state and publishes it. */
	void onDeviceStateChanged(const DeviceState & aNewState);

	/** Publishes the start and switches to csInstalling. */
	void onInstallStarted(const InstallRequest & aRequest);

	/** Publishes the outcome. */
	void onInstallFinished(const InstallOutcome & aOutcome);

	/** Switches back to csRunning. */
	void onWorkerIdle();


Q_SIGNALS:

	/** Emitted in the coordinator's thread for each event, in the order the events were produced. */
	void eventOccurred(const CoreEvent & aEvent);

	/** Emitted in the coordinator's thread on each state transition. */
	void stateChanged(InstallCoordinator::State aNewState);
};

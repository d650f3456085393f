#pragma once

#include <deque>
#include <vector>
#include <QMutex>
#include <QWaitCondition>
#include "InstallRequest.hpp"





/** An unbounded, strictly FIFO queue of install requests, shared between the producers (any thread)
and the single consumer (InstallWorker).
Producers never block (other than on the internal mutex). The consumer waits while the queue is empty.
Once closed, the queue accepts no more requests and the consumer is woken up; the remaining requests
are still handed out until the queue is drained. */
class InstallQueue
{
public:

	InstallQueue();

	/** Appends the request to the tail of the queue and wakes up the consumer.
	Throws a LogicError if the queue has been closed. */
	void enqueue(const InstallRequest & aRequest);

	/** Appends all the requests, in their order, to the tail of the queue as a single atomic operation,
	so that batches enqueued concurrently from multiple threads don't interleave.
	Throws a LogicError if the queue has been closed. */
	void enqueue(const std::vector<InstallRequest> & aRequests);

	/** Removes the head of the queue and stores it in aRequest.
	If the queue is empty, waits until a request is enqueued or the queue is closed.
	Returns true if a request was dequeued, false if the queue is closed and drained. */
	bool dequeueBlocking(InstallRequest & aRequest);

	/** Makes the queue terminal: no more requests are accepted, waiting dequeues are woken up.
	Calling close() multiple times is harmless. */
	void close();

	/** Removes all the pending requests and returns them, in their original order. */
	std::vector<InstallRequest> clear();

	/** Closes the queue and removes all the pending requests in a single step, so that no request enqueued
	concurrently can slip in between and reach the consumer. Returns the removed requests, in order. */
	std::vector<InstallRequest> closeAndClear();

	/** Returns the number of requests waiting in the queue. */
	size_t size() const;

	/** Returns true if there are no requests waiting in the queue. */
	bool isEmpty() const { return (size() == 0); }

	/** Returns true if close() has been called. */
	bool isClosed() const;


protected:

	/** Protects all the member variables against multithreaded access. */
	mutable QMutex mMtx;

	/** Signalled whenever a request is added or the queue is closed. */
	QWaitCondition mCondition;

	/** The pending requests, head at the front. */
	std::deque<InstallRequest> mRequests;

	/** Set by close(). */
	bool mIsClosed;
};

#include <atomic>
#include <thread>
#include <vector>
#include <QThread>
#include <gtest/gtest.h>
#include "Core/InstallQueue.hpp"
#include "Exception.hpp"





static InstallRequest req(const QString & aFileName)
{
	return InstallRequest(aFileName, "dev1");
}





TEST(InstallQueueTest, DequeuesInFifoOrder)
{
	InstallQueue queue;
	queue.enqueue(req("a.apk"));
	queue.enqueue({req("b.apk"), req("c.apk")});
	queue.enqueue(req("d.apk"));
	EXPECT_EQ(queue.size(), 4u);

	InstallRequest out;
	QStringList order;
	queue.close();
	while (queue.dequeueBlocking(out))
	{
		order.append(out.filePath());
	}
	EXPECT_EQ(order, QStringList({"a.apk", "b.apk", "c.apk", "d.apk"}));
	EXPECT_TRUE(queue.isEmpty());
}





TEST(InstallQueueTest, BlockingDequeueIsWokenByEnqueue)
{
	InstallQueue queue;
	std::atomic<bool> hasDequeued(false);
	InstallRequest out;
	std::thread consumer([&]()
		{
			if (queue.dequeueBlocking(out))
			{
				hasDequeued = true;
			}
		}
	);

	QThread::msleep(50);
	EXPECT_FALSE(hasDequeued.load());
	queue.enqueue(req("late.apk"));
	consumer.join();
	EXPECT_TRUE(hasDequeued.load());
	EXPECT_EQ(out.filePath(), "late.apk");
}





TEST(InstallQueueTest, CloseWakesTheWaitingConsumer)
{
	InstallQueue queue;
	std::atomic<int> result(-1);
	std::thread consumer([&]()
		{
			InstallRequest out;
			result = queue.dequeueBlocking(out) ? 1 : 0;
		}
	);

	QThread::msleep(50);
	queue.close();
	consumer.join();
	EXPECT_EQ(result.load(), 0);
	EXPECT_TRUE(queue.isClosed());
}





TEST(InstallQueueTest, ClosedQueueIsDrainedBeforeReportingEnd)
{
	InstallQueue queue;
	queue.enqueue({req("a.apk"), req("b.apk")});
	queue.close();

	InstallRequest out;
	ASSERT_TRUE(queue.dequeueBlocking(out));
	EXPECT_EQ(out.filePath(), "a.apk");
	ASSERT_TRUE(queue.dequeueBlocking(out));
	EXPECT_EQ(out.filePath(), "b.apk");
	EXPECT_FALSE(queue.dequeueBlocking(out));
}





TEST(InstallQueueTest, EnqueueAfterCloseThrows)
{
	InstallQueue queue;
	queue.close();
	EXPECT_THROW(queue.enqueue(req("a.apk")), LogicError);
	EXPECT_THROW(queue.enqueue({req("b.apk"), req("c.apk")}), LogicError);
	EXPECT_EQ(queue.size(), 0u);
}





TEST(InstallQueueTest, ClearReturnsThePendingRequests)
{
	InstallQueue queue;
	queue.enqueue({req("a.apk"), req("b.apk"), req("c.apk")});
	auto removed = queue.clear();
	ASSERT_EQ(removed.size(), 3u);
	EXPECT_EQ(removed[0].filePath(), "a.apk");
	EXPECT_EQ(removed[2].filePath(), "c.apk");
	EXPECT_TRUE(queue.isEmpty());
	EXPECT_FALSE(queue.isClosed());
}





TEST(InstallQueueTest, ConcurrentBatchesDontInterleave)
{
	static const int NUM_THREADS = 4;
	static const int BATCH_SIZE = 50;
	InstallQueue queue;
	std::vector<std::thread> producers;
	for (int t = 0; t < NUM_THREADS; ++t)
	{
		producers.emplace_back([&queue, t]()
			{
				std::vector<InstallRequest> batch;
				for (int i = 0; i < BATCH_SIZE; ++i)
				{
					batch.push_back(req(QString("t%1-%2.apk").arg(t).arg(i)));
				}
				queue.enqueue(batch);
			}
		);
	}
	for (auto & thr: producers)
	{
		thr.join();
	}
	queue.close();

	// Each batch must come out as a contiguous run, in its own order:
	InstallRequest out;
	for (int b = 0; b < NUM_THREADS; ++b)
	{
		ASSERT_TRUE(queue.dequeueBlocking(out));
		auto prefix = out.filePath().section('-', 0, 0);
		EXPECT_EQ(out.filePath(), prefix + "-0.apk");
		for (int i = 1; i < BATCH_SIZE; ++i)
		{
			ASSERT_TRUE(queue.dequeueBlocking(out));
			EXPECT_EQ(out.filePath(), QString("%1-%2.apk").arg(prefix).arg(i));
		}
	}
	EXPECT_FALSE(queue.dequeueBlocking(out));
}





TEST(InstallQueueTest, CloseAndClearLeavesNothingForTheConsumer)
{
	static const int NUM_THREADS = 4;
	InstallQueue queue;
	std::atomic<int> numAccepted(0);
	std::vector<std::thread> producers;
	for (int t = 0; t < NUM_THREADS; ++t)
	{
		producers.emplace_back([&queue, &numAccepted, t]()
			{
				for (int i = 0; ; ++i)
				{
					try
					{
						queue.enqueue(req(QString("t%1-%2.apk").arg(t).arg(i)));
					}
					catch (const LogicError &)
					{
						return;
					}
					++numAccepted;
				}
			}
		);
	}
	while (numAccepted.load() < 100)
	{
		QThread::yieldCurrentThread();
	}

	auto removed = queue.closeAndClear();
	for (auto & thr: producers)
	{
		thr.join();
	}

	// Every accepted request was handed back to the caller, none is left for the consumer:
	EXPECT_TRUE(queue.isClosed());
	EXPECT_EQ(static_cast<int>(removed.size()), numAccepted.load());
	InstallRequest out;
	EXPECT_FALSE(queue.dequeueBlocking(out));
}

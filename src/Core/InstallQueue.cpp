#include "InstallQueue.hpp"
#include "../Exception.hpp"





InstallQueue::InstallQueue():
	mIsClosed(false)
{
}





void InstallQueue::enqueue(const InstallRequest & aRequest)
{
	{
		QMutexLocker lock(&mMtx);
		if (mIsClosed)
		{
			throw LogicError("Cannot enqueue %1, the install queue is already closed.", aRequest);
		}
		mRequests.push_back(aRequest);
	}
	mCondition.wakeAll();
}





void InstallQueue::enqueue(const std::vector<InstallRequest> & aRequests)
{
	{
		QMutexLocker lock(&mMtx);
		if (mIsClosed)
		{
			throw LogicError("Cannot enqueue %1 requests, the install queue is already closed.", aRequests.size());
		}
		mRequests.insert(mRequests.end(), aRequests.begin(), aRequests.end());
	}
	mCondition.wakeAll();
}





bool InstallQueue::dequeueBlocking(InstallRequest & aRequest)
{
	QMutexLocker lock(&mMtx);
	while (mRequests.empty())
	{
		if (mIsClosed)
		{
			return false;
		}
		mCondition.wait(&mMtx);
	}
	aRequest = mRequests.front();
	mRequests.pop_front();
	return true;
}





void InstallQueue::close()
{
	{
		QMutexLocker lock(&mMtx);
		mIsClosed = true;
	}
	mCondition.wakeAll();
}





std::vector<InstallRequest> InstallQueue::clear()
{
	QMutexLocker lock(&mMtx);
	std::vector<InstallRequest> res(mRequests.begin(), mRequests.end());
	mRequests.clear();
	return res;
}





std::vector<InstallRequest> InstallQueue::closeAndClear()
{
	std::vector<InstallRequest> res;
	{
		QMutexLocker lock(&mMtx);
		mIsClosed = true;
		res.assign(mRequests.begin(), mRequests.end());
		mRequests.clear();
	}
	mCondition.wakeAll();
	return res;
}





size_t InstallQueue::size() const
{
	QMutexLocker lock(&mMtx);
	return mRequests.size();
}





bool InstallQueue::isClosed() const
{
	QMutexLocker lock(&mMtx);
	return mIsClosed;
}

#include "MultiLogger.hpp"

#include <QDir>
#include "Settings.hpp"





MultiLogger::MultiLogger(ComponentCollection & aComponents, const QString & aLogsFolder):
	Super(aComponents),
	mLogsFolder(aLogsFolder),
	mMaxFileSize(Settings::loadValue("Logs", "MaxFileSizeKiB", DEFAULT_MAX_FILE_SIZE_KIB).toLongLong() * 1024),
	mFlushIntervalMsec(Settings::loadValue("Logs", "FlushIntervalMs", DEFAULT_FLUSH_INTERVAL_MSEC).toInt())
{
	if (mFlushIntervalMsec <= 0)
	{
		mFlushIntervalMsec = DEFAULT_FLUSH_INTERVAL_MSEC;
	}
	if (!QDir().mkpath(aLogsFolder))
	{
		qWarning() << "Cannot create the logs folder " << aLogsFolder;
	}
	QObject::connect(&mFlushTimer, &QTimer::timeout, &mFlushTimer,
		[this]()
		{
			flushAllLogs();
		}
	);
}





void MultiLogger::start()
{
	mainLogger().log("Logging started, flush interval %1 msec, size cap %2 bytes", mFlushIntervalMsec, mMaxFileSize);
	mFlushTimer.start(mFlushIntervalMsec);
}





void MultiLogger::stop()
{
	mFlushTimer.stop();
	mainLogger().log("Logging stopped");
	flushAllLogs();
}





Logger & MultiLogger::logger(const QString & aLoggerName)
{
	QMutexLocker lock(&mMtxLoggers);
	auto & slot = mLoggers[aLoggerName];
	if (slot == nullptr)
	{
		auto fileName = QDir(mLogsFolder).filePath(sanitizedFileName(aLoggerName) + ".log");
		slot.reset(new Logger(fileName, mMaxFileSize));
	}
	return *slot;
}





void MultiLogger::flushAllLogs()
{
	QMutexLocker lock(&mMtxLoggers);
	for (const auto & entry: mLoggers)
	{
		if (entry.second != nullptr)
		{
			entry.second->flush();
		}
	}
}





QStringList MultiLogger::loggerNames()
{
	QStringList res;
	QMutexLocker lock(&mMtxLoggers);
	for (const auto & entry: mLoggers)
	{
		res.append(entry.first);
	}
	return res;
}





QString MultiLogger::sanitizedFileName(const QString & aLoggerName)
{
	static const QString forbidden("/\\\"':;&%*?|<>");
	QString res;
	res.reserve(aLoggerName.size());
	for (const auto ch: aLoggerName)
	{
		res.append(((ch.unicode() < 32) || forbidden.contains(ch)) ? QChar('_') : ch);
	}
	return res;
}

#pragma once

#include <map>
#include <memory>
#include <QMutex>
#include <QStringList>
#include <QTimer>

#include "ComponentCollection.hpp"
#include "Logger.hpp"





/** The component that hands out a separate Logger to each subsystem of the app.
The StatusPoller, InstallWorker, bridge client and the coordinator each write into "<LogsFolder>/<name>.log".
Once started, the component flushes all its logs periodically; the period and the log size cap are
read from the "Logs" section of the settings when the component is constructed. */
class MultiLogger:
	public ComponentCollection::Component<ComponentCollection::ckMultiLogger>
{
	using Super = ComponentCollection::Component<ComponentCollection::ckMultiLogger>;


public:

	/** Default for the "Logs/FlushIntervalMs" setting. */
	static const int DEFAULT_FLUSH_INTERVAL_MSEC = 1000;

	/** Default for the "Logs/MaxFileSizeKiB" setting. */
	static const int DEFAULT_MAX_FILE_SIZE_KIB = 2048;


	/** Creates the component, logs go into aLogsFolder (created if needed). */
	MultiLogger(ComponentCollection & aComponents, const QString & aLogsFolder);

	// ComponentCollection::Component overrides:
	virtual void start() override;
	virtual void stop() override;

	/** Returns the logger used for the app-wide messages. */
	Logger & mainLogger() { return logger("main"); }

	/** Returns the logger for the specified subsystem, creating it (and its file) on first use.
	The returned reference stays valid for the lifetime of this object. */
	Logger & logger(const QString & aLoggerName);

	/** Pushes the buffered data of all the loggers into their files. */
	void flushAllLogs();

	const QString & logsFolder() const { return mLogsFolder; }

	/** Returns the names of all the loggers created so far, sorted. */
	QStringList loggerNames();

	/** Replaces the chars that are not allowed in file names (and control chars) with underscores. */
	static QString sanitizedFileName(const QString & aLoggerName);


protected:

	QString mLogsFolder;

	/** Log files larger than this are moved aside when opened. In bytes, 0 means unlimited. */
	qint64 mMaxFileSize;

	int mFlushIntervalMsec;

	/** Protects mLoggers. */
	QMutex mMtxLoggers;

	/** Logger name -> logger. Only ever grows. */
	std::map<QString, std::unique_ptr<Logger>> mLoggers;

	QTimer mFlushTimer;
};

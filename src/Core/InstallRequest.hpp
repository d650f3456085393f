#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QDebug>
#include <QMetaType>
#include <QString>





/** A single package queued for installation.
An immutable value, created when the package is enqueued, never re-enqueued. */
class InstallRequest
{
public:

	/** Creates an empty request (needed for the Qt metatype system). */
	InstallRequest() = default;

	/** Creates a new request, stamped with the current time. */
	InstallRequest(const QString & aFilePath, const QByteArray & aTargetDeviceID);

	/** Creates a new request with an explicit timestamp. */
	InstallRequest(const QString & aFilePath, const QByteArray & aTargetDeviceID, const QDateTime & aEnqueuedAt);

	// Simple getters:
	const QString & filePath() const { return mFilePath; }
	const QByteArray & targetDeviceID() const { return mTargetDeviceID; }
	const QDateTime & enqueuedAt() const { return mEnqueuedAt; }

	/** Returns just the filename part of the package path, used for the UI. */
	QString fileName() const;


protected:

	/** The full path to the package file. */
	QString mFilePath;

	/** The ID of the device onto which the package should be installed.
	Empty means the bridge's default device. */
	QByteArray mTargetDeviceID;

	/** The time when the request was created (UTC). */
	QDateTime mEnqueuedAt;
};





/** The terminal result of processing a single InstallRequest. */
class InstallOutcome
{
public:

	/** Creates an empty outcome (needed for the Qt metatype system). */
	InstallOutcome();

	InstallOutcome(const InstallRequest & aRequest, bool aSucceeded, const QString & aMessage);

	/** Creates a successful outcome for the specified request. */
	static InstallOutcome success(const InstallRequest & aRequest);

	/** Creates a failed outcome for the specified request, carrying the failure reason. */
	static InstallOutcome failure(const InstallRequest & aRequest, const QString & aReason);

	// Simple getters:
	const InstallRequest & request() const { return mRequest; }
	bool succeeded() const { return mSucceeded; }
	const QString & message() const { return mMessage; }
	const QDateTime & finishedAt() const { return mFinishedAt; }


protected:

	InstallRequest mRequest;

	bool mSucceeded;

	/** Human-readable description of the result. For failures, the reason reported by the bridge. */
	QString mMessage;

	/** The time when the processing finished (UTC). */
	QDateTime mFinishedAt;
};





QDebug operator << (QDebug aDebug, const InstallRequest & aRequest);
QDebug operator << (QDebug aDebug, const InstallOutcome & aOutcome);

Q_DECLARE_METATYPE(InstallRequest);
Q_DECLARE_METATYPE(InstallOutcome);

#include "InstallRequest.hpp"
#include <QCoreApplication>
#include <QFileInfo>





////////////////////////////////////////////////////////////////////////////////
// InstallRequest:

InstallRequest::InstallRequest(const QString & aFilePath, const QByteArray & aTargetDeviceID):
	mFilePath(aFilePath),
	mTargetDeviceID(aTargetDeviceID),
	mEnqueuedAt(QDateTime::currentDateTimeUtc())
{
}





InstallRequest::InstallRequest(const QString & aFilePath, const QByteArray & aTargetDeviceID, const QDateTime & aEnqueuedAt):
	mFilePath(aFilePath),
	mTargetDeviceID(aTargetDeviceID),
	mEnqueuedAt(aEnqueuedAt)
{
}





QString InstallRequest::fileName() const
{
	return QFileInfo(mFilePath).fileName();
}





////////////////////////////////////////////////////////////////////////////////
// InstallOutcome:

InstallOutcome::InstallOutcome():
	mSucceeded(false)
{
}





InstallOutcome::InstallOutcome(const InstallRequest & aRequest, bool aSucceeded, const QString & aMessage):
	mRequest(aRequest),
	mSucceeded(aSucceeded),
	mMessage(aMessage),
	mFinishedAt(QDateTime::currentDateTimeUtc())
{
}





InstallOutcome InstallOutcome::success(const InstallRequest & aRequest)
{
	return InstallOutcome(aRequest, true, QCoreApplication::translate("InstallOutcome", "Package installed successfully."));
}





InstallOutcome InstallOutcome::failure(const InstallRequest & aRequest, const QString & aReason)
{
	return InstallOutcome(aRequest, false, aReason);
}





////////////////////////////////////////////////////////////////////////////////
// Globals:

QDebug operator << (QDebug aDebug, const InstallRequest & aRequest)
{
	QDebugStateSaver saver(aDebug);
	aDebug.nospace().noquote() << aRequest.filePath();
	if (!aRequest.targetDeviceID().isEmpty())
	{
		aDebug << " -> " << QString::fromUtf8(aRequest.targetDeviceID());
	}
	return aDebug;
}





QDebug operator << (QDebug aDebug, const InstallOutcome & aOutcome)
{
	QDebugStateSaver saver(aDebug);
	aDebug.nospace().noquote()
		<< aOutcome.request()
		<< (aOutcome.succeeded() ? ": succeeded" : ": failed: ")
		<< (aOutcome.succeeded() ? QString() : aOutcome.message());
	return aDebug;
}

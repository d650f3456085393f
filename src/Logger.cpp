#include "Logger.hpp"
#include <stdexcept>
#include <QDateTime>
#include <QFileInfo>
#include <QThread>





Logger::Logger(const QString & aFileName, qint64 aMaxFileSize):
	mFile(aFileName),
	mNumLinesWritten(0),
	mLinesUntilFlush(FLUSH_EVERY_N_LINES)
{
	rotateIfTooLarge(aFileName, aMaxFileSize);
	if (!mFile.open(QFile::WriteOnly | QFile::Append))
	{
		throw std::runtime_error(
			QString("Cannot open log file %1: %2").arg(aFileName, mFile.errorString()).toStdString()
		);
	}
	mFile.write("\n");
	mFile.write(timestamp().toUtf8());
	mFile.write("\t--- log opened ---\n");
}





void Logger::flush()
{
	QMutexLocker lock(&mMtx);
	mFile.flush();
	mLinesUntilFlush = FLUSH_EVERY_N_LINES;
}





int Logger::numLinesWritten() const
{
	QMutexLocker lock(&mMtx);
	return mNumLinesWritten;
}





QString Logger::timestamp()
{
	return QDateTime::currentDateTimeUtc().toString("yyyy-MM-dd hh:mm:ss.zzz");
}





void Logger::rotateIfTooLarge(const QString & aFileName, qint64 aMaxFileSize)
{
	if (aMaxFileSize <= 0)
	{
		return;
	}
	QFileInfo fi(aFileName);
	if (!fi.exists() || (fi.size() <= aMaxFileSize))
	{
		return;
	}
	auto oldName = aFileName + ".old";
	QFile::remove(oldName);
	if (!QFile::rename(aFileName, oldName))
	{
		qWarning() << "Cannot move the oversized log file aside: " << aFileName;
	}
}





void Logger::writeLine(const QByteArray & aText)
{
	QByteArray line;
	line.reserve(aText.size() + 48);
	line.append(timestamp().toUtf8());
	line.append("\t[");
	line.append(QByteArray::number(reinterpret_cast<quintptr>(QThread::currentThreadId()), 16));
	line.append("]\t");
	line.append(aText);
	line.append('\n');

	QMutexLocker lock(&mMtx);
	mFile.write(line);
	mNumLinesWritten += 1;
	if (--mLinesUntilFlush <= 0)
	{
		mFile.flush();
		mLinesUntilFlush = FLUSH_EVERY_N_LINES;
	}
}

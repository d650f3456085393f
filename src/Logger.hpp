#pragma once

#include <QString>
#include <QByteArray>
#include <QMutex>
#include <QFile>
#include "StringFormatter.hpp"





/** Writes timestamped lines into a single log file; safe to use from any thread.
Each line is prefixed with the UTC timestamp and the ID of the thread that wrote it.
Loggers are normally created and owned by the MultiLogger component, one per subsystem. */
class Logger
{
public:

	/** Opens the file for appending.
	If aMaxFileSize is positive and the file is already larger, it is first moved aside to "<name>.old"
	(replacing the previous one), so that the logs of a long-used install don't grow without limits.
	Throws a std::runtime_error if the file cannot be opened. */
	explicit Logger(const QString & aFileName, qint64 aMaxFileSize = 0);

	/** Formats the message (%1 .. %99 placeholders, args stringified by QDebug) and writes it as a single line. */
	template <size_t N, typename... T>
	void log(const char (&aFormatString)[N], const T &... aArgs)
	{
		log(QString::fromUtf8(aFormatString, N - 1), aArgs...);
	}

	/** Formats the message (%1 .. %99 placeholders, args stringified by QDebug) and writes it as a single line. */
	template <typename... T>
	void log(const QString & aFormatString, const T &... aArgs)
	{
		writeLine(StringFormatter::format(aFormatString, aArgs...).toUtf8());
	}

	/** Pushes the buffered lines into the file. */
	void flush();

	/** Returns the full path of the log file. */
	QString fileName() const { return mFile.fileName(); }

	/** Returns the number of lines logged since the file was opened. */
	int numLinesWritten() const;


protected:

	/** The file is flushed after this many lines, even if nobody calls flush(). */
	static const int FLUSH_EVERY_N_LINES = 4;


	QFile mFile;

	/** Serializes the writes from multiple threads. */
	mutable QMutex mMtx;

	int mNumLinesWritten;

	/** Counts down to the next forced flush. */
	int mLinesUntilFlush;


	/** Returns the timestamp used as the line prefix. */
	static QString timestamp();

	/** If the file exceeds the size limit, renames it to "<name>.old". */
	static void rotateIfTooLarge(const QString & aFileName, qint64 aMaxFileSize);

	/** Writes a single line (timestamp, thread ID, text). */
	void writeLine(const QByteArray & aText);
};

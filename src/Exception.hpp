#pragma once

#include <exception>

#include <QByteArray>
#include <QString>

#include "Logger.hpp"





/** The root of the app's exception hierarchy.
The message is built from a format string with %1 .. %99 placeholders, the args are stringified via QDebug
(see StringFormatter). The variant taking a Logger also writes the message into that log before throwing:
	throw InstallRejectedError(mLogger, "Failed to install %1: %2", fileName, output);
*/
class Exception:
	public std::exception
{
public:

	template <typename... ArgTypes>
	Exception(Logger & aLogger, const QString & aFormatString, const ArgTypes &... aArgs):
		mMessage(StringFormatter::format(aFormatString, aArgs...)),
		mWhat(mMessage.toUtf8())
	{
		aLogger.log(mMessage);
	}

	template <typename... ArgTypes>
	Exception(const QString & aFormatString, const ArgTypes &... aArgs):
		mMessage(StringFormatter::format(aFormatString, aArgs...)),
		mWhat(mMessage.toUtf8())
	{
	}

	/** Returns the formatted message. */
	const QString & message() const { return mMessage; }

	// std::exception override:
	virtual const char * what() const noexcept override
	{
		return mWhat.constData();
	}


protected:

	QString mMessage;

	/** mMessage in UTF-8, kept alive for what(). */
	QByteArray mWhat;
};





/** An error caused by the environment: a device, the bridge, a file. */
class RuntimeError: public Exception
{
public:
	using Exception::Exception;
};





/** An error that can only be caused by a bug in the app (API misuse). */
class LogicError: public Exception
{
public:
	using Exception::Exception;
};





/** The bridge (ADB executable or the ADB server) cannot be reached,
or it didn't respond within the allotted time. */
class BridgeUnavailableError: public RuntimeError
{
public:
	using RuntimeError::RuntimeError;
};





/** The device is present, but the debugging hasn't been authorized on it. */
class DeviceUnauthorizedError: public RuntimeError
{
public:
	using RuntimeError::RuntimeError;
};





/** The bridge ran the installation, but reported a failure. */
class InstallRejectedError: public RuntimeError
{
public:
	using RuntimeError::RuntimeError;
};





/** The file offered for installation is not an installable package.
Raised by the caller-side validation, never reaches the install queue. */
class InvalidPackageError: public RuntimeError
{
public:
	using RuntimeError::RuntimeError;
};

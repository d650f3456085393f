#pragma once

#include <string>
#include <QString>
#include <QStringList>
#include <QDebug>





/** Outputs a std::string (assumed UTF-8) to QDebug, so that std::exception::what() texts can be formatted. */
inline QDebug operator << (QDebug aDebug, const std::string & aStr)
{
	return (aDebug << QString::fromStdString(aStr));
}





/** Formatting of messages with QString::arg()-style placeholders (%1 .. %99).
Unlike QString::arg(), any type that has a QDebug output operator can be used as an arg
(device IDs, install outcomes, enum values, ...). */
namespace StringFormatter
{





/** QDebug writing into a string, without the automatic spaces and quotes. */
class Debug:
	public QDebug
{
	using Super = QDebug;


public:

	Debug(QString * aOutput):
		Super(aOutput)
	{
		nospace();
		noquote();
	}
};





/** Replaces the %N placeholders in aFormatString with the respective item from aArgs (%1 is aArgs[0]).
Placeholders referring to a nonexistent arg are left untouched.
The replacement is done in a single pass, so placeholders inside the args are never expanded. */
inline QString substitute(const QString & aFormatString, const QStringList & aArgs)
{
	QString res;
	res.reserve(aFormatString.size());
	const auto len = aFormatString.size();
	for (int i = 0; i < len; ++i)
	{
		auto ch = aFormatString[i];
		if ((ch != '%') || (i + 1 >= len) || !aFormatString[i + 1].isDigit())
		{
			res.append(ch);
			continue;
		}

		// Parse up to two digits of the placeholder number:
		int num = aFormatString[i + 1].digitValue();
		int numDigits = 1;
		if ((i + 2 < len) && aFormatString[i + 2].isDigit())
		{
			num = num * 10 + aFormatString[i + 2].digitValue();
			numDigits = 2;
		}
		if ((num < 1) || (num > aArgs.size()))
		{
			res.append(aFormatString.midRef(i, numDigits + 1));
		}
		else
		{
			res.append(aArgs[num - 1]);
		}
		i += numDigits;
	}
	return res;
}





/** Terminates the recursion in stringifyArgs(). */
inline void stringifyArgs(QStringList & aOutput)
{
	Q_UNUSED(aOutput);
}





/** Stringifies each of the args through QDebug and appends them to aOutput. */
template <typename FirstArg, typename... OtherArgs>
inline void stringifyArgs(QStringList & aOutput, const FirstArg & aFirst, const OtherArgs &... aOthers)
{
	QString str;
	Debug(&str) << aFirst;
	aOutput.append(str);
	stringifyArgs(aOutput, aOthers...);
}





/** Returns the format string formatted with the specified arguments. */
template <typename... ArgTypes>
inline QString format(const QString & aFormatString, const ArgTypes &... aArgs)
{
	QStringList args;
	args.reserve(static_cast<int>(sizeof...(aArgs)));
	stringifyArgs(args, aArgs...);
	return substitute(aFormatString, args);
}





}  // namespace StringFormatter

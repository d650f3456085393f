#include "PackageValidator.hpp"
#include <QFileInfo>
#include "Exception.hpp"





namespace PackageValidator
{





void validate(const QString & aFilePath)
{
	QFileInfo fi(aFilePath);
	if (!fi.exists())
	{
		throw InvalidPackageError("The file doesn't exist: %1", aFilePath);
	}
	if (!fi.isFile())
	{
		throw InvalidPackageError("Not a file: %1", aFilePath);
	}
	if (fi.suffix().compare("apk", Qt::CaseInsensitive) != 0)
	{
		throw InvalidPackageError("Not an APK file: %1", fi.fileName());
	}
}





SplitFiles splitDroppedFiles(const QStringList & aFilePaths)
{
	SplitFiles res;
	for (const auto & fileName: aFilePaths)
	{
		try
		{
			validate(fileName);
		}
		catch (const InvalidPackageError & exc)
		{
			res.mRejected.append(fileName);
			res.mRejectionReasons.append(exc.message());
			continue;
		}
		res.mValid.append(fileName);
	}
	return res;
}





}  // namespace PackageValidator

#pragma once

#include <QString>
#include <QStringList>





/** The checks done on the files offered for installation, before they are handed to the install engine. */
namespace PackageValidator
{





/** The dropped files, split into the installable packages and the rejected files. */
struct SplitFiles
{
	/** The installable packages, in the original order. */
	QStringList mValid;

	/** The files that are not installable packages, in the original order. */
	QStringList mRejected;

	/** The reason for rejecting each file, parallel to mRejected. */
	QStringList mRejectionReasons;
};





/** Checks that the file exists, is a regular file and has the ".apk" extension (case-insensitive).
Throws an InvalidPackageError describing the problem otherwise. */
void validate(const QString & aFilePath);

/** Splits the dropped files into the valid packages and the rejected files, keeping their order.
The rejection reason is the message of the InvalidPackageError raised by validate(). */
SplitFiles splitDroppedFiles(const QStringList & aFilePaths);





}  // namespace PackageValidator

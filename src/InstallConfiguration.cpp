#include "InstallConfiguration.hpp"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include "Settings.hpp"





InstallConfiguration::InstallConfiguration(ComponentCollection & aComponents):
	Super(aComponents),
	mIsPortable(false)
{
	auto exePath = QCoreApplication::applicationDirPath();
	if (QFileInfo::exists(exePath + "/ApkDrop.ini"))
	{
		mIsPortable = true;
		mDataPath = exePath;
	}
	else
	{
		mDataPath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
	}
	if (!mDataPath.endsWith('/'))
	{
		mDataPath.append('/');
	}
	QDir().mkpath(mDataPath);
	mLogsFolder = mDataPath + "logs";
}





QString InstallConfiguration::dataLocation(const QString & aFileName) const
{
	return mDataPath + aFileName;
}





void InstallConfiguration::loadFromSettings()
{
	auto logsFolder = Settings::loadValue("main", "LogsFolder").toString();
	if (!logsFolder.isEmpty())
	{
		mLogsFolder = QDir(mDataPath).absoluteFilePath(logsFolder);
	}
}

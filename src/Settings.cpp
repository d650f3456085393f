#include "Settings.hpp"
#include <QWidget>





std::unique_ptr<QSettings> Settings::mSettings;
QMutex Settings::mMtx;





void Settings::init(const QString & aIniFileName)
{
	QMutexLocker lock(&mMtx);
	mSettings.reset(new QSettings(aIniFileName, QSettings::IniFormat));
}





QVariant Settings::loadValue(const QString & aSection, const QString & aKey, const QVariant & aDefault)
{
	QMutexLocker lock(&mMtx);
	if (mSettings == nullptr)
	{
		return aDefault;
	}
	return mSettings->value(aSection + "/" + aKey, aDefault);
}





void Settings::saveValue(const QString & aSection, const QString & aKey, const QVariant & aValue)
{
	QMutexLocker lock(&mMtx);
	if (mSettings == nullptr)
	{
		return;
	}
	mSettings->setValue(aSection + "/" + aKey, aValue);
}





void Settings::loadWindowPos(const QString & aWindowName, QWidget & aWindow)
{
	auto geometry = loadValue("WindowPos", aWindowName).toByteArray();
	if (!geometry.isEmpty())
	{
		aWindow.restoreGeometry(geometry);
	}
}





void Settings::saveWindowPos(const QString & aWindowName, const QWidget & aWindow)
{
	saveValue("WindowPos", aWindowName, aWindow.saveGeometry());
}





void Settings::sync()
{
	QMutexLocker lock(&mMtx);
	if (mSettings != nullptr)
	{
		mSettings->sync();
	}
}

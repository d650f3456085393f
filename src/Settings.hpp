#pragma once

#include <memory>
#include <QMutex>
#include <QSettings>
#include <QVariant>





// fwd:
class QWidget;





/** Provides app-wide access to the persisted settings, stored in an INI file.
The settings are organized into sections, each containing key-value pairs.
Until init() is called, loadValue() returns the defaults and saveValue() is ignored.
All the functions are thread-safe. */
class Settings
{
public:

	/** Initializes the settings to use the specified INI file. */
	static void init(const QString & aIniFileName);

	/** Returns the value stored under the specified section and key.
	If there's no such value stored (or the settings are not initialized), returns aDefault. */
	static QVariant loadValue(const QString & aSection, const QString & aKey, const QVariant & aDefault = QVariant());

	/** Stores the specified value under the specified section and key.
	Ignored if the settings are not initialized. */
	static void saveValue(const QString & aSection, const QString & aKey, const QVariant & aValue);

	/** Restores the window geometry saved by saveWindowPos() under the specified name.
	If nothing has been saved yet, the window is left untouched. */
	static void loadWindowPos(const QString & aWindowName, QWidget & aWindow);

	/** Saves the window geometry under the specified name. */
	static void saveWindowPos(const QString & aWindowName, const QWidget & aWindow);

	/** Writes all the pending changes to the INI file. */
	static void sync();


protected:

	/** The underlying Qt settings storage. nullptr until init() is called. */
	static std::unique_ptr<QSettings> mSettings;

	/** Protects mSettings against multithreaded access. */
	static QMutex mMtx;
};

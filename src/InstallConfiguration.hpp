#pragma once

#include <QString>
#include "ComponentCollection.hpp"





/** Provides the locations where the app stores its data (settings, logs).
If the ApkDrop.ini file is present in the executable's folder, the app runs in the portable mode and
stores all of its data next to the executable. Otherwise the per-user app-data location is used. */
class InstallConfiguration:
	public ComponentCollection::Component<ComponentCollection::ckInstallConfiguration>
{
	using Super = ComponentCollection::Component<ComponentCollection::ckInstallConfiguration>;


public:

	/** Detects the data location, based on the presence of the portable-mode INI file. */
	explicit InstallConfiguration(ComponentCollection & aComponents);

	// ComponentCollection::Component overrides:
	virtual void start() override {}

	/** Returns the full path to the specified file in the data location. */
	QString dataLocation(const QString & aFileName) const;

	/** Returns the folder where the log files should be stored. */
	const QString & logsFolder() const { return mLogsFolder; }

	/** Returns true if the app runs in the portable mode. */
	bool isPortable() const { return mIsPortable; }

	/** Reads the overrides from the Settings (main/LogsFolder).
	Must be called after the Settings have been initialized. */
	void loadFromSettings();


protected:

	/** True if the data is stored next to the executable. */
	bool mIsPortable;

	/** The folder where the data (INI file) is stored, always ending with a slash. */
	QString mDataPath;

	/** The folder where the log files should be stored. */
	QString mLogsFolder;
};

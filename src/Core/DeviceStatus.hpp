#pragma once

#include <QByteArray>
#include <QDebug>
#include <QMetaType>
#include <QString>





/** The connectivity of the install target, as classified from a single device-list poll. */
enum DeviceStatus
{
	dsAbsent,        ///< No device is attached
	dsConnected,     ///< A device is attached and ready for installing
	dsUnauthorized,  ///< A device is attached, but debugging is not authorized on it (or it is offline)
	dsBridgeError,   ///< The device list couldn't be queried from the bridge
};





/** The published device state: the status and the device it was classified from.
An immutable value, a new one is produced on each poll. */
class DeviceState
{
public:

	/** Creates a state representing no device (dsAbsent). */
	DeviceState();

	DeviceState(DeviceStatus aStatus, const QByteArray & aDeviceID, const QString & aDeviceName = QString());

	// Simple getters:
	DeviceStatus status() const { return mStatus; }
	const QByteArray & deviceID() const { return mDeviceID; }
	const QString & deviceName() const { return mDeviceName; }

	/** Returns the name to show to the user: the friendly name, if known, or the device ID. */
	QString displayName() const;

	/** Returns a copy of this state with the friendly name replaced. */
	DeviceState withDeviceName(const QString & aDeviceName) const;

	/** Returns true if the two states represent the same classification (status and device ID).
	The friendly name is not considered, it is only a decoration. */
	bool isSameAs(const DeviceState & aOther) const;


protected:

	DeviceStatus mStatus;

	/** The ID of the device that was selected for installing, empty for dsAbsent and dsBridgeError. */
	QByteArray mDeviceID;

	/** The human-readable name of the device (brand + model), empty if not known. */
	QString mDeviceName;
};





/** Returns the textual representation of the status, used in logs. */
QString deviceStatusToString(DeviceStatus aStatus);

QDebug operator << (QDebug aDebug, DeviceStatus aStatus);
QDebug operator << (QDebug aDebug, const DeviceState & aState);

Q_DECLARE_METATYPE(DeviceStatus);
Q_DECLARE_METATYPE(DeviceState);

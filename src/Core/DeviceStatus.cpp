#include "DeviceStatus.hpp"





////////////////////////////////////////////////////////////////////////////////
// DeviceState:

DeviceState::DeviceState():
	mStatus(dsAbsent)
{
}





DeviceState::DeviceState(DeviceStatus aStatus, const QByteArray & aDeviceID, const QString & aDeviceName):
	mStatus(aStatus),
	mDeviceID(aDeviceID),
	mDeviceName(aDeviceName)
{
}





QString DeviceState::displayName() const
{
	if (!mDeviceName.isEmpty())
	{
		return mDeviceName;
	}
	return QString::fromUtf8(mDeviceID);
}





DeviceState DeviceState::withDeviceName(const QString & aDeviceName) const
{
	return DeviceState(mStatus, mDeviceID, aDeviceName);
}





bool DeviceState::isSameAs(const DeviceState & aOther) const
{
	return (
		(mStatus == aOther.mStatus) &&
		(mDeviceID == aOther.mDeviceID)
	);
}





////////////////////////////////////////////////////////////////////////////////
// Globals:

QString deviceStatusToString(DeviceStatus aStatus)
{
	switch (aStatus)
	{
		case dsAbsent:       return QStringLiteral("Absent");
		case dsConnected:    return QStringLiteral("Connected");
		case dsUnauthorized: return QStringLiteral("Unauthorized");
		case dsBridgeError:  return QStringLiteral("BridgeError");
	}
	return QString("<unknown DeviceStatus %1>").arg(static_cast<int>(aStatus));
}





QDebug operator << (QDebug aDebug, DeviceStatus aStatus)
{
	QDebugStateSaver saver(aDebug);
	aDebug.nospace().noquote() << deviceStatusToString(aStatus);
	return aDebug;
}





QDebug operator << (QDebug aDebug, const DeviceState & aState)
{
	QDebugStateSaver saver(aDebug);
	aDebug.nospace().noquote() << deviceStatusToString(aState.status());
	if (!aState.deviceID().isEmpty())
	{
		aDebug << " (" << QString::fromUtf8(aState.deviceID());
		if (!aState.deviceName().isEmpty())
		{
			aDebug << ", " << aState.deviceName();
		}
		aDebug << ")";
	}
	return aDebug;
}

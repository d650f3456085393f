#include "CoreEvent.hpp"





CoreEvent::CoreEvent():
	mKind(ekDeviceStateChanged)
{
}





CoreEvent CoreEvent::deviceStateChanged(const DeviceState & aState)
{
	CoreEvent res;
	res.mKind = ekDeviceStateChanged;
	res.mDeviceState = aState;
	return res;
}





CoreEvent CoreEvent::installStarted(const InstallRequest & aRequest)
{
	CoreEvent res;
	res.mKind = ekInstallStarted;
	res.mOutcome = InstallOutcome(aRequest, false, QString());
	return res;
}





CoreEvent CoreEvent::installFinished(const InstallOutcome & aOutcome)
{
	CoreEvent res;
	res.mKind = ekInstallFinished;
	res.mOutcome = aOutcome;
	return res;
}





QDebug operator << (QDebug aDebug, const CoreEvent & aEvent)
{
	QDebugStateSaver saver(aDebug);
	aDebug.nospace().noquote();
	switch (aEvent.kind())
	{
		case CoreEvent::ekDeviceStateChanged: aDebug << "DeviceStateChanged: " << aEvent.deviceState(); break;
		case CoreEvent::ekInstallStarted:     aDebug << "InstallStarted: "     << aEvent.request();     break;
		case CoreEvent::ekInstallFinished:    aDebug << "InstallFinished: "    << aEvent.outcome();     break;
	}
	return aDebug;
}

#pragma once

#include "DeviceStatus.hpp"
#include "InstallRequest.hpp"





/** A single item of the event stream that InstallCoordinator publishes to its subscribers.
Either a device state change, or a progress report about a single install request. */
class CoreEvent
{
public:

	enum Kind
	{
		ekDeviceStateChanged,  ///< The polled device state has changed, deviceState() is valid
		ekInstallStarted,      ///< The worker has started installing a request, request() is valid
		ekInstallFinished,     ///< The worker has finished a request, outcome() (and request()) is valid
	};


	/** Creates an empty event (needed for the Qt metatype system). */
	CoreEvent();

	static CoreEvent deviceStateChanged(const DeviceState & aState);
	static CoreEvent installStarted(const InstallRequest & aRequest);
	static CoreEvent installFinished(const InstallOutcome & aOutcome);

	// Simple getters:
	Kind kind() const { return mKind; }
	const DeviceState & deviceState() const { return mDeviceState; }
	const InstallOutcome & outcome() const { return mOutcome; }
	const InstallRequest & request() const { return mOutcome.request(); }


protected:

	Kind mKind;

	/** The new device state, for ekDeviceStateChanged. */
	DeviceState mDeviceState;

	/** The outcome, for ekInstallFinished.
	For ekInstallStarted, only the request part is valid. */
	InstallOutcome mOutcome;
};





QDebug operator << (QDebug aDebug, const CoreEvent & aEvent);

Q_DECLARE_METATYPE(CoreEvent);

#pragma once

#include <vector>
#include <QByteArray>
#include <QString>
#include "../ComponentCollection.hpp"





/** The interface to the debugging bridge, as needed by the install engine.
All operations are synchronous; they block the calling thread until the bridge responds or a timeout elapses.
Failures are reported by throwing a descendant of RuntimeError (BridgeUnavailableError,
DeviceUnauthorizedError, InstallRejectedError).
The operations may be called from multiple threads simultaneously (the status poller lists devices while
the install worker installs), so the implementations must be thread-safe. */
class BridgeClient:
	public ComponentCollection::Component<ComponentCollection::ckBridgeClient>
{
	using ComponentSuper = ComponentCollection::Component<ComponentCollection::ckBridgeClient>;


public:

	/** A single device, as reported by the bridge's device list. */
	struct DeviceEntry
	{
		enum State
		{
			esReady,         ///< The device can be communicated with
			esUnauthorized,  ///< The device requires on-device authorization of the debugging
			esOffline,       ///< The device is known, but unavailable (offline, bootloader, recovery, ...)
		};

		QByteArray mID;
		State mState;

		DeviceEntry(const QByteArray & aID, State aState):
			mID(aID),
			mState(aState)
		{
		}

		bool isReady() const { return (mState == esReady); }
	};

	using DeviceEntries = std::vector<DeviceEntry>;


	explicit BridgeClient(ComponentCollection & aComponents);

	virtual ~BridgeClient() override {}

	// ComponentCollection::Component overrides:
	virtual void start() override {}

	/** Returns all the devices currently attached to the bridge, in the order reported by the bridge.
	Throws a BridgeUnavailableError if the bridge cannot be queried (not running, timeout, protocol error). */
	virtual DeviceEntries listDevices() = 0;

	/** Installs the package from the specified file onto the specified device.
	An empty aTargetDeviceID lets the bridge pick its default device.
	Returns normally on success, throws on failure; the exception's text is the diagnostic shown to the user. */
	virtual void install(const QString & aFilePath, const QByteArray & aTargetDeviceID) = 0;

	/** Returns a human-readable name for the specified device (such as "Google Pixel 7").
	Best effort, never throws; the default implementation returns the device ID. */
	virtual QString deviceFriendlyName(const QByteArray & aDeviceID);
};

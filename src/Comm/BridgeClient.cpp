#include "BridgeClient.hpp"





BridgeClient::BridgeClient(ComponentCollection & aComponents):
	ComponentSuper(aComponents)
{
}





QString BridgeClient::deviceFriendlyName(const QByteArray & aDeviceID)
{
	return QString::fromUtf8(aDeviceID);
}

#include "ComponentCollection.hpp"
#include <algorithm>
#include <QStringList>
#include "MultiLogger.hpp"





ComponentCollection::ComponentCollection():
	mIsStarted(false)
{
}





const char * ComponentCollection::kindName(ComponentKind aKind)
{
	switch (aKind)
	{
		case ckInstallConfiguration: return "InstallConfiguration";
		case ckMultiLogger:          return "MultiLogger";
		case ckBridgeClient:         return "BridgeClient";
		case ckInstallCoordinator:   return "InstallCoordinator";
	}
	return "<unknown>";
}





bool ComponentCollection::has(ComponentKind aKind) const
{
	return (mComponents.count(aKind) > 0);
}





void ComponentCollection::start()
{
	if (mIsStarted)
	{
		throw LogicError("Components have already been started");
	}

	// Resolve the whole order first, so that nothing starts if the requirements are broken:
	auto toStart = startOrder();
	mIsStarted = true;
	for (auto & component: toStart)
	{
		component->start();
		mStartedComponents.push_back(component);
	}
}





void ComponentCollection::stop()
{
	while (!mStartedComponents.empty())
	{
		auto component = mStartedComponents.back();
		mStartedComponents.pop_back();
		component->stop();
	}
}





Logger & ComponentCollection::logger(const QString & aName)
{
	return get<MultiLogger>()->logger(aName);
}





void ComponentCollection::addComponentInternal(ComponentKind aKind, ComponentBasePtr aComponent)
{
	if (aComponent == nullptr)
	{
		throw LogicError("Adding an empty %1 component", kindName(aKind));
	}
	if (!mComponents.emplace(aKind, std::move(aComponent)).second)
	{
		throw LogicError("There already is a %1 component", kindName(aKind));
	}
}





ComponentCollection::ComponentBasePtr ComponentCollection::getInternal(ComponentKind aKind) const
{
	auto itr = mComponents.find(aKind);
	if (itr == mComponents.end())
	{
		throw LogicError("There is no %1 component", kindName(aKind));
	}
	return itr->second;
}





void ComponentCollection::requireForStart(ComponentKind aThisComponent, ComponentKind aRequiredComponent)
{
	if (mIsStarted)
	{
		throw LogicError("Cannot add start requirements for %1, components have already been started", kindName(aThisComponent));
	}
	if (aThisComponent == aRequiredComponent)
	{
		throw LogicError("Component %1 requires itself", kindName(aThisComponent));
	}
	mStartRequirements[aThisComponent].push_back(aRequiredComponent);
}





std::vector<ComponentCollection::ComponentBasePtr> ComponentCollection::startOrder() const
{
	std::vector<ComponentKind> kinds;
	for (const auto & entry: mComponents)
	{
		std::vector<ComponentKind> visiting;
		appendWithRequirements(entry.first, visiting, kinds);
	}

	std::vector<ComponentBasePtr> res;
	res.reserve(kinds.size());
	for (auto kind: kinds)
	{
		res.push_back(mComponents.at(kind));
	}
	return res;
}





void ComponentCollection::appendWithRequirements(
	ComponentKind aKind,
	std::vector<ComponentKind> & aVisiting,
	std::vector<ComponentKind> & aOrder
) const
{
	if (std::find(aOrder.begin(), aOrder.end(), aKind) != aOrder.end())
	{
		return;
	}
	if (std::find(aVisiting.begin(), aVisiting.end(), aKind) != aVisiting.end())
	{
		QStringList cycle;
		for (auto k: aVisiting)
		{
			cycle.append(kindName(k));
		}
		cycle.append(kindName(aKind));
		throw LogicError("Circular component start requirements: %1", cycle.join(" -> "));
	}
	if (!has(aKind))
	{
		throw LogicError("Component %1 is required by %2, but it is not present",
			kindName(aKind), aVisiting.empty() ? "nobody" : kindName(aVisiting.back())
		);
	}

	aVisiting.push_back(aKind);
	auto reqs = mStartRequirements.find(aKind);
	if (reqs != mStartRequirements.end())
	{
		for (auto req: reqs->second)
		{
			appendWithRequirements(req, aVisiting, aOrder);
		}
	}
	aVisiting.pop_back();
	aOrder.push_back(aKind);
}

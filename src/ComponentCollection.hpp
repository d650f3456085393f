#pragma once

#include <memory>
#include <map>
#include <vector>
#include "Exception.hpp"





// fwd:
class Logger;





/** Holds the app-wide singletons (settings locations, logs, the bridge client, the install engine).
Each component gets a reference to the collection in its constructor and uses it to look up the others,
instead of having them passed around in parameters.
The collection is filled in main() and doesn't change afterwards. Components declare their start
dependencies via requireForStart() while being constructed; start() then starts them so that each one's
dependencies are already running, and stop() stops them in the opposite order.

	ComponentCollection cc;
	cc.addNew<MultiLogger>(logsFolder);
	auto coordinator = cc.addNew<InstallCoordinator>();
	cc.start();
	...
	cc.stop();
*/
class ComponentCollection
{
public:

	/** Identifies the components; there can be at most one component of each kind in the collection. */
	enum ComponentKind
	{
		ckInstallConfiguration,  ///< Where the settings and the logs live
		ckMultiLogger,           ///< Per-subsystem log files
		ckBridgeClient,          ///< Lists devices and installs packages over the debugging bridge
		ckInstallCoordinator,    ///< Polls the device status and runs the install queue
	};


protected:

	/** The non-template part of Component, so that the components can be stored in a single container. */
	class ComponentBase
	{
		friend class ::ComponentCollection;

	public:

		ComponentBase(ComponentKind aKind, ComponentCollection & aComponents):
			mKind(aKind),
			mComponents(aComponents)
		{
		}

		virtual ~ComponentBase() {}

		/** Called by ComponentCollection::start(), once all the required components are started. */
		virtual void start() = 0;

		/** Called by ComponentCollection::stop(), while the required components are still running. */
		virtual void stop() {}

		/** Declares that aRequiredComponent must be started before this component.
		Only allowed before the collection is started, throws a LogicError afterwards. */
		void requireForStart(ComponentKind aRequiredComponent)
		{
			mComponents.requireForStart(mKind, aRequiredComponent);
		}


	protected:

		ComponentKind mKind;

		ComponentCollection & mComponents;
	};

	using ComponentBasePtr = std::shared_ptr<ComponentBase>;


public:

	/** The base class for the components, binds the component class to its kind. */
	template <ComponentKind tKind>
	class Component:
		public ComponentBase
	{
	public:

		explicit Component(ComponentCollection & aComponents):
			ComponentBase(tKind, aComponents)
		{
		}

		static ComponentKind kind() { return tKind; }
	};



	ComponentCollection();

	/** Returns the human-readable name of the component kind, used in the error messages. */
	static const char * kindName(ComponentKind aKind);

	/** Adds an already constructed component.
	Throws a LogicError if the component is empty, or if there already is a component of the same kind. */
	template <typename ComponentClass>
	void addComponent(std::shared_ptr<ComponentClass> aComponent)
	{
		addComponentInternal(ComponentClass::kind(), std::move(aComponent));
	}

	/** Constructs a component of the specified class (the collection is passed as the first ctor param,
	followed by aArgs), adds it and returns it.
	Throws a LogicError if there already is a component of the same kind. */
	template <typename ComponentClass, typename... Args>
	std::shared_ptr<ComponentClass> addNew(Args &&... aArgs)
	{
		auto component = std::make_shared<ComponentClass>(*this, std::forward<Args>(aArgs)...);
		addComponentInternal(ComponentClass::kind(), component);
		return component;
	}

	/** Returns the component of the specified class, such as mComponents.get<BridgeClient>().
	Throws a LogicError if the collection doesn't have it. */
	template <typename ComponentClass>
	std::shared_ptr<ComponentClass> get()
	{
		return std::dynamic_pointer_cast<ComponentClass>(getInternal(ComponentClass::kind()));
	}

	bool has(ComponentKind aKind) const;

	/** Starts all the components, each after the components it requires.
	Throws a LogicError if already started, or if a requirement is missing or circular
	(in which case no component is started). */
	void start();

	/** Stops the started components, last started first. Does nothing if not started. */
	void stop();

	/** Shortcut for get<MultiLogger>()->logger(aName). */
	Logger & logger(const QString & aName);


protected:

	std::map<ComponentKind, ComponentBasePtr> mComponents;

	/** Component kind -> the kinds that must be started before it. */
	std::map<ComponentKind, std::vector<ComponentKind>> mStartRequirements;

	/** The components in the order in which they were started, emptied by stop(). */
	std::vector<ComponentBasePtr> mStartedComponents;

	bool mIsStarted;


	void addComponentInternal(ComponentKind aKind, ComponentBasePtr aComponent);

	ComponentBasePtr getInternal(ComponentKind aKind) const;

	void requireForStart(ComponentKind aThisComponent, ComponentKind aRequiredComponent);

	/** Returns all the components ordered so that each comes after everything it requires.
	Throws a LogicError naming the offending components on a missing requirement or a cycle. */
	std::vector<ComponentBasePtr> startOrder() const;

	/** Appends aKind to aOrder, preceded by its (transitive) requirements not yet in aOrder.
	aVisiting holds the kinds whose requirements are being resolved, to detect cycles. */
	void appendWithRequirements(
		ComponentKind aKind,
		std::vector<ComponentKind> & aVisiting,
		std::vector<ComponentKind> & aOrder
	) const;
};

#pragma once

#include <memory>
#include <QMainWindow>
#include "../Core/CoreEvent.hpp"





// fwd:
class ComponentCollection;
class InstallCoordinator;
namespace Ui
{
	class WndInstaller;
}





/** The main app window: accepts the dropped APK files and shows the device status and the install results.
All the information is taken from the InstallCoordinator's event stream. */
class WndInstaller:
	public QMainWindow
{
	Q_OBJECT
	using Super = QMainWindow;

public:


	explicit WndInstaller(ComponentCollection & aComponents, QWidget * aParent = nullptr);

	~WndInstaller();


protected:

	/** The components of the entire app. */
	ComponentCollection & mComponents;

	/** The engine doing the actual work. */
	std::shared_ptr<InstallCoordinator> mCoordinator;

	/** The Qt-managed UI. */
	std::unique_ptr<Ui::WndInstaller> mUI;

	/** The number of outcomes received, for the summary in the status bar. */
	int mNumSucceeded;
	int mNumFailed;


	// QWidget overrides:
	virtual void dragEnterEvent(QDragEnterEvent * aEvent) override;
	virtual void dropEvent(QDropEvent * aEvent) override;

	/** Validates the files and queues the valid ones for installation.
	Refuses the whole batch if no device is connected. */
	void installFiles(const QStringList & aFilePaths);

	/** Updates the device status label. */
	void showDeviceState(const DeviceState & aState);


protected Q_SLOTS:

	/** Dispatches the event from the coordinator to the UI. */
	void onCoreEvent(const CoreEvent & aEvent);

	/** Removes all the outcomes from the list. */
	void clearOutcomes();
};

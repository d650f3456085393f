#include "WndInstaller.hpp"
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QMessageBox>
#include <QMimeData>
#include <QUrl>
#include "ui_WndInstaller.h"
#include "../Core/InstallCoordinator.hpp"
#include "../PackageValidator.hpp"
#include "../Settings.hpp"





WndInstaller::WndInstaller(ComponentCollection & aComponents, QWidget * aParent):
	Super(aParent),
	mComponents(aComponents),
	mCoordinator(aComponents.get<InstallCoordinator>()),
	mUI(new Ui::WndInstaller),
	mNumSucceeded(0),
	mNumFailed(0)
{
	mUI->setupUi(this);
	Settings::loadWindowPos("WndInstaller", *this);
	setAcceptDrops(true);

	connect(mUI->actClearOutcomes, &QAction::triggered, this, &WndInstaller::clearOutcomes);
	connect(mUI->actExit,          &QAction::triggered, this, &WndInstaller::close);
	mCoordinator->subscribe(this, [this](const CoreEvent & aEvent)
		{
			onCoreEvent(aEvent);
		}
	);

	// The poller may have published the state before the window was created:
	showDeviceState(mCoordinator->currentDeviceState());
}





WndInstaller::~WndInstaller()
{
	Settings::saveWindowPos("WndInstaller", *this);
}





void WndInstaller::dragEnterEvent(QDragEnterEvent * aEvent)
{
	if (aEvent->mimeData()->hasUrls())
	{
		aEvent->acceptProposedAction();
	}
}





void WndInstaller::dropEvent(QDropEvent * aEvent)
{
	QStringList files;
	for (const auto & url: aEvent->mimeData()->urls())
	{
		if (url.isLocalFile())
		{
			files.append(url.toLocalFile());
		}
	}
	aEvent->acceptProposedAction();
	if (!files.isEmpty())
	{
		installFiles(files);
	}
}





void WndInstaller::installFiles(const QStringList & aFilePaths)
{
	auto split = PackageValidator::splitDroppedFiles(aFilePaths);
	if (!split.mRejected.isEmpty())
	{
		QMessageBox::warning(
			this,
			tr("ApkDrop: Invalid files"),
			tr("The following files will not be installed:\n\n%1")
				.arg(split.mRejectionReasons.join("\n"))
		);
	}
	if (split.mValid.isEmpty())
	{
		return;
	}

	auto state = mCoordinator->currentDeviceState();
	switch (state.status())
	{
		case dsConnected:
		{
			break;
		}
		case dsBridgeError:
		{
			QMessageBox::warning(
				this,
				tr("ApkDrop: Cannot install"),
				tr("ADB cannot be used. Check the Android SDK platform-tools installation.")
			);
			return;
		}
		case dsUnauthorized:
		{
			QMessageBox::warning(
				this,
				tr("ApkDrop: Cannot install"),
				tr("The device %1 has not authorized USB debugging. Confirm the prompt on the device.")
					.arg(state.displayName())
			);
			return;
		}
		case dsAbsent:
		{
			QMessageBox::warning(
				this,
				tr("ApkDrop: Cannot install"),
				tr("No connected Android device was detected.")
			);
			return;
		}
	}

	try
	{
		mCoordinator->enqueueInstall(split.mValid, state.deviceID());
	}
	catch (const LogicError & exc)
	{
		QMessageBox::warning(this, tr("ApkDrop: Cannot install"), exc.message());
	}
}





void WndInstaller::showDeviceState(const DeviceState & aState)
{
	auto numSkipped = mCoordinator->numSkippedPollTicks();
	mUI->lblDeviceState->setToolTip((numSkipped > 0)
		? tr("ADB responds slowly, %1 status checks were skipped so far.").arg(numSkipped)
		: QString()
	);
	switch (aState.status())
	{
		case dsConnected:
		{
			mUI->lblDeviceState->setText(tr("Device connected: %1").arg(aState.displayName()));
			mUI->lblDeviceState->setStyleSheet("QLabel { background-color: #E8F5E8; color: green; }");
			return;
		}
		case dsUnauthorized:
		{
			mUI->lblDeviceState->setText(tr("Device %1 is not authorized for debugging").arg(aState.displayName()));
			mUI->lblDeviceState->setStyleSheet("QLabel { background-color: #FFF4E0; color: #B06000; }");
			return;
		}
		case dsBridgeError:
		{
			mUI->lblDeviceState->setText(tr("ADB call failed"));
			mUI->lblDeviceState->setStyleSheet("QLabel { background-color: #FFE8E8; color: red; }");
			return;
		}
		case dsAbsent:
		{
			mUI->lblDeviceState->setText(tr("No device connected"));
			mUI->lblDeviceState->setStyleSheet("QLabel { color: gray; }");
			return;
		}
	}
}





void WndInstaller::onCoreEvent(const CoreEvent & aEvent)
{
	switch (aEvent.kind())
	{
		case CoreEvent::ekDeviceStateChanged:
		{
			showDeviceState(aEvent.deviceState());
			return;
		}
		case CoreEvent::ekInstallStarted:
		{
			auto numQueued = mCoordinator->numQueued();
			if (numQueued > 0)
			{
				mUI->lblCurrentInstall->setText(tr("Installing %1 (%2 more queued)...")
					.arg(aEvent.request().fileName())
					.arg(numQueued)
				);
			}
			else
			{
				mUI->lblCurrentInstall->setText(tr("Installing %1...").arg(aEvent.request().fileName()));
			}
			return;
		}
		case CoreEvent::ekInstallFinished:
		{
			const auto & outcome = aEvent.outcome();
			mUI->lblCurrentInstall->clear();
			auto item = new QListWidgetItem(mUI->lwOutcomes);
			auto finishTime = outcome.finishedAt().toLocalTime().toString("hh:mm:ss");
			if (outcome.succeeded())
			{
				mNumSucceeded += 1;
				item->setText(tr("%1  %2: installed").arg(finishTime, outcome.request().fileName()));
				item->setForeground(Qt::darkGreen);
			}
			else
			{
				mNumFailed += 1;
				item->setText(tr("%1  %2: failed").arg(finishTime, outcome.request().fileName()));
				item->setForeground(Qt::red);
				item->setToolTip(outcome.message());
			}
			mUI->lwOutcomes->scrollToItem(item);
			statusBar()->showMessage(tr("%1 installed, %2 failed").arg(mNumSucceeded).arg(mNumFailed));
			if (!outcome.succeeded() && isVisible())
			{
				QMessageBox::warning(
					this,
					tr("ApkDrop: Install failed"),
					tr("Installing %1 failed:\n\n%2").arg(outcome.request().fileName(), outcome.message())
				);
			}
			return;
		}
	}
}





void WndInstaller::clearOutcomes()
{
	mUI->lwOutcomes->clear();
	mNumSucceeded = 0;
	mNumFailed = 0;
	statusBar()->clearMessage();
}

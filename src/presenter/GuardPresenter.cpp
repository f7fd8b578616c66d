#include "GuardPresenter.hpp"
#include "console/ConsoleShell.hpp"
#include "sensing/LabelFeedAdapter.hpp"
#include "services/GuardEngine.hpp"

#include <QCoreApplication>

GuardPresenter::GuardPresenter(GuardEngine* engine, ConsoleShell* view,
		std::shared_ptr<LabelFeedAdapter> feed, QObject* parent)
	: QObject(parent), engine(engine), view(view), feed(std::move(feed))
{
	connect(view, &ConsoleShell::utteranceEntered, this, [=](const QString& text) {
			const TurnResult r = engine->handleTurn(text);
			view->showReply(r.reply, r.level);
	});

	connect(view, &ConsoleShell::statusRequested, this, [=]() {
			view->showStatus(engine->isVerified(), engine->escalationLevel());
	});

	connect(view, &ConsoleShell::labelPosted, this, [this](TrustLabel label) {
			if (!this->feed) {
				this->view->showMessage("label feed is not the active sensing source");
				return;
			}
			this->feed->post(label);
	});

	connect(view, &ConsoleShell::quitRequested, this, []() {
			QCoreApplication::quit();
	});

	connect(engine, &GuardEngine::verificationChanged, this, [=](bool verified) {
			view->showMessage(verified ? "State changed to: Verified" : "State changed to: Unverified");
	});

	connect(engine, &GuardEngine::escalationChanged, this, [=](int level) {
			if (level > 0) view->showMessage(QString("Escalation Level: %1").arg(level));
	});

	connect(engine, &GuardEngine::sensingFault, this, [=](const QString& reason) {
			view->showMessage(QString("sensing fault: %1 (running fail-closed)").arg(reason));
	});
}

#include "console/ConsoleShell.hpp"
#include "logger.hpp"

#include <cstdio>
#include <unistd.h>

ConsoleShell::ConsoleShell(QObject* parent)
	: QObject(parent), out_(stdout)
{
}

bool ConsoleShell::attach()
{
	if (!in_.open(stdin, QIODevice::ReadOnly | QIODevice::Text)) {
		LOG_CRITICAL(QString("stdin open failed: %1").arg(in_.errorString()));
		return false;
	}

	notifier_ = new QSocketNotifier(STDIN_FILENO, QSocketNotifier::Read, this);
	connect(notifier_, &QSocketNotifier::activated, this, &ConsoleShell::onReadable);
	return true;
}

void ConsoleShell::onReadable()
{
	// 한 번에 여러 줄이 들어와도(붙여넣기) 버퍼에 남기지 않는다
	const QByteArray raw = in_.readLine();
	if (raw.isEmpty() && in_.atEnd()) {
		// EOF
		notifier_->setEnabled(false);
		emit quitRequested();
		return;
	}
	handleLine(QString::fromUtf8(raw));
	drainBuffered(in_);
}

void ConsoleShell::drainBuffered(QIODevice& dev)
{
	while (dev.canReadLine()) {
		handleLine(QString::fromUtf8(dev.readLine()));
	}
}

void ConsoleShell::handleLine(const QString& line)
{
	const QString text = line.trimmed();

	if (!text.startsWith('/')) {
		emit utteranceEntered(text);
		return;
	}

	const QStringList parts = text.split(' ', Qt::SkipEmptyParts);
	const QString cmd = parts.value(0).toLower();

	if (cmd == "/quit" || cmd == "/exit") {
		emit quitRequested();
	} else if (cmd == "/status") {
		emit statusRequested();
	} else if (cmd == "/label") {
		TrustLabel label;
		if (!parseTrustLabel(parts.value(1), label)) {
			showMessage("usage: /label trusted|untrusted|none");
			return;
		}
		emit labelPosted(label);
	} else {
		showMessage(QString("unknown command: %1").arg(cmd));
	}
}

void ConsoleShell::showReply(const QString& reply, int level)
{
	out_ << "[guard L" << level << "] " << reply << Qt::endl;
}

void ConsoleShell::showStatus(bool verified, int level)
{
	out_ << "[status] " << (verified ? "VERIFIED" : "UNVERIFIED")
		 << " escalation=" << level << Qt::endl;
}

void ConsoleShell::showMessage(const QString& msg)
{
	out_ << "[info] " << msg << Qt::endl;
}

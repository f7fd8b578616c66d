#include "generator/CommandResponseGenerator.hpp"
#include "log/guard_logging.hpp"

#include <QProcess>
#include <QElapsedTimer>
#include <algorithm>

QString CommandResponseGenerator::generate(const PolicyDescriptor& policy, const QString& utterance)
{
	Q_UNUSED(utterance);
	lastError_.clear();

	QProcess proc;
	proc.setProgram(cfg_.command);
	proc.setArguments(cfg_.args);
	proc.setProcessChannelMode(QProcess::SeparateChannels);

	QElapsedTimer t;
	t.start();

	proc.start();
	if (!proc.waitForStarted(cfg_.timeoutMs)) {
		lastError_ = QString("start failed: %1").arg(proc.errorString());
		qCWarning(LC_GENERATOR) << "[generate]" << cfg_.command << lastError_;
		return {};
	}

	proc.write(policy.prompt.toUtf8());
	proc.closeWriteChannel();

	const int remain = std::max(1, cfg_.timeoutMs - static_cast<int>(t.elapsed()));
	if (!proc.waitForFinished(remain)) {
		proc.kill();
		proc.waitForFinished(1000);
		lastError_ = QString("timeout after %1 ms").arg(cfg_.timeoutMs);
		qCWarning(LC_GENERATOR) << "[generate]" << cfg_.command << lastError_;
		return {};
	}

	if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
		lastError_ = QString("exit code %1: %2")
			.arg(proc.exitCode())
			.arg(QString::fromUtf8(proc.readAllStandardError()).trimmed());
		qCWarning(LC_GENERATOR) << "[generate]" << cfg_.command << lastError_;
		return {};
	}

	const QString reply = QString::fromUtf8(proc.readAllStandardOutput()).trimmed();
	qCDebug(LC_GENERATOR) << "[generate] level=" << policy.level
		<< "bytes=" << reply.size() << "elapsed(ms)=" << t.elapsed();
	return reply;
}

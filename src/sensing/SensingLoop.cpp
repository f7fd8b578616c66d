#include "sensing/SensingLoop.hpp"
#include "log/guard_logging.hpp"
#include "log/SystemLogger.hpp"

#include <QDeadlineTimer>
#include <QMutexLocker>
#include <exception>

SensingLoop::SensingLoop(std::shared_ptr<ClassifierAdapter> adapter,
		SlidingWindowAggregator& aggregator,
		VerificationState& state,
		const Params& params,
		Clock clock,
		QObject* parent)
	: QObject(parent),
	  adapter_(std::move(adapter)),
	  agg_(aggregator),
	  state_(state),
	  p_(params),
	  clock_(std::move(clock))
{
}

SensingLoop::~SensingLoop()
{
	stop();
}

bool SensingLoop::start()
{
	QMutexLocker locker(&ctlMu_);
	if (phase_ != Phase::Idle) {
		qCDebug(LC_SENSING) << "[start] ignored: already"
			<< (phase_ == Phase::Running ? "running" : "stopped");
		return false;
	}

	{
		QMutexLocker w(&waitMu_);
		stopRequested_ = false;
	}
	running_.store(true, std::memory_order_release);
	phase_ = Phase::Running;

	th_ = std::thread([this]() {
			qCDebug(LC_SENSING) << "[sensing] thread enter";
			try {
				this->mainLoop();
			}
			catch (const std::exception& e) {
				qCCritical(LC_SENSING) << "[sensing] exception:" << e.what();
				SystemLogger::critical("SENS", "Sensing loop exception", QString::fromUtf8(e.what()));
			}

			adapter_->close();
			running_.store(false, std::memory_order_release);
			qCDebug(LC_SENSING) << "[sensing] thread exit, adapter released";
	});

	qCInfo(LC_SENSING) << "[start] sensing loop started, cadence(ms)=" << p_.cadence.count()
		<< "adapter=" << adapter_->name();
	return true;
}

States::StopResult SensingLoop::stop()
{
	QMutexLocker locker(&ctlMu_);
	if (phase_ == Phase::Idle) {
		return States::StopResult::NotStarted;
	}
	if (phase_ == Phase::Stopped) {
		qCDebug(LC_SENSING) << "[stop] already stopped";
		return States::StopResult::AlreadyStopped;
	}

	{
		QMutexLocker w(&waitMu_);
		stopRequested_ = true;
	}
	waitCv_.wakeAll();

	if (th_.joinable()) th_.join();
	phase_ = Phase::Stopped;

	qCInfo(LC_SENSING) << "[stop] sensing loop stopped, cycles=" << cycles_.load()
		<< "failures=" << failures_.load();
	return States::StopResult::Stopped;
}

void SensingLoop::mainLoop()
{
	while (true) {
		{
			QMutexLocker w(&waitMu_);
			if (stopRequested_) break;
		}
		if (!runCycle()) break;
		if (!waitNextCycle()) break;
	}
}

// false = 정지 요청
bool SensingLoop::waitNextCycle()
{
	QDeadlineTimer deadline(static_cast<qint64>(p_.cadence.count()));

	QMutexLocker w(&waitMu_);
	while (!stopRequested_ && !deadline.hasExpired()) {
		waitCv_.wait(&waitMu_, deadline);
	}
	return !stopRequested_;
}

bool SensingLoop::runCycle()
{
	cycles_.fetch_add(1);

	TrustLabel label = TrustLabel::NoSignal;
	bool ok = false;
	QString reason;

	// 외부 호출은 잠금 없이
	try {
		if (!adapter_->isOpen() && !adapter_->open()) {
			reason = QStringLiteral("%1 open failed").arg(adapter_->name());
		} else if (!adapter_->classify(label)) {
			reason = QStringLiteral("%1 produced no frame").arg(adapter_->name());
		} else {
			ok = true;
		}
	} catch (const std::exception& e) {
		reason = QStringLiteral("%1 threw: %2").arg(adapter_->name(), QString::fromUtf8(e.what()));
	}

	const TimePoint now = clock_();

	if (ok) {
		consecutive_.store(0);
		const bool verdict = agg_.ingest(Observation{now, label});
		qCDebug(LC_SENSING) << "[cycle] label=" << toString(label)
			<< "window=" << agg_.size() << "verdict=" << verdict;
		state_.set(verdict);
		return true;
	}

	failures_.fetch_add(1);
	const int streak = consecutive_.fetch_add(1) + 1;
	qCWarning(LC_SENSING) << "[cycle] sensing failure, skip:" << reason << "streak=" << streak;
	emit cycleFailed(reason);

	// 실패한 주기도 시간은 흐른다
	state_.set(agg_.expire(now));

	if (p_.maxConsecutiveFailures > 0 && streak >= p_.maxConsecutiveFailures) {
		raiseFault(QString("%1 consecutive sensing failures (last: %2)").arg(streak).arg(reason));
		return false;
	}
	return true;
}

void SensingLoop::raiseFault(const QString& reason)
{
	faulted_.store(true);
	qCCritical(LC_SENSING) << "[fault]" << reason;
	SystemLogger::critical("SENS", "Sensing fault", reason);

	// fail-closed
	agg_.clear();
	state_.set(false);

	emit sensingFault(reason);
}

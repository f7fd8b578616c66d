#include "state/VerificationState.hpp"
#include "log/guard_logging.hpp"

#include <QMutexLocker>

VerificationState::VerificationState(Clock clock, QObject* parent)
	: QObject(parent), clock_(std::move(clock))
{
	snap_.verified		= false;
	snap_.lastChanged	= clock_();
	snap_.verifyEpoch	= 0;
}

bool VerificationState::set(bool verified)
{
	VerificationSnapshot after;
	{
		QMutexLocker locker(&mu_);
		if (snap_.verified == verified) return false;

		snap_.verified		= verified;
		snap_.lastChanged	= clock_();
		if (verified) ++snap_.verifyEpoch;
		verified_.store(verified, std::memory_order_release);
		after = snap_;
	}

	qCInfo(LC_STATE) << "[set] State changed to:" << (verified ? "Verified" : "Unverified")
		<< "epoch=" << after.verifyEpoch;

	std::vector<Observer> observers;
	{
		QMutexLocker locker(&obsMu_);
		observers = observers_;
	}
	for (const auto& cb : observers) cb(after);

	emit verificationChanged(verified);
	return true;
}

VerificationSnapshot VerificationState::snapshot() const
{
	QMutexLocker locker(&mu_);
	return snap_;
}

void VerificationState::onChange(Observer cb)
{
	if (!cb) return;
	QMutexLocker locker(&obsMu_);
	observers_.push_back(std::move(cb));
}

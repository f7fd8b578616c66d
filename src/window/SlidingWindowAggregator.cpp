#include "window/SlidingWindowAggregator.hpp"
#include "log/guard_logging.hpp"

bool SlidingWindowAggregator::ingest(const Observation& o)
{
	window_.push_back(o);
	if (o.label == TrustLabel::Trusted) ++trusted_;

	evict(o.ts);
	return recompute();
}

bool SlidingWindowAggregator::expire(TimePoint now)
{
	evict(now);
	return recompute();
}

void SlidingWindowAggregator::evict(TimePoint now)
{
	std::size_t dropped = 0;
	// 전부 만료되어도 빈 윈도우로 끝남
	while (!window_.empty() && (now - window_.front().ts) > p_.window) {
		if (window_.front().label == TrustLabel::Trusted) --trusted_;
		window_.pop_front();
		++dropped;
	}

	if (dropped) {
		qCDebug(LC_WINDOW) << "[evict] dropped=" << dropped << "remain=" << window_.size();
	}
}

bool SlidingWindowAggregator::recompute()
{
	if (window_.empty()) {
		verdict_ = p_.emptyVerdict;
		return verdict_;
	}

	verdict_ = trustedFraction() >= p_.threshold;

	qCDebug(LC_WINDOW) << "[recompute] trusted=" << trusted_ << "/" << window_.size()
		<< "verdict=" << verdict_;
	return verdict_;
}

double SlidingWindowAggregator::trustedFraction() const
{
	if (window_.empty()) return 0.0;
	return static_cast<double>(trusted_) / static_cast<double>(window_.size());
}

void SlidingWindowAggregator::clear()
{
	window_.clear();
	trusted_ = 0;
	verdict_ = p_.emptyVerdict;
}

#include "sensing/LabelFeedAdapter.hpp"
#include "log/guard_logging.hpp"

bool LabelFeedAdapter::open()
{
	// 열기 전에 게시된 라벨은 무시
	lastSeq_ = seq_.load(std::memory_order_acquire);
	open_.store(true);
	qCDebug(LC_SENSING) << "[LabelFeedAdapter] opened, seq=" << lastSeq_;
	return true;
}

bool LabelFeedAdapter::classify(TrustLabel& out)
{
	if (!open_.load()) return false;

	const uint64_t s = seq_.load(std::memory_order_acquire);
	if (s == lastSeq_) {
		out = TrustLabel::NoSignal;		// 새 라벨 없음
		return true;
	}

	out = static_cast<TrustLabel>(label_.load(std::memory_order_relaxed));
	lastSeq_ = s;
	return true;
}

void LabelFeedAdapter::close()
{
	if (open_.exchange(false)) {
		qCDebug(LC_SENSING) << "[LabelFeedAdapter] closed";
	}
}

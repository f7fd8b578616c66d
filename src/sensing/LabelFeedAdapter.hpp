#pragma once
#include <atomic>
#include <cstdint>

#include "sensing/ClassifierAdapter.hpp"

// 외부 얼굴 매처가 밀어넣는 최신 라벨 우편함
//
// post()  : 매처 스레드, 최신 값만 유지
// classify: 센싱 스레드, 직전 주기 이후 새 라벨이 없으면 NoSignal
class LabelFeedAdapter : public ClassifierAdapter {
public:
	void post(TrustLabel label) {
		label_.store(static_cast<int>(label), std::memory_order_relaxed);
		seq_.fetch_add(1, std::memory_order_release);
	}

	uint64_t posted() const { return seq_.load(std::memory_order_acquire); }

	bool open() override;
	bool classify(TrustLabel& out) override;
	void close() override;
	bool isOpen() const override { return open_.load(); }
	QString name() const override { return QStringLiteral("feed"); }

private:
	std::atomic<int>		label_{static_cast<int>(TrustLabel::NoSignal)};
	std::atomic<uint64_t>	seq_{0};
	uint64_t				lastSeq_ = 0;
	std::atomic<bool>		open_{false};
};

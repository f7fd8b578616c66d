#pragma once
#include <chrono>
#include <cstddef>
#include <deque>

#include "include/types.hpp"

// 시간 기반 슬라이딩 윈도우 다수결
//
// 판정: trusted / total >= threshold (같으면 verified).
// NoSignal 은 total 에만 포함되어 신호가 끊기면 판정이 untrusted 로 기운다.
// 빈 윈도우는 emptyVerdict (기본 false, fail-closed).
//
// 전제: ingest 되는 타임스탬프는 단조 비감소 (분류기 어댑터가 보장).
// 단일 생산자 전용, 내부 동기화 없음.
class SlidingWindowAggregator {
public:
	struct Params {
		std::chrono::milliseconds window{3000};
		double threshold	= 0.5;
		bool   emptyVerdict = false;
	};

	SlidingWindowAggregator() = default;
	explicit SlidingWindowAggregator(const Params& p) : p_(p), verdict_(p.emptyVerdict) {}

	// 추가 -> 만료 제거 -> 재계산
	bool ingest(const Observation& o);

	// 추가 없이 now 기준 만료 제거 후 재계산
	bool expire(TimePoint now);

	bool currentVerdict() const { return verdict_; }
	double trustedFraction() const;
	std::size_t size() const { return window_.size(); }
	bool empty() const { return window_.empty(); }

	void clear();

	const Params& params() const { return p_; }

private:
	void evict(TimePoint now);
	bool recompute();

	Params p_;
	std::deque<Observation> window_;
	std::size_t trusted_ = 0;
	bool verdict_ = false;
};

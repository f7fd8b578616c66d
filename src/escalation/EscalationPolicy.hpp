#pragma once
#include <vector>
#include <QString>

#include "config/GuardConfig.hpp"
#include "include/states.hpp"

// 응답 생성기에 넘기는 정책 기술자
struct PolicyDescriptor {
	int				level	= 0;
	States::Intent	intent	= States::Intent::Concierge;
	QString			tone;
	QString			prompt;			// 템플릿에 발화를 채운 결과
	QString			cannedReply;
};

// (level, utterance) -> PolicyDescriptor, 상태 없음
class EscalationPolicy {
public:
	EscalationPolicy(const TierConfig& verified, const std::vector<TierConfig>& tiers)
		: verified_(verified), tiers_(tiers) {}

	PolicyDescriptor describe(int level, const QString& utterance) const;

	// 최상위 단계 이상은 최상위 문구 재사용
	const TierConfig& tierFor(int level) const;
	int tierCount() const { return static_cast<int>(tiers_.size()); }

private:
	TierConfig				verified_;
	std::vector<TierConfig>	tiers_;
};

#pragma once
#include <QString>

#include "escalation/EscalationPolicy.hpp"

// 외부 응답 생성기 (모델 추론 등, 느릴 수 있음)
// 빈 문자열 또는 예외 = 생성 실패
class ResponseGenerator {
public:
	virtual ~ResponseGenerator() = default;
	virtual QString generate(const PolicyDescriptor& policy, const QString& utterance) = 0;
};

// 단계별 고정 응답 (오프라인 기본값)
class CannedResponseGenerator : public ResponseGenerator {
public:
	QString generate(const PolicyDescriptor& policy, const QString&) override {
		return policy.cannedReply;
	}
};

#pragma once
#include <memory>
#include <QObject>
#include <QMutex>
#include <QString>

#include "escalation/EscalationPolicy.hpp"
#include "generator/ResponseGenerator.hpp"
#include "state/VerificationState.hpp"

struct TurnResult {
	QString			reply;
	int				level		= 0;
	States::Intent	intent		= States::Intent::Concierge;
	bool			generated	= false;	// false: 대체 응답 사용
};

// 대화 턴 단위 에스컬레이션 상태 머신
//
// Verified   : level 0, concierge 정책
// Unverified : 턴마다 level+1 (tierCount 에서 포화)
// 재인증(verifyEpoch 증가)은 다음 턴의 정책 선택 전에 반영되어 level 0 으로 초기화.
// level() 은 인증 중이거나 재인증 이후 아직 턴이 없으면 0 을 돌려준다.
//
// level 변경은 채팅 경로에서만 일어나며, 생성기 호출은 잠금 밖에서 수행한다.
// 생성 실패는 level 에 영향을 주지 않는다.
class EscalationController : public QObject {
	Q_OBJECT
public:
	EscalationController(const GuardConfig& cfg,
			VerificationState& state,
			std::shared_ptr<ResponseGenerator> generator,
			QObject* parent = nullptr);

	TurnResult handleTurn(const QString& utterance);

	int level() const;
	int tierCount() const { return policy_.tierCount(); }
	const EscalationPolicy& policy() const { return policy_; }

signals:
	void escalationChanged(int level);
	void generationFailed(const QString& reason);

private:
	// 잠금 안에서 호출
	bool syncWithVerificationLocked(const VerificationSnapshot& snap);	// 재인증 반영, 증가 없음
	int advanceLevelLocked(const VerificationSnapshot& snap);

	EscalationPolicy policy_;
	VerificationState& state_;
	std::shared_ptr<ResponseGenerator> generator_;
	QString fallbackReply_;
	QString invalidInputReply_;

	mutable QMutex mu_;
	int level_ = 0;
	quint64 seenEpoch_ = 0;
};

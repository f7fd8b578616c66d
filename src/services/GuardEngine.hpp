#pragma once
#include <memory>
#include <QObject>
#include <QString>

#include "config/GuardConfig.hpp"
#include "escalation/EscalationController.hpp"
#include "generator/ResponseGenerator.hpp"
#include "sensing/ClassifierAdapter.hpp"
#include "sensing/SensingLoop.hpp"
#include "state/VerificationState.hpp"
#include "window/SlidingWindowAggregator.hpp"

// 신뢰 집계 + 에스컬레이션 엔진
//
// 시작 시 1회 생성, 종료 시 1회 정리. 전역 상태 없음.
// 메인(채팅) 스레드: isVerified(), onUserUtterance()
// 센싱 스레드: 집계기, 검증 상태 쓰기
class GuardEngine : public QObject {
	Q_OBJECT
public:
	// 설정이 잘못되면 ConfigError
	GuardEngine(const GuardConfig& cfg,
			std::shared_ptr<ClassifierAdapter> adapter,
			std::shared_ptr<ResponseGenerator> generator = nullptr,
			Clock clock = systemClock(),
			QObject* parent = nullptr);
	~GuardEngine() override;

	bool start();
	States::StopResult stop();

	bool isVerified() const { return state_.get(); }
	VerificationSnapshot verification() const { return state_.snapshot(); }
	int escalationLevel() const { return escalation_->level(); }

	// UI/음성 셸 진입점
	QString onUserUtterance(const QString& text);
	TurnResult handleTurn(const QString& text);

	const GuardConfig& config() const { return cfg_; }
	const SensingLoop& sensing() const { return *sensing_; }

	static std::shared_ptr<ResponseGenerator> makeGenerator(const GeneratorConfig& cfg);

signals:
	void verificationChanged(bool verified);
	void escalationChanged(int level);
	void sensingFault(const QString& reason);

private:
	static SlidingWindowAggregator::Params aggregatorParams(const GuardConfig& cfg);
	static SensingLoop::Params sensingParams(const GuardConfig& cfg);

	GuardConfig cfg_;
	VerificationState state_;
	SlidingWindowAggregator aggregator_;		// 센싱 스레드 전용
	std::unique_ptr<EscalationController> escalation_;
	std::unique_ptr<SensingLoop> sensing_;
};

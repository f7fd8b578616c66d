#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <QObject>
#include <QMutex>
#include <QWaitCondition>
#include <QString>

#include "include/states.hpp"
#include "include/types.hpp"
#include "sensing/ClassifierAdapter.hpp"
#include "state/VerificationState.hpp"
#include "window/SlidingWindowAggregator.hpp"

// 고정 주기로 분류기를 호출해 집계기/검증 상태를 갱신하는 백그라운드 루프
//
// - 어댑터 실패(false/예외)는 로그 후 주기를 건너뛰고 윈도우만 만료시킨다.
// - maxConsecutiveFailures 에 닿으면 치명 장애: 윈도우 비우고 false 게시 후 종료.
// - 주기 사이 대기는 stop() 으로 즉시 깨어난다.
// - 루프가 끝나는 모든 경로에서 어댑터를 닫는다.
class SensingLoop : public QObject {
	Q_OBJECT
public:
	struct Params {
		std::chrono::milliseconds cadence{10000};
		int maxConsecutiveFailures = 0;		// 0 = 무제한
	};

	SensingLoop(std::shared_ptr<ClassifierAdapter> adapter,
			SlidingWindowAggregator& aggregator,
			VerificationState& state,
			const Params& params,
			Clock clock = systemClock(),
			QObject* parent = nullptr);
	~SensingLoop() override;

	bool start();
	States::StopResult stop();

	bool running() const { return running_.load(); }
	bool faulted() const { return faulted_.load(); }

	// 한 주기 실행 (스레드 본체와 테스트에서 사용). false = 치명 장애로 종료
	bool runCycle();

	quint64 cycles() const { return cycles_.load(); }
	quint64 failures() const { return failures_.load(); }
	int consecutiveFailures() const { return consecutive_.load(); }

signals:
	void cycleFailed(const QString& reason);
	void sensingFault(const QString& reason);

private:
	enum class Phase { Idle, Running, Stopped };

	void mainLoop();
	bool waitNextCycle();
	void raiseFault(const QString& reason);

	std::shared_ptr<ClassifierAdapter> adapter_;
	SlidingWindowAggregator& agg_;
	VerificationState& state_;
	Params p_;
	Clock clock_;

	QMutex ctlMu_;			// start/stop 직렬화
	Phase phase_ = Phase::Idle;
	std::thread th_;

	QMutex waitMu_;
	QWaitCondition waitCv_;
	bool stopRequested_ = false;	// waitMu_ 보호

	std::atomic<bool> running_{false};
	std::atomic<bool> faulted_{false};
	std::atomic<quint64> cycles_{0};
	std::atomic<quint64> failures_{0};
	std::atomic<int> consecutive_{0};
};

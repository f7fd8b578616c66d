#pragma once
#include <atomic>
#include <functional>
#include <vector>
#include <QObject>
#include <QMutex>

#include "include/types.hpp"

// 집계기 판정의 공유 보관소
//
// 쓰기: 센싱 스레드 (집계기 판정 단계) 만.
// 읽기: get() 은 원자적 읽기로 블로킹 없음, snapshot() 은 필드 일관성 보장.
// 실제로 값이 바뀔 때만 변경 통지 1회.
class VerificationState : public QObject {
	Q_OBJECT
public:
	using Observer = std::function<void(const VerificationSnapshot&)>;

	explicit VerificationState(Clock clock = systemClock(), QObject* parent = nullptr);

	// 값이 뒤집혔으면 true
	bool set(bool verified);

	bool get() const { return verified_.load(std::memory_order_acquire); }
	VerificationSnapshot snapshot() const;

	// 쓰기 스레드에서 직접 호출됨
	void onChange(Observer cb);

signals:
	void verificationChanged(bool verified);

private:
	Clock clock_;
	std::atomic<bool> verified_{false};

	mutable QMutex mu_;
	VerificationSnapshot snap_;

	QMutex obsMu_;
	std::vector<Observer> observers_;
};

#pragma once
#include <QString>

#include "include/types.hpp"

// 외부 분류기 래퍼: 센싱 주기마다 한 번 호출
//
// classify() 가 false 를 돌려주면 해당 주기는 센싱 실패 (건너뜀).
// 얼굴이 없을 때는 true + NoSignal.
class ClassifierAdapter {
public:
	virtual ~ClassifierAdapter() = default;

	virtual bool open() = 0;
	virtual bool classify(TrustLabel& out) = 0;
	virtual void close() = 0;		// 여러 번 호출해도 안전해야 함
	virtual bool isOpen() const = 0;
	virtual QString name() const = 0;
};

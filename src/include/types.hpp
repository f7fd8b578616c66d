#pragma once
#include <chrono>
#include <functional>
#include <QString>
#include <QMetaType>
#include <QtGlobal>

using SteadyClock = std::chrono::steady_clock;
using TimePoint   = SteadyClock::time_point;

// 단조 시간 공급원 (테스트에서 수동 시계로 교체)
using Clock = std::function<TimePoint()>;

inline Clock systemClock() { return [] { return SteadyClock::now(); }; }

// 분류기 1회 결과
enum class TrustLabel {
	Trusted = 0,		// 신뢰 얼굴 일치
	Untrusted,			// 얼굴은 있으나 불일치
	NoSignal			// 얼굴 없음 / 프레임 없음
};

struct Observation {
	TimePoint	ts;
	TrustLabel	label = TrustLabel::NoSignal;
};

struct VerificationSnapshot {
	bool		verified	= false;
	TimePoint	lastChanged{};
	quint64		verifyEpoch = 0;		// false -> true 전환 누적 횟수
};

inline QString toString(TrustLabel l)
{
	switch (l) {
		case TrustLabel::Trusted:	return QStringLiteral("trusted");
		case TrustLabel::Untrusted:	return QStringLiteral("untrusted");
		case TrustLabel::NoSignal:	return QStringLiteral("none");
	}
	return QStringLiteral("none");
}

inline bool parseTrustLabel(const QString& text, TrustLabel& out)
{
	const QString norm = text.trimmed().toLower();
	if (norm == "trusted")							{ out = TrustLabel::Trusted;   return true; }
	if (norm == "untrusted")						{ out = TrustLabel::Untrusted; return true; }
	if (norm == "none" || norm == "nosignal")		{ out = TrustLabel::NoSignal;  return true; }
	return false;
}

Q_DECLARE_METATYPE(TrustLabel)

#pragma once
#include <QObject>

namespace States {
	// 에스컬레이션 단계별 의도
	enum class Intent { Concierge, InquireIdentity, OrderToLeave, FinalWarning };

	// 정지 요청 결과
	enum class StopResult { Stopped, AlreadyStopped, NotStarted };

	inline const char* intentName(Intent i)
	{
		switch (i) {
			case Intent::Concierge:			return "concierge";
			case Intent::InquireIdentity:	return "inquire";
			case Intent::OrderToLeave:		return "order_leave";
			case Intent::FinalWarning:		return "final_warning";
		}
		return "unknown";
	}
}

Q_DECLARE_METATYPE(States::Intent)

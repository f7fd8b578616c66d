#pragma once

namespace guard {
	inline constexpr double WINDOW_SEC		= 3.0;		// 집계 윈도우 W
	inline constexpr double CADENCE_SEC		= 10.0;		// 센싱 주기
	inline constexpr double MATCH_THR		= 0.5;		// trusted 비율 임계 (같으면 verified)
	inline constexpr int	TIER_COUNT		= 3;
	inline constexpr int	CAM_REOPEN_FAILS = 10;
	inline constexpr int	GEN_TIMEOUT_MS	= 30000;
	inline constexpr double MIN_DURATION_SEC = 0.001;	// 1 ms 미만은 0 으로 반올림됨
	inline constexpr double MAX_DURATION_SEC = 86400.0;	// 하루
}

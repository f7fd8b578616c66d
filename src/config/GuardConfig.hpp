#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <QString>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "include/guard_params.hpp"
#include "include/states.hpp"

// 설정 오류: 엔진 시작 전에 치명적으로 처리
class ConfigError : public std::runtime_error {
public:
	explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// 단계별 응답 정책 문구
struct TierConfig {
	States::Intent	intent = States::Intent::InquireIdentity;
	QString			tone;
	QString			promptTemplate;		// "{utterance}" 치환
	QString			cannedReply;		// 생성기 없이 쓰는 기본 응답
};

struct CameraConfig {
	int		index		= 0;
	QString	device;						// 비어있으면 index 사용
	QString	pipeline;					// GStreamer 파이프라인 (선택)
	int		width		= 640;
	int		height		= 480;
	int		reopenAfterFails = guard::CAM_REOPEN_FAILS;
};

struct GeneratorConfig {
	QString		command;				// 비어있으면 canned 응답
	QStringList	args;
	int			timeoutMs	= guard::GEN_TIMEOUT_MS;
};

struct GuardConfig {
	// 1) 집계
	double	windowSec	= guard::WINDOW_SEC;
	double	threshold	= guard::MATCH_THR;
	bool	failOpen	= false;		// 빈 윈도우 판정 (기본 fail-closed)

	// 2) 센싱
	double	cadenceSec	= guard::CADENCE_SEC;
	int		maxConsecutiveFailures = 0;	// 0 = 무제한
	QString	source		= QStringLiteral("feed");	// "feed" | "camera"
	CameraConfig camera;

	// 3) 에스컬레이션
	TierConfig				verified;	// level 0
	std::vector<TierConfig>	tiers;		// level 1..N
	QString	fallbackReply	= QStringLiteral("I'm sorry, I can't respond right now.");
	QString	invalidInputReply = QStringLiteral("Please provide a valid input.");
	GeneratorConfig generator;

	// 4) 이벤트 로그
	QString	eventDbPath;				// 비어있으면 기본 경로

	GuardConfig();

	int tierCount() const { return static_cast<int>(tiers.size()); }

	void validate() const;

	static GuardConfig fromJson(const nlohmann::json& j);
	static GuardConfig fromJsonFile(const QString& path);
};

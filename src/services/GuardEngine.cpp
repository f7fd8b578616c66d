#include "services/GuardEngine.hpp"
#include "generator/CommandResponseGenerator.hpp"
#include "log/SystemLogger.hpp"
#include "logger.hpp"

#include <cmath>

namespace {

std::chrono::milliseconds secondsToMs(double sec)
{
	return std::chrono::milliseconds(static_cast<long long>(std::llround(sec * 1000.0)));
}

// 생성자 초기화 목록에서 검증 (멤버 생성 전에 실패)
const GuardConfig& validated(const GuardConfig& cfg)
{
	cfg.validate();
	return cfg;
}

} // namespace

SlidingWindowAggregator::Params GuardEngine::aggregatorParams(const GuardConfig& cfg)
{
	SlidingWindowAggregator::Params p;
	p.window		= secondsToMs(cfg.windowSec);
	p.threshold		= cfg.threshold;
	p.emptyVerdict	= cfg.failOpen;
	return p;
}

SensingLoop::Params GuardEngine::sensingParams(const GuardConfig& cfg)
{
	SensingLoop::Params p;
	p.cadence					= secondsToMs(cfg.cadenceSec);
	p.maxConsecutiveFailures	= cfg.maxConsecutiveFailures;
	return p;
}

std::shared_ptr<ResponseGenerator> GuardEngine::makeGenerator(const GeneratorConfig& cfg)
{
	if (cfg.command.trimmed().isEmpty()) {
		return std::make_shared<CannedResponseGenerator>();
	}
	return std::make_shared<CommandResponseGenerator>(cfg);
}

GuardEngine::GuardEngine(const GuardConfig& cfg,
		std::shared_ptr<ClassifierAdapter> adapter,
		std::shared_ptr<ResponseGenerator> generator,
		Clock clock,
		QObject* parent)
	: QObject(parent),
	  cfg_(validated(cfg)),
	  state_(clock),
	  aggregator_(aggregatorParams(cfg_))
{
	if (!adapter) {
		throw ConfigError("sensing adapter is required");
	}
	if (!generator) generator = makeGenerator(cfg_.generator);

	// 빈 윈도우 판정으로 시작 (fail-open 이면 true)
	state_.set(aggregator_.currentVerdict());

	escalation_ = std::make_unique<EscalationController>(cfg_, state_, std::move(generator));
	sensing_	= std::make_unique<SensingLoop>(std::move(adapter), aggregator_, state_,
						sensingParams(cfg_), std::move(clock));

	// 전환 기록 (센싱 스레드에서 호출)
	state_.onChange([](const VerificationSnapshot& s) {
			SystemLogger::info("STATE", s.verified ? "Verified" : "Unverified",
				QString("epoch=%1").arg(s.verifyEpoch));
	});

	connect(&state_, &VerificationState::verificationChanged,
			this, &GuardEngine::verificationChanged);
	connect(escalation_.get(), &EscalationController::escalationChanged,
			this, &GuardEngine::escalationChanged);
	connect(sensing_.get(), &SensingLoop::sensingFault,
			this, &GuardEngine::sensingFault);

	LOG_INFO(QString("engine ready: window=%1s cadence=%2s threshold=%3 tiers=%4 failOpen=%5")
			.arg(cfg_.windowSec).arg(cfg_.cadenceSec).arg(cfg_.threshold)
			.arg(cfg_.tierCount()).arg(cfg_.failOpen));
}

GuardEngine::~GuardEngine()
{
	stop();
}

bool GuardEngine::start()
{
	if (!sensing_->start()) return false;
	SystemLogger::info("APP", "Engine started");
	return true;
}

States::StopResult GuardEngine::stop()
{
	const States::StopResult r = sensing_->stop();
	switch (r) {
		case States::StopResult::Stopped:
			SystemLogger::info("APP", "Engine stopped");
			break;
		case States::StopResult::AlreadyStopped:
			LOG_DEBUG("already stopped");
			break;
		case States::StopResult::NotStarted:
			break;
	}
	return r;
}

TurnResult GuardEngine::handleTurn(const QString& text)
{
	return escalation_->handleTurn(text);
}

QString GuardEngine::onUserUtterance(const QString& text)
{
	return escalation_->handleTurn(text).reply;
}

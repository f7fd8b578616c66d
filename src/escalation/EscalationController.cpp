#include "escalation/EscalationController.hpp"
#include "log/guard_logging.hpp"
#include "log/SystemLogger.hpp"

#include <QMutexLocker>
#include <exception>

EscalationController::EscalationController(const GuardConfig& cfg,
		VerificationState& state,
		std::shared_ptr<ResponseGenerator> generator,
		QObject* parent)
	: QObject(parent),
	  policy_(cfg.verified, cfg.tiers),
	  state_(state),
	  generator_(std::move(generator)),
	  fallbackReply_(cfg.fallbackReply),
	  invalidInputReply_(cfg.invalidInputReply)
{
	if (!generator_) generator_ = std::make_shared<CannedResponseGenerator>();
	seenEpoch_ = state_.snapshot().verifyEpoch;
}

int EscalationController::level() const
{
	const VerificationSnapshot snap = state_.snapshot();

	QMutexLocker locker(&mu_);
	// 아직 턴이 없어도 인증 중이거나 재인증이 있었으면 0 으로 보인다
	if (snap.verified || snap.verifyEpoch != seenEpoch_) return 0;
	return level_;
}

bool EscalationController::syncWithVerificationLocked(const VerificationSnapshot& snap)
{
	const int before = level_;

	// 지난 턴 이후 재인증이 있었으면 먼저 초기화
	if (snap.verifyEpoch != seenEpoch_) {
		if (level_ != 0) {
			qCInfo(LC_ESCALATION) << "[sync] re-verified, level" << level_ << "-> 0";
		}
		level_ = 0;
		seenEpoch_ = snap.verifyEpoch;
	}
	if (snap.verified) level_ = 0;

	return level_ != before;
}

int EscalationController::advanceLevelLocked(const VerificationSnapshot& snap)
{
	syncWithVerificationLocked(snap);
	if (snap.verified) return level_;

	if (level_ < policy_.tierCount()) ++level_;
	return level_;
}

TurnResult EscalationController::handleTurn(const QString& utterance)
{
	TurnResult r;

	if (utterance.trimmed().isEmpty()) {
		bool reset = false;
		{
			QMutexLocker locker(&mu_);
			reset = syncWithVerificationLocked(state_.snapshot());
			r.level = level_;
		}
		r.reply = invalidInputReply_;
		r.intent = policy_.describe(r.level, utterance).intent;
		if (reset) emit escalationChanged(r.level);
		return r;
	}

	PolicyDescriptor policy;
	bool changed = false;
	{
		QMutexLocker locker(&mu_);
		const int before = level_;
		const VerificationSnapshot snap = state_.snapshot();
		const int lv = advanceLevelLocked(snap);
		changed = (lv != before);
		policy = policy_.describe(lv, utterance);
	}

	r.level		= policy.level;
	r.intent	= policy.intent;

	qCInfo(LC_ESCALATION) << "[handleTurn] level=" << r.level
		<< "intent=" << States::intentName(r.intent);
	if (changed) emit escalationChanged(r.level);

	// 잠금 밖에서 생성
	QString reply;
	QString failure;
	try {
		reply = generator_->generate(policy, utterance).trimmed();
		if (reply.isEmpty()) failure = QStringLiteral("empty reply");
	} catch (const std::exception& e) {
		failure = QString::fromUtf8(e.what());
	}

	if (!failure.isEmpty()) {
		qCWarning(LC_ESCALATION) << "[handleTurn] generation failed:" << failure;
		SystemLogger::warn("GEN", "Generation failed", failure);
		emit generationFailed(failure);
		r.reply = fallbackReply_;
		r.generated = false;
	} else {
		r.reply = reply;
		r.generated = true;
	}

	if (r.level > 0) {
		SystemLogger::incident(r.level, utterance, r.reply);
	}
	return r;
}

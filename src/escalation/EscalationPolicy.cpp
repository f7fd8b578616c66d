#include "escalation/EscalationPolicy.hpp"

#include <algorithm>

const TierConfig& EscalationPolicy::tierFor(int level) const
{
	if (level <= 0 || tiers_.empty()) return verified_;
	const int idx = std::min(level, tierCount()) - 1;
	return tiers_[static_cast<size_t>(idx)];
}

PolicyDescriptor EscalationPolicy::describe(int level, const QString& utterance) const
{
	const TierConfig& t = tierFor(level);

	PolicyDescriptor d;
	d.level			= std::max(level, 0);
	d.intent		= (level <= 0) ? States::Intent::Concierge : t.intent;
	d.tone			= t.tone;
	d.cannedReply	= t.cannedReply;

	QString prompt = t.promptTemplate;
	prompt.replace(QStringLiteral("{utterance}"), utterance.trimmed());
	d.prompt = prompt;
	return d;
}

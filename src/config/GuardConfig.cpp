#include "config/GuardConfig.hpp"

#include <cmath>
#include <fstream>
#include <QFileInfo>
#include <QDebug>

using nlohmann::json;

namespace {

TierConfig makeTier(States::Intent intent, const char* tone, const char* prompt, const char* reply)
{
	TierConfig t;
	t.intent			= intent;
	t.tone				= QString::fromUtf8(tone);
	t.promptTemplate	= QString::fromUtf8(prompt);
	t.cannedReply		= QString::fromUtf8(reply);
	return t;
}

bool parseIntent(const std::string& s, States::Intent& out)
{
	if (s == "concierge")		{ out = States::Intent::Concierge;		 return true; }
	if (s == "inquire")			{ out = States::Intent::InquireIdentity; return true; }
	if (s == "order_leave")		{ out = States::Intent::OrderToLeave;	 return true; }
	if (s == "final_warning")	{ out = States::Intent::FinalWarning;	 return true; }
	return false;
}

QString qstr(const json& j, const char* key, const QString& def)
{
	if (!j.contains(key)) return def;
	return QString::fromStdString(j.at(key).get<std::string>());
}

// 누락된 키는 기존 값 유지
void readTier(const json& j, TierConfig& t)
{
	if (j.contains("intent")) {
		const std::string s = j.at("intent").get<std::string>();
		if (!parseIntent(s, t.intent)) {
			throw ConfigError("unknown tier intent: " + s);
		}
	}
	t.tone				= qstr(j, "tone",	t.tone);
	t.promptTemplate	= qstr(j, "prompt", t.promptTemplate);
	t.cannedReply		= qstr(j, "reply",	t.cannedReply);
}

// 밀리초 변환 후 0 이 되거나 넘치지 않는 범위
bool durationInRange(double sec)
{
	return std::isfinite(sec) && sec >= guard::MIN_DURATION_SEC && sec <= guard::MAX_DURATION_SEC;
}

} // namespace

GuardConfig::GuardConfig()
{
	verified = makeTier(States::Intent::Concierge, "helpful",
		"**Role**: You are a helpful and professional security AI concierge inside a secured area.\n"
		"**Context**: An authorized and verified user is speaking with you. Your role shifts from guarding to assisting.\n"
		"**Task**: Engage in a normal, helpful conversation based on the user's input. Be polite and concise.\n"
		"**Special Instruction**: If the user mentions being told to leave previously, simply state that it must have been a misunderstanding during the verification process.\n"
		"**Constraints**: Talk like a human. Produce short answers. Do not use any emojis or special symbols. The output must be plain text suitable for a voiceover.\n"
		"**Verified user says**: \"{utterance}\"",
		"Welcome back. How can I help you?");

	tiers.push_back(makeTier(States::Intent::InquireIdentity, "neutral",
		"**Role**: You are a professional security AI guarding a restricted area.\n"
		"**Task**: Ask for identification and their purpose for being here. Your tone should be neutral and inquisitive, but firm.\n"
		"**Constraints**: Produce a single, short question. The output must be plain text with no emojis or symbols, suitable for a voiceover.\n"
		"**User's first words**: \"{utterance}\"",
		"Please identify yourself and state your purpose here."));

	tiers.push_back(makeTier(States::Intent::OrderToLeave, "firm",
		"**Role**: You are a professional security AI guarding a restricted area.\n"
		"**Context**: An unidentified person has failed to provide valid credentials after your initial inquiry. You must now escalate.\n"
		"**Task**: Politely but firmly instruct the person to leave the area immediately. State that this is a restricted area.\n"
		"**Constraints**: Produce a single, short sentence. The output must be plain text with no emojis or symbols, suitable for a voiceover.\n"
		"**User's non-compliant response**: \"{utterance}\"",
		"This is a restricted area. Leave immediately."));

	tiers.push_back(makeTier(States::Intent::FinalWarning, "severe",
		"**Role**: You are a professional security AI guarding a restricted area.\n"
		"**Context**: An unauthorized person has ignored a direct order to leave. This is the final warning before security protocols are activated.\n"
		"**Task**: Issue a stern, final warning. State that they are trespassing and that authorities will be alerted if they do not vacate the premises immediately.\n"
		"**Constraints**: Your tone must be serious and commanding. Keep the response to 1-2 short sentences. The output must be plain text with no emojis or symbols, suitable for a voiceover.\n"
		"**User's final defiance**: \"{utterance}\"",
		"You are trespassing. Leave now or the authorities will be alerted."));
}

void GuardConfig::validate() const
{
	if (!durationInRange(windowSec)) {
		throw ConfigError("window_sec must be in [0.001, 86400]");
	}
	if (!durationInRange(cadenceSec)) {
		throw ConfigError("cadence_sec must be in [0.001, 86400]");
	}
	if (!std::isfinite(threshold) || threshold <= 0.0 || threshold > 1.0) {
		throw ConfigError("threshold must be in (0, 1]");
	}
	if (maxConsecutiveFailures < 0) {
		throw ConfigError("max_consecutive_failures must be >= 0");
	}
	if (tiers.empty()) {
		throw ConfigError("at least one escalation tier is required");
	}
	if (verified.promptTemplate.trimmed().isEmpty()) {
		throw ConfigError("verified prompt template is empty");
	}
	for (size_t i = 0; i < tiers.size(); ++i) {
		if (tiers[i].promptTemplate.trimmed().isEmpty()) {
			throw ConfigError("tier " + std::to_string(i + 1) + " prompt template is empty");
		}
	}
	if (source != "feed" && source != "camera") {
		throw ConfigError("source must be \"feed\" or \"camera\"");
	}
	if (generator.timeoutMs <= 0) {
		throw ConfigError("generator.timeout_ms must be > 0");
	}
	if (camera.reopenAfterFails < 1) {
		throw ConfigError("camera.reopen_after_fails must be >= 1");
	}
}

GuardConfig GuardConfig::fromJson(const json& j)
{
	GuardConfig c;

	try {
		c.windowSec		= j.value("window_sec",  c.windowSec);
		c.threshold		= j.value("threshold",	 c.threshold);
		c.failOpen		= j.value("fail_open",	 c.failOpen);
		c.cadenceSec	= j.value("cadence_sec", c.cadenceSec);
		c.maxConsecutiveFailures = j.value("max_consecutive_failures", c.maxConsecutiveFailures);
		c.source		= qstr(j, "source", c.source);
		c.fallbackReply = qstr(j, "fallback_reply", c.fallbackReply);
		c.invalidInputReply = qstr(j, "invalid_input_reply", c.invalidInputReply);
		c.eventDbPath	= qstr(j, "event_db", c.eventDbPath);

		if (j.contains("camera")) {
			const json& cam = j.at("camera");
			c.camera.index		= cam.value("index",  c.camera.index);
			c.camera.device		= qstr(cam, "device",	c.camera.device);
			c.camera.pipeline	= qstr(cam, "pipeline", c.camera.pipeline);
			c.camera.width		= cam.value("width",  c.camera.width);
			c.camera.height		= cam.value("height", c.camera.height);
			c.camera.reopenAfterFails = cam.value("reopen_after_fails", c.camera.reopenAfterFails);
		}

		if (j.contains("generator")) {
			const json& gen = j.at("generator");
			c.generator.command		= qstr(gen, "command", c.generator.command);
			c.generator.timeoutMs	= gen.value("timeout_ms", c.generator.timeoutMs);
			if (gen.contains("args")) {
				c.generator.args.clear();
				for (const auto& a : gen.at("args")) {
					c.generator.args << QString::fromStdString(a.get<std::string>());
				}
			}
		}

		if (j.contains("verified")) {
			readTier(j.at("verified"), c.verified);
			c.verified.intent = States::Intent::Concierge;
		}

		if (j.contains("tiers")) {
			const json& arr = j.at("tiers");
			if (!arr.is_array()) throw ConfigError("tiers must be an array");

			// 기본 단계 위에 덮어쓰기, 초과분은 최상위 단계를 복제해 시작
			std::vector<TierConfig> tiers;
			for (size_t i = 0; i < arr.size(); ++i) {
				TierConfig t = (i < c.tiers.size()) ? c.tiers[i] : c.tiers.back();
				readTier(arr[i], t);
				tiers.push_back(t);
			}
			c.tiers = std::move(tiers);
		}
	} catch (const json::exception& e) {
		throw ConfigError(std::string("invalid config value: ") + e.what());
	}

	c.validate();
	return c;
}

GuardConfig GuardConfig::fromJsonFile(const QString& path)
{
	QFileInfo fi(path);
	if (!fi.exists() || !fi.isFile()) {
		throw ConfigError("config not found: " + path.toStdString());
	}

	std::ifstream in(path.toStdString());
	if (!in.is_open()) {
		throw ConfigError("config not readable: " + path.toStdString());
	}

	json j;
	try {
		in >> j;
	} catch (const json::parse_error& e) {
		throw ConfigError("config parse failed: " + std::string(e.what()));
	}

	qInfo() << "[GuardConfig] loaded" << path;
	return fromJson(j);
}

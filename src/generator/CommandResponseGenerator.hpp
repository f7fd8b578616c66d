#pragma once
#include <QString>
#include <QStringList>

#include "generator/ResponseGenerator.hpp"
#include "config/GuardConfig.hpp"

// 외부 프로그램 실행: stdin 으로 프롬프트, stdout 으로 응답
class CommandResponseGenerator : public ResponseGenerator {
public:
	explicit CommandResponseGenerator(const GeneratorConfig& cfg) : cfg_(cfg) {}

	QString generate(const PolicyDescriptor& policy, const QString& utterance) override;

	QString lastError() const { return lastError_; }

private:
	GeneratorConfig cfg_;
	QString lastError_;
};

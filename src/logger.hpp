// logger.hpp
#pragma once
#include <QString>
#include <QDebug>
#include <QtGlobal>

#include "log/guard_logging.hpp"

// 함수 이름을 붙여 guard.app 카테고리로 출력
namespace GlobalLogger {

inline void logMessage(QtMsgType type, const char* functionName, const QString& message)
{
		const QString line = QString("[%1] %2").arg(QString::fromLatin1(functionName), message);

		switch (type) {
			case QtDebugMsg:
					qCDebug(LC_APP).noquote() << line;
					break;
			case QtInfoMsg:
					qCInfo(LC_APP).noquote() << line;
					break;
			case QtWarningMsg:
					qCWarning(LC_APP).noquote() << line;
					break;
			default:
					qCCritical(LC_APP).noquote() << line;
					break;
		}
}

}		// namespace GlobalLogger

#define LOG_DEBUG(msg)		GlobalLogger::logMessage(QtDebugMsg, __FUNCTION__, msg)
#define LOG_INFO(msg)		GlobalLogger::logMessage(QtInfoMsg, __FUNCTION__, msg)
#define LOG_WARN(msg)		GlobalLogger::logMessage(QtWarningMsg, __FUNCTION__, msg)
#define LOG_CRITICAL(msg)	GlobalLogger::logMessage(QtCriticalMsg, __FUNCTION__, msg)

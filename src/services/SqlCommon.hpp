#pragma once
#include <QDir>
#include <QFileInfo>
#include <QString>
#include <QThread>

#include "include/common_path.hpp"

namespace SqlCommon {
	inline QString baseConnName() { return QStringLiteral("trustguard"); }

    inline QString defaultDbFilePath()
    {
        return QStringLiteral(DB_PATH) + QStringLiteral(DB);
    }

    inline bool ensureParentDir(const QString& filePath)
    {
        return QDir().mkpath(QFileInfo(filePath).absolutePath());
    }

    // 스레드 + DB 파일별 커넥션 이름
    inline QString connectionNameForCurrentThread(const QString& dbPath)
    {
        return QString("%1_%2_%3").arg(baseConnName())
							   .arg(static_cast<qulonglong>(reinterpret_cast<quintptr>(QThread::currentThreadId())))
							   .arg(qHash(dbPath));
    }
} // namespace SqlCommon

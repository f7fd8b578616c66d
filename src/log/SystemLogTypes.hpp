#pragma once
#include <QString>
#include <QDateTime>
#include <QMetaType>

enum class SysLogLevel { Debug=0, Info=1, Warn=2, Error=3, Critical=4 };

struct SystemLogEntry {
    SysLogLevel level;
    QString tag;        // 예: "STATE", "ESC", "SENS", "GEN", "APP"
    QString message;
    QDateTime ts;
    QString extra;
};

// 미인증 대화 턴 기록
struct IncidentEntry {
    int level = 0;
    QString utterance;
    QString reply;
    QDateTime ts;
};

Q_DECLARE_METATYPE(SystemLogEntry)
Q_DECLARE_METATYPE(IncidentEntry)

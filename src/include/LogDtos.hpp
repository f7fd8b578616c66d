#pragma once
#include <QString>
#include <QDateTime>

// 미인증 대화 기록 DTO
struct IncidentLog {
    int id{};
    int level{};
    QString utterance;
    QString reply;
    QDateTime timestamp;
};

// 시스템 로그 DTO
struct SystemLog {
    int id{};
    int level{};        // 0~4
    QString tag;
    QString message;
    QDateTime timestamp;
    QString extra;
};

#pragma once
#include <QDateTime>
#include <QVector>
#include <QString>
#include <QMutex>
#include "include/LogDtos.hpp"

// SQLite 이벤트 저장소 (system_logs, incident_logs)
class EventLogStore {
public:
    explicit EventLogStore(const QString& dbPath = QString());

    bool initializeDatabase();

    bool insertSystemLog(int level, const QString& tag, const QString& message,
                         const QDateTime& timestamp, const QString& extra = QString());

    bool insertIncident(int level, const QString& utterance, const QString& reply,
                        const QDateTime& timestamp);

    bool selectSystemLogs(int offset, int limit,
                          int minLevel, const QString& tagLike,
                          QVector<SystemLog>* outRows,
                          int* outTotal);

    bool selectIncidents(int offset, int limit,
                         QVector<IncidentLog>* outRows,
                         int* outTotal);

	bool deleteSysLogs();
	bool deleteIncidents();

    QString dbPath() const { return dbPath_; }

private:
	QString dbPath_;
	QMutex dbMutex;
};

#include "EventLogStore.hpp"
#include "services/SqlCommon.hpp"
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>
#include <QDebug>

using namespace SqlCommon;

// 호출 스레드 전용 커넥션 확보
static QSqlDatabase ensureOpenConnectionForThisThread(const QString& dbPath) {
    const QString name = SqlCommon::connectionNameForCurrentThread(dbPath);
    QSqlDatabase db;

    if (!QSqlDatabase::contains(name)) {
        db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), name);
        db.setDatabaseName(dbPath);
    } else {
        db = QSqlDatabase::database(name, /*open=*/false);
    }

    if (!db.isOpen() && !db.open()) {
        qCritical() << "[SQL] DB open failed:" << db.lastError().text()
                    << " path=" << db.databaseName()
                    << " drivers=" << QSqlDatabase::drivers();
    }
    return db;
}

EventLogStore::EventLogStore(const QString& dbPath)
    : dbPath_(dbPath.isEmpty() ? defaultDbFilePath() : dbPath)
{
}

bool EventLogStore::initializeDatabase()
{
	QMutexLocker locker(&dbMutex);
    if (!ensureParentDir(dbPath_)) {
        qCritical() << "[SQL] cannot create directory for" << dbPath_;
        return false;
    }

    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) {
        qCritical() << "[SQL] Open failed:" << db.lastError().text()
                    << " path=" << db.databaseName();
        return false;
    }

    {   // 신뢰성 옵션
        QSqlQuery pragma(db);
        if (!pragma.exec("PRAGMA journal_mode=WAL;")) {
            qWarning() << "[SQL] journal_mode=WAL failed (ignored):" << pragma.lastError().text();
        }
        if (!pragma.exec("PRAGMA synchronous=NORMAL;")) {
            qWarning() << "[SQL] synchronous=NORMAL failed (ignored):" << pragma.lastError().text();
        }
    }

    QSqlQuery q(db);

    // 시스템로그
    if (!q.exec(
        "CREATE TABLE IF NOT EXISTS system_logs ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "level INTEGER NOT NULL, "
        "tag TEXT, "
        "message TEXT NOT NULL, "
        "timestamp TEXT NOT NULL, "
        "extra TEXT)"
    )) {
        qCritical() << "Failed to create system_logs:" << q.lastError().text();
        return false;
    }

    // 미인증 대화
    if (!q.exec(
        "CREATE TABLE IF NOT EXISTS incident_logs ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "level INTEGER NOT NULL, "
        "utterance TEXT NOT NULL, "
        "reply TEXT NOT NULL, "
        "timestamp TEXT NOT NULL)"
    )) {
        qCritical() << "Failed to create incident_logs:" << q.lastError().text();
        return false;
    }

    // 인덱스
    const char* indexes[] = {
        "CREATE INDEX IF NOT EXISTS idx_sys_ts    ON system_logs(timestamp)",
        "CREATE INDEX IF NOT EXISTS idx_sys_level ON system_logs(level)",
        "CREATE INDEX IF NOT EXISTS idx_sys_tag   ON system_logs(tag)",
        "CREATE INDEX IF NOT EXISTS idx_inc_ts    ON incident_logs(timestamp)",
    };
    for (const char* sql : indexes) {
        if (!q.exec(sql)) {
            qWarning() << "[SQL] index create failed (ignored):" << q.lastError().text();
        }
    }

    qDebug() << "[SQL] Database opened & schema ready. path=" << db.databaseName()
             << " driver=" << db.driverName();
    return true;
}

bool EventLogStore::insertSystemLog(int level, const QString& tag, const QString& message,
                                    const QDateTime& timestamp, const QString& extra)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) {
        qCritical() << "[SQL] DB open failed:" << db.lastError().text();
        return false;
    }

    QSqlQuery q(db);
    q.prepare("INSERT INTO system_logs (level, tag, message, timestamp, extra) "
              "VALUES (?, ?, ?, ?, ?)");
    q.addBindValue(level);
    q.addBindValue(tag);
    q.addBindValue(message.isNull() ? QString("") : message);
    q.addBindValue(timestamp.toString(Qt::ISODateWithMs));
    q.addBindValue(extra);

    if (!q.exec()) {
        qCritical() << "Insert system log failed:" << q.lastError().text();
        return false;
    }
    return true;
}

bool EventLogStore::insertIncident(int level, const QString& utterance, const QString& reply,
                                   const QDateTime& timestamp)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) {
        qCritical() << "[SQL] DB open failed:" << db.lastError().text();
        return false;
    }

    const QString timeSafe = timestamp.isValid()
                    ? timestamp.toString(Qt::ISODateWithMs)
                    : QDateTime::currentDateTime().toString(Qt::ISODateWithMs);

    QSqlQuery q(db);
    q.prepare("INSERT INTO incident_logs (level, utterance, reply, timestamp) "
              "VALUES (?, ?, ?, ?)");
    q.addBindValue(level);
    q.addBindValue(utterance.isNull() ? QString("") : utterance);
    q.addBindValue(reply.isNull() ? QString("") : reply);
    q.addBindValue(timeSafe);

    if (!q.exec()) {
        qCritical() << "Insert incident failed:" << q.lastError().text();
        return false;
    }
    return true;
}

bool EventLogStore::selectSystemLogs(int offset, int limit,
                                     int minLevel, const QString& tagLike,
                                     QVector<SystemLog>* outRows, int* outTotal)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) return false;

    QString where = "WHERE level >= ?";
    QList<QVariant> binds; binds << minLevel;

    if (!tagLike.isEmpty()) { where += " AND tag LIKE ?"; binds << ("%"+tagLike+"%"); }

    // total
    QSqlQuery qc(db);
    qc.prepare("SELECT COUNT(*) FROM system_logs " + where);
    for (auto& v : binds) qc.addBindValue(v);
    if (!qc.exec() || !qc.next()) {
        qWarning() << "[SQL] count system_logs failed:" << qc.lastError().text();
        return false;
    }
    if (outTotal) *outTotal = qc.value(0).toInt();

    // rows
    QSqlQuery q(db);
    q.prepare("SELECT id, level, tag, message, timestamp, extra "
              "FROM system_logs " + where + " ORDER BY id DESC LIMIT ? OFFSET ?");
    for (auto& v : binds) q.addBindValue(v);
    q.addBindValue(limit);
    q.addBindValue(offset);

    if (!q.exec()) {
        qWarning() << "[SQL] select system_logs failed:" << q.lastError().text();
        return false;
    }

    if (outRows) {
        outRows->clear();
        while (q.next()) {
            SystemLog r;
            r.id        = q.value(0).toInt();
            r.level     = q.value(1).toInt();
            r.tag       = q.value(2).toString();
            r.message   = q.value(3).toString();
            r.timestamp = QDateTime::fromString(q.value(4).toString(), Qt::ISODateWithMs);
            r.extra     = q.value(5).toString();
            outRows->push_back(r);
        }
    }
    return true;
}

bool EventLogStore::selectIncidents(int offset, int limit,
                                    QVector<IncidentLog>* outRows, int* outTotal)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) return false;

    {
        QSqlQuery qc(db);
        if (!qc.exec("SELECT COUNT(*) FROM incident_logs") || !qc.next()) {
            qWarning() << "[SQL] count incident_logs failed:" << qc.lastError().text();
            return false;
        }
        if (outTotal) *outTotal = qc.value(0).toInt();
    }

    QSqlQuery q(db);
    q.prepare("SELECT id, level, utterance, reply, timestamp "
              "FROM incident_logs ORDER BY id DESC LIMIT ? OFFSET ?");
    q.addBindValue(limit);
    q.addBindValue(offset);

    if (!q.exec()) {
        qWarning() << "[SQL] select incident_logs failed:" << q.lastError().text();
        return false;
    }

    if (outRows) {
        outRows->clear();
        while (q.next()) {
            IncidentLog r;
            r.id        = q.value(0).toInt();
            r.level     = q.value(1).toInt();
            r.utterance = q.value(2).toString();
            r.reply     = q.value(3).toString();
            r.timestamp = QDateTime::fromString(q.value(4).toString(), Qt::ISODateWithMs);
            outRows->push_back(r);
        }
    }
    return true;
}

static bool clearTable(QSqlDatabase& db, const QString& table)
{
    QSqlQuery q(db);
    if (!q.exec(QString("DELETE FROM %1;").arg(table))) {
        qCritical() << "[SQL] DELETE FROM" << table << "failed:" << q.lastError().text();
        return false;
    }

    if (!q.exec(QString("DELETE FROM sqlite_sequence WHERE name='%1';").arg(table))) {
        qWarning() << "[SQL] reset sqlite_sequence failed (ignored):" << q.lastError().text();
    }

    QSqlQuery vacuum(db);
    if (!vacuum.exec("VACUUM;")) {
        qWarning() << "[SQL] VACUUM failed (ignored):" << vacuum.lastError().text();
    }
    return true;
}

bool EventLogStore::deleteSysLogs()
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) return false;
    return clearTable(db, QStringLiteral("system_logs"));
}

bool EventLogStore::deleteIncidents()
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) return false;
    return clearTable(db, QStringLiteral("incident_logs"));
}

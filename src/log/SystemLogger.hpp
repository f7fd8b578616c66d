#pragma once
#include <QObject>
#include <QThread>

#include "SystemLogTypes.hpp"
#include "services/EventLogStore.hpp"

namespace syslog_detail {

// 로거 스레드에서 동작하는 SQLite 기록기
class SystemLogWriter : public QObject {
    Q_OBJECT
public:
    explicit SystemLogWriter(const QString& dbPath);

    bool failed() const { return failed_; }
    int dropped() const { return dropped_; }

public slots:
    void append(const SystemLogEntry& e);
    void appendIncident(const IncidentEntry& e);

private:
    bool ensureReady();

    EventLogStore store_;
    bool ready_ = false;
    bool failed_ = false;
    int dropped_ = 0;
};

} // namespace syslog_detail

class SystemLogger final : public QObject {
    Q_OBJECT
public:
    static SystemLogger& instance();
    static void init(const QString& dbPath);   // 앱 시작시 1회
    static void shutdown();
    static bool isRunning();

    // 어디서든 한 줄로 호출 (init 전에는 버려짐)
    static void debug(const QString& tag, const QString& msg, const QString& extra = {});
    static void info (const QString& tag, const QString& msg, const QString& extra = {});
    static void warn (const QString& tag, const QString& msg, const QString& extra = {});
    static void error(const QString& tag, const QString& msg, const QString& extra = {});
    static void critical(const QString& tag, const QString& msg, const QString& extra = {});

    static void incident(int level, const QString& utterance, const QString& reply);

signals:
    void appendRequested(const SystemLogEntry& e); // 워커에게 보냄
    void incidentRequested(const IncidentEntry& e);

private:
	QThread* th = nullptr;
	syslog_detail::SystemLogWriter* wr = nullptr;

    explicit SystemLogger(QObject* parent=nullptr);
    ~SystemLogger() override;
};

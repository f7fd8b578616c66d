#include "SystemLogger.hpp"
#include <QThread>
#include <QDebug>

namespace syslog_detail {

SystemLogWriter::SystemLogWriter(const QString& dbPath) : store_(dbPath) {}

void SystemLogWriter::append(const SystemLogEntry& e)
{
    if (!ensureReady()) return;
    store_.insertSystemLog(
        static_cast<int>(e.level),
        e.tag,
        e.message,
        e.ts.isValid() ? e.ts : QDateTime::currentDateTime(),
        e.extra
    );
}

void SystemLogWriter::appendIncident(const IncidentEntry& e)
{
    if (!ensureReady()) return;
    store_.insertIncident(
        e.level,
        e.utterance,
        e.reply,
        e.ts.isValid() ? e.ts : QDateTime::currentDateTime()
    );
}

// 워커 스레드에서 최초 1회 스키마 준비, 실패하면 이후 항목은 버린다
bool SystemLogWriter::ensureReady()
{
    if (ready_) return true;
    if (failed_) {
        ++dropped_;
        return false;
    }

    ready_ = store_.initializeDatabase();
    if (!ready_) {
        failed_ = true;
        ++dropped_;
        qCritical() << "[SystemLogger] event log unavailable, dropping entries. path=" << store_.dbPath();
    }
    return ready_;
}

} // namespace syslog_detail

SystemLogger& SystemLogger::instance() {
    static SystemLogger inst;
    return inst;
}

SystemLogger::SystemLogger(QObject* p) : QObject(p) {}

SystemLogger::~SystemLogger() {}

void SystemLogger::init(const QString& dbPath)
{
	auto& inst = instance();
    if (inst.th) return;

    qRegisterMetaType<SystemLogEntry>("SystemLogEntry");
    qRegisterMetaType<IncidentEntry>("IncidentEntry");

	inst.th = new QThread;
	inst.wr = new syslog_detail::SystemLogWriter(dbPath);
	inst.wr->moveToThread(inst.th);

    QObject::connect(&inst, &SystemLogger::appendRequested,
                     inst.wr, &syslog_detail::SystemLogWriter::append, Qt::QueuedConnection);
    QObject::connect(&inst, &SystemLogger::incidentRequested,
                     inst.wr, &syslog_detail::SystemLogWriter::appendIncident, Qt::QueuedConnection);
    QObject::connect(inst.th, &QThread::finished, inst.wr, &QObject::deleteLater);
    inst.th->start();
}

bool SystemLogger::isRunning()
{
    return instance().th != nullptr;
}

void SystemLogger::shutdown() {
	auto& inst = instance();
 	if (!inst.th) return;

    QObject::disconnect(&inst, nullptr, inst.wr, nullptr);

	inst.th->quit();
    if (!inst.th->wait(3000)) {
        qWarning() << "[SystemLogger] writer thread did not finish in 3s";
        inst.th->terminate();
        inst.th->wait();
    }

    delete inst.th;
    inst.th = nullptr;
	inst.wr = nullptr;
}

static void post(SysLogLevel lv, const QString& tag, const QString& msg, const QString& extra) {
    if (!SystemLogger::isRunning()) return;
    SystemLogEntry e{lv, tag, msg, QDateTime::currentDateTime(), extra};
    emit SystemLogger::instance().appendRequested(e);
}
void SystemLogger::debug(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Debug, tag, msg, extra); }
void SystemLogger::info (const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Info , tag, msg, extra); }
void SystemLogger::warn (const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Warn , tag, msg, extra); }
void SystemLogger::error(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Error, tag, msg, extra); }
void SystemLogger::critical(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Critical, tag, msg, extra); }

void SystemLogger::incident(int level, const QString& utterance, const QString& reply)
{
    if (!isRunning()) return;
    IncidentEntry e{level, utterance, reply, QDateTime::currentDateTime()};
    emit instance().incidentRequested(e);
}


#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QDebug>
#include <exception>
#include <memory>

#include "config/GuardConfig.hpp"
#include "console/ConsoleShell.hpp"
#include "include/common_path.hpp"
#include "log/SystemLogger.hpp"
#include "presenter/GuardPresenter.hpp"
#include "sensing/CameraClassifierAdapter.hpp"
#include "sensing/LabelFeedAdapter.hpp"
#include "services/GuardEngine.hpp"
#include "services/SqlCommon.hpp"

static GuardConfig loadConfig(const QCommandLineParser& p)
{
		GuardConfig cfg;
		QString path = p.value("config");
		if (path.isEmpty() && QFileInfo::exists(QStringLiteral(CONFIG_FILE))) {
				path = QStringLiteral(CONFIG_FILE);
		}
		if (!path.isEmpty()) cfg = GuardConfig::fromJsonFile(path);

		bool ok = true;
		if (p.isSet("window"))		{ cfg.windowSec  = p.value("window").toDouble(&ok);	   if (!ok) throw ConfigError("--window is not a number"); }
		if (p.isSet("cadence"))		{ cfg.cadenceSec = p.value("cadence").toDouble(&ok);   if (!ok) throw ConfigError("--cadence is not a number"); }
		if (p.isSet("threshold"))	{ cfg.threshold  = p.value("threshold").toDouble(&ok); if (!ok) throw ConfigError("--threshold is not a number"); }
		if (p.isSet("event-db"))	{ cfg.eventDbPath = p.value("event-db"); }
		if (p.isSet("camera"))		{ cfg.source = QStringLiteral("camera"); cfg.camera.device = p.value("camera"); }

		cfg.validate();
		return cfg;
}

int main(int argc, char *argv[])
{
		try {
				QCoreApplication app(argc, argv);
				QCoreApplication::setApplicationName("trustguard");
				QCoreApplication::setApplicationVersion("1.0");

				qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} %{type} %{category} - %{message}"));
				QLoggingCategory::setFilterRules(
						"guard.window.debug=false\n"
						"guard.sensing.debug=false\n"
						"guard.generator.debug=false\n"
				);

				QCommandLineParser parser;
				parser.setApplicationDescription("Presence guard: windowed face-trust verdict and escalating dialogue");
				parser.addHelpOption();
				parser.addVersionOption();
				parser.addOptions({
						{"config",	  "JSON config file.", "path"},
						{"window",	  "Aggregation window W in seconds.", "sec"},
						{"cadence",	  "Sensing period in seconds.", "sec"},
						{"threshold", "Trusted fraction needed for a verified verdict.", "fraction"},
						{"event-db",  "SQLite event log path.", "path"},
						{"camera",	  "Camera device path (enables camera sensing).", "device"},
				});
				parser.process(app);

				const GuardConfig cfg = loadConfig(parser);

				// 외부 얼굴 매처가 라벨을 게시하는 채널
				auto feed = std::make_shared<LabelFeedAdapter>();
				std::shared_ptr<ClassifierAdapter> adapter = feed;

				if (cfg.source == "camera") {
						// 프레임 획득은 카메라, 신원 판정은 매처 게시값
						if (!feed->open()) {
								qCritical() << "[main] label feed open failed";
								return -1;
						}
						adapter = std::make_shared<CameraClassifierAdapter>(cfg.camera,
								[feed](const cv::Mat&) {
										TrustLabel label = TrustLabel::NoSignal;
										if (!feed->classify(label)) label = TrustLabel::NoSignal;
										return label;
								});
				}

				// 이벤트 로그 준비
				const QString dbPath = cfg.eventDbPath.isEmpty() ? SqlCommon::defaultDbFilePath() : cfg.eventDbPath;
				SystemLogger::init(dbPath);
				SystemLogger::info("APP", "Logger initialized", dbPath);

				QObject::connect(&app, &QCoreApplication::aboutToQuit, []{
						SystemLogger::info("APP", "aboutToQuit");
				});

				int rc = -1;
				{
						GuardEngine engine(cfg, adapter);
						ConsoleShell shell;
						GuardPresenter presenter(&engine, &shell, feed);

						if (!shell.attach()) {
								qCritical() << "[main] console attach failed";
						} else if (!engine.start()) {
								qCritical() << "[main] engine start failed";
						} else {
								shell.showMessage(QString("guard running (source=%1). Type to talk, /status, /label, /quit").arg(cfg.source));
								rc = app.exec();
						}

						engine.stop();
				}

				feed->close();
				SystemLogger::shutdown();
				return rc;
		} catch (const ConfigError& e) {
				qCritical() << "[" << __func__ << "] Configuration error: " << e.what();
				return 2;
		} catch (const std::exception& e) {
				qCritical() << "[" << __func__ << "] Fatal exception: " << e.what();
		}

		return -1;
}

#pragma once
#include <QObject>
#include <QFile>
#include <QSocketNotifier>
#include <QString>
#include <QTextStream>

#include "include/types.hpp"

// UI/음성 셸 대용: 표준입력 한 줄 = 사용자 발화 또는 명령
//
//   <text>                         발화
//   /label trusted|untrusted|none  외부 얼굴 매처 결과 게시
//   /status                        판정/단계 출력
//   /quit                          종료
class ConsoleShell : public QObject {
	Q_OBJECT
public:
	explicit ConsoleShell(QObject* parent = nullptr);

	bool attach();		// stdin 감시 시작

	void showReply(const QString& reply, int level);
	void showStatus(bool verified, int level);
	void showMessage(const QString& msg);

	// 한 줄 해석 (테스트 가능하도록 공개)
	void handleLine(const QString& line);

	// 장치 버퍼에 완성된 줄이 남아있는 동안 모두 처리
	void drainBuffered(QIODevice& dev);

signals:
	void utteranceEntered(const QString& text);
	void labelPosted(TrustLabel label);
	void statusRequested();
	void quitRequested();

private slots:
	void onReadable();

private:
	QFile in_;
	QTextStream out_;
	QSocketNotifier* notifier_ = nullptr;
};

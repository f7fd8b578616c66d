#pragma once

#include <memory>
#include <QObject>

class GuardEngine;
class ConsoleShell;
class LabelFeedAdapter;

// 엔진 <-> 콘솔 셸 연결
class GuardPresenter : public QObject {
		Q_OBJECT

public:
				GuardPresenter(GuardEngine* engine, ConsoleShell* view,
						std::shared_ptr<LabelFeedAdapter> feed, QObject* parent = nullptr);

private:
				GuardEngine* engine;
				ConsoleShell* view;
				std::shared_ptr<LabelFeedAdapter> feed;
};

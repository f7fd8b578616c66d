#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(LC_APP)
Q_DECLARE_LOGGING_CATEGORY(LC_WINDOW)
Q_DECLARE_LOGGING_CATEGORY(LC_STATE)
Q_DECLARE_LOGGING_CATEGORY(LC_ESCALATION)
Q_DECLARE_LOGGING_CATEGORY(LC_SENSING)
Q_DECLARE_LOGGING_CATEGORY(LC_GENERATOR)

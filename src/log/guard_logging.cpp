#include "guard_logging.hpp"

Q_LOGGING_CATEGORY(LC_APP,		"guard.app")
Q_LOGGING_CATEGORY(LC_WINDOW,		"guard.window")
Q_LOGGING_CATEGORY(LC_STATE,		"guard.state")
Q_LOGGING_CATEGORY(LC_ESCALATION,	"guard.escalation")
Q_LOGGING_CATEGORY(LC_SENSING,		"guard.sensing")
Q_LOGGING_CATEGORY(LC_GENERATOR,	"guard.generator")

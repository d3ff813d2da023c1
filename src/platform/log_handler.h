#pragma once

#include <QString>
#include <QtGlobal>

namespace platform {
// Routes Qt logging through a handler that writes `[UTC time] [LEVEL] [model] message` lines
// to stderr and, when `log_file_path` is non-empty, to a session log kept open for the life
// of the process. The model tag is left out while no log subject is set.
// PMXKIT_DISABLE_QT_MESSAGE_HOOK=1 keeps Qt's default handler.
//
// Returns false when the log file cannot be opened; stderr logging is still installed.
bool install_log_handler(const QString& log_file_path = QString(), QString* error = nullptr);

// Empty when no log file is in use.
QString session_log_path();

// Formats one handler line (without the trailing newline) for the current log subject.
QString format_log_line(QtMsgType type, const QString& message);

QString log_subject();

// Tags every line logged while it is alive with `subject`, usually the file name of the model
// being parsed. Restores the previous subject on destruction.
class ScopedLogSubject {
public:
	explicit ScopedLogSubject(const QString& subject);
	~ScopedLogSubject();

	ScopedLogSubject(const ScopedLogSubject&) = delete;
	ScopedLogSubject& operator=(const ScopedLogSubject&) = delete;

private:
	QString previous_;
};
}  // namespace platform

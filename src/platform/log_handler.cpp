#include "platform/log_handler.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMessageLogContext>
#include <QMutex>
#include <QMutexLocker>

#include <atomic>
#include <cstdio>
#include <cstdlib>

#include "pmxkit_config.h"

namespace {
struct LogState {
	QMutex mutex;
	QFile session_log;
	QString subject;
	std::atomic<bool> installed{false};
};

LogState& log_state() {
	static LogState state;
	return state;
}

QString level_tag(QtMsgType type) {
	switch (type) {
		case QtDebugMsg:
			return "DEBUG";
		case QtInfoMsg:
			return "INFO";
		case QtWarningMsg:
			return "WARN";
		case QtCriticalMsg:
			return "ERROR";
		case QtFatalMsg:
			return "FATAL";
	}
	return "LOG";
}

bool hook_disabled() {
	const QString value = qEnvironmentVariable("PMXKIT_DISABLE_QT_MESSAGE_HOOK").trimmed().toLower();
	return value == "1" || value == "true" || value == "yes" || value == "on";
}

void write_stderr(const QByteArray& bytes) {
	std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stderr);
	std::fflush(stderr);
}

void pmx_message_handler(QtMsgType type, const QMessageLogContext& context, const QString& message) {
	// QFile may itself warn while the session log is being written.
	static thread_local bool writing = false;
	if (writing) {
		write_stderr(message.toLocal8Bit() + '\n');
		return;
	}
	writing = true;

	QString line = platform::format_log_line(type, message);
	if (type == QtDebugMsg && context.file && *context.file) {
		line += QString(" (%1:%2)").arg(QFileInfo(QString::fromUtf8(context.file)).fileName()).arg(context.line);
	}
	QByteArray bytes = line.toUtf8();
	bytes.append('\n');

	LogState& state = log_state();
	{
		QMutexLocker lock(&state.mutex);
		if (state.session_log.isOpen()) {
			state.session_log.write(bytes);
			state.session_log.flush();
		}
	}
	write_stderr(bytes);
	writing = false;

	if (type == QtFatalMsg) {
		std::abort();
	}
}
}  // namespace

namespace platform {
bool install_log_handler(const QString& log_file_path, QString* error) {
	if (error) {
		error->clear();
	}
	LogState& state = log_state();
	if (state.installed.exchange(true)) {
		return true;
	}

	bool ok = true;
	if (!log_file_path.isEmpty()) {
		const QString path = QDir::cleanPath(QFileInfo(log_file_path).absoluteFilePath());
		QMutexLocker lock(&state.mutex);
		state.session_log.setFileName(path);
		if (state.session_log.open(QIODevice::WriteOnly | QIODevice::Append)) {
			const QString header = QString("PmxKit %1 session log\nStarted (UTC): %2\nPID: %3\n\n")
			                         .arg(QString::fromLatin1(PMXKIT_VERSION))
			                         .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs))
			                         .arg(QCoreApplication::applicationPid());
			state.session_log.write(header.toUtf8());
			state.session_log.flush();
		} else {
			if (error) {
				*error = QString("Unable to open log file %1: %2")
				           .arg(QDir::toNativeSeparators(path), state.session_log.errorString());
			}
			state.session_log.setFileName(QString());
			ok = false;
		}
	}

	if (!hook_disabled()) {
		qInstallMessageHandler(pmx_message_handler);
	}
	return ok;
}

QString session_log_path() {
	LogState& state = log_state();
	QMutexLocker lock(&state.mutex);
	return state.session_log.isOpen() ? state.session_log.fileName() : QString();
}

QString format_log_line(QtMsgType type, const QString& message) {
	const QString now = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
	const QString subject = log_subject();
	if (subject.isEmpty()) {
		return QString("[%1] [%2] %3").arg(now, level_tag(type), message);
	}
	return QString("[%1] [%2] [%3] %4").arg(now, level_tag(type), subject, message);
}

QString log_subject() {
	LogState& state = log_state();
	QMutexLocker lock(&state.mutex);
	return state.subject;
}

ScopedLogSubject::ScopedLogSubject(const QString& subject) {
	LogState& state = log_state();
	QMutexLocker lock(&state.mutex);
	previous_ = state.subject;
	state.subject = subject;
}

ScopedLogSubject::~ScopedLogSubject() {
	LogState& state = log_state();
	QMutexLocker lock(&state.mutex);
	state.subject = previous_;
}
}  // namespace platform

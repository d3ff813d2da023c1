#include <QCoreApplication>
#include <QDebug>
#include <QLoggingCategory>
#include <QTextStream>

#include "cli/probe_cli.h"
#include "platform/log_handler.h"
#include "pmxkit_config.h"

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);
  QCoreApplication::setApplicationName("pmx_probe");
  QCoreApplication::setApplicationVersion(PMXKIT_VERSION);

  ProbeOptions options;
  QString output;
  const ProbeParseResult parsed = parse_probe_cli(app.arguments(), options, &output);
  if (parsed != ProbeParseResult::Ok) {
    QTextStream stream(parsed == ProbeParseResult::ExitOk ? stdout : stderr);
    stream << output;
    return parsed == ProbeParseResult::ExitOk ? 0 : 2;
  }

  if (options.quiet) {
    QLoggingCategory::setFilterRules("*.info=false");
  }

  QString log_error;
  if (!platform::install_log_handler(options.log_file, &log_error)) {
    qWarning().noquote() << log_error;
  }

  return run_probe(options);
}

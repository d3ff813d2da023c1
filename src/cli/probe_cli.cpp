#include "cli/probe_cli.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QTextStream>

#include "platform/log_handler.h"
#include "pmx/pmx_report.h"

namespace {
QString normalize_output(const QString& text) {
  return text.endsWith('\n') ? text : text + '\n';
}
}  // namespace

ProbeParseResult parse_probe_cli(const QStringList& arguments, ProbeOptions& options, QString* output) {
  QCommandLineParser parser;
  parser.setApplicationDescription("Parses a PMX 2.0/2.1 model and prints what it contains.");
  parser.addHelpOption();
  parser.addVersionOption();

  const QCommandLineOption all_violations_option(
    "all-violations",
    "Report every dangling reference instead of stopping at the first.");
  const QCommandLineOption max_records_option(
    "max-records",
    "Reject section and list counts above this value (default 16777216).",
    "count");
  const QCommandLineOption json_option({"j", "json"}, "Print the whole document as JSON.");
  const QCommandLineOption quiet_option({"q", "quiet"}, "Only report failures.");
  const QCommandLineOption log_file_option("log-file", "Also append log lines to this file.", "path");

  parser.addOption(all_violations_option);
  parser.addOption(max_records_option);
  parser.addOption(json_option);
  parser.addOption(quiet_option);
  parser.addOption(log_file_option);
  parser.addPositionalArgument("file", "Path to a .pmx model.");

  if (!parser.parse(arguments)) {
    if (output) {
      *output = normalize_output(parser.errorText()) + '\n' + parser.helpText();
    }
    return ProbeParseResult::ExitError;
  }

  if (parser.isSet("help")) {
    if (output) {
      *output = parser.helpText();
    }
    return ProbeParseResult::ExitOk;
  }

  if (parser.isSet("version")) {
    if (output) {
      *output = normalize_output(QCoreApplication::applicationName() + ' ' + QCoreApplication::applicationVersion());
    }
    return ProbeParseResult::ExitOk;
  }

  options.parse.collect_all_violations = parser.isSet(all_violations_option);
  options.json = parser.isSet(json_option);
  options.quiet = parser.isSet(quiet_option);
  options.log_file = parser.value(log_file_option);

  if (parser.isSet(max_records_option)) {
    bool ok = false;
    const int max_records = parser.value(max_records_option).toInt(&ok);
    if (!ok || max_records <= 0) {
      if (output) {
        *output = normalize_output(
          QString("Invalid --max-records value: %1").arg(parser.value(max_records_option)));
      }
      return ProbeParseResult::ExitError;
    }
    options.parse.max_record_count = max_records;
  }

  const QStringList positional = parser.positionalArguments();
  if (positional.isEmpty()) {
    if (output) {
      *output = normalize_output("Missing model path.") + '\n' + parser.helpText();
    }
    return ProbeParseResult::ExitError;
  }
  if (positional.size() > 1) {
    if (output) {
      *output = normalize_output("Only one model path may be given.");
    }
    return ProbeParseResult::ExitError;
  }
  options.pmx_path = positional.first();
  return ProbeParseResult::Ok;
}

int run_probe(const ProbeOptions& options) {
  QTextStream out(stdout);

  const QString file_path = QFileInfo(options.pmx_path).absoluteFilePath();
  const platform::ScopedLogSubject subject(QFileInfo(file_path).fileName());
  QFile f(file_path);
  if (!f.open(QIODevice::ReadOnly)) {
    qCritical().noquote() << QString("Unable to open %1: %2").arg(QDir::toNativeSeparators(file_path), f.errorString());
    return 2;
  }
  const QByteArray bytes = f.readAll();
  f.close();

  if (!options.quiet) {
    qInfo().noquote() << QString("Parsing %1 (%2 bytes)").arg(QDir::toNativeSeparators(file_path)).arg(bytes.size());
  }

  PmxError error;
  QVector<PmxError> violations;
  const std::optional<PmxDocument> doc = parse_pmx(bytes, options.parse, &error, &violations);
  if (!doc) {
    qCritical().noquote() << QString("%1: %2").arg(pmx_error_kind_name(error.kind), error.message());
    for (int i = 1; i < violations.size(); ++i) {
      qWarning().noquote() << violations[i].message();
    }
    if (violations.size() > 1) {
      qWarning().noquote() << QString("%1 dangling references in total.").arg(violations.size());
    }
    return 2;
  }

  if (options.json) {
    out << QJsonDocument(pmx_document_to_json(*doc)).toJson(QJsonDocument::Indented);
  } else if (!options.quiet) {
    out << describe_pmx_document(*doc);
  }
  return 0;
}

#pragma once

#include <QString>
#include <QStringList>

#include "pmx/pmx_document.h"

struct ProbeOptions {
  QString pmx_path;
  QString log_file;
  PmxParseOptions parse;
  bool json = false;
  bool quiet = false;
};

enum class ProbeParseResult {
  Ok,
  ExitOk,
  ExitError,
};

// Parses pmx_probe's command line (`arguments` includes the program name). Help, version and
// usage errors are rendered into `output`.
ProbeParseResult parse_probe_cli(const QStringList& arguments, ProbeOptions& options, QString* output);

// Loads, parses and reports one file. Returns the process exit code: 0 on success, 2 when the
// file cannot be read or fails to parse.
int run_probe(const ProbeOptions& options);

#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>
#include <QtGlobal>

#include "cli/probe_cli.h"
#include "platform/log_handler.h"
#include "pmx_test_builder.h"

namespace {
ProbeParseResult parse(const QStringList& args, ProbeOptions* options, QString* output = nullptr) {
  QString ignored;
  return parse_probe_cli(QStringList{"pmx_probe"} + args, *options, output ? output : &ignored);
}

QString write_file(const QTemporaryDir& dir, const QString& name, const QByteArray& bytes) {
  const QString path = dir.filePath(name);
  QFile f(path);
  EXPECT_TRUE(f.open(QIODevice::WriteOnly));
  f.write(bytes);
  f.close();
  return path;
}
}  // namespace

TEST(ProbeCli, ParsesPathAndFlags) {
  ProbeOptions options;
  ASSERT_EQ(parse({"--json", "--all-violations", "--max-records", "500", "--log-file", "probe.log", "miku.pmx"},
                  &options),
            ProbeParseResult::Ok);
  EXPECT_EQ(options.pmx_path, "miku.pmx");
  EXPECT_TRUE(options.json);
  EXPECT_FALSE(options.quiet);
  EXPECT_TRUE(options.parse.collect_all_violations);
  EXPECT_EQ(options.parse.max_record_count, 500);
  EXPECT_EQ(options.log_file, "probe.log");
}

TEST(ProbeCli, DefaultsKeepParserLimits) {
  ProbeOptions options;
  ASSERT_EQ(parse({"-q", "model.pmx"}, &options), ProbeParseResult::Ok);
  EXPECT_TRUE(options.quiet);
  EXPECT_FALSE(options.parse.collect_all_violations);
  EXPECT_EQ(options.parse.max_record_count, PmxParseOptions().max_record_count);
}

TEST(ProbeCli, RejectsBadMaxRecords) {
  for (const char* value : {"0", "-3", "lots"}) {
    ProbeOptions options;
    QString output;
    EXPECT_EQ(parse({"--max-records", value, "model.pmx"}, &options, &output), ProbeParseResult::ExitError) << value;
    EXPECT_TRUE(output.startsWith("Invalid --max-records value")) << output.toStdString();
  }
}

TEST(ProbeCli, RequiresExactlyOnePath) {
  ProbeOptions options;
  QString output;
  EXPECT_EQ(parse({}, &options, &output), ProbeParseResult::ExitError);
  EXPECT_TRUE(output.startsWith("Missing model path."));

  EXPECT_EQ(parse({"a.pmx", "b.pmx"}, &options, &output), ProbeParseResult::ExitError);
  EXPECT_EQ(output, "Only one model path may be given.\n");
}

TEST(ProbeCli, UnknownOptionIsAnError) {
  ProbeOptions options;
  QString output;
  EXPECT_EQ(parse({"--frobnicate", "a.pmx"}, &options, &output), ProbeParseResult::ExitError);
  EXPECT_TRUE(output.contains("frobnicate"));
}

TEST(ProbeCli, HelpExitsCleanly) {
  ProbeOptions options;
  QString output;
  EXPECT_EQ(parse({"--help"}, &options, &output), ProbeParseResult::ExitOk);
  EXPECT_TRUE(output.contains("--max-records"));
}

TEST(ProbeCli, RunProbeSucceedsOnValidModel) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  ProbeOptions options;
  options.quiet = true;
  options.pmx_path = write_file(dir, "minimal.pmx", minimal_pmx_builder().build());
  EXPECT_EQ(run_probe(options), 0);
}

TEST(ProbeCli, RunProbeFailsOnBrokenModel) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  PmxFileBuilder b;
  b.add_vertex(0);
  b.add_face(1, 1, 1);
  b.add_bone("root");

  ProbeOptions options;
  options.quiet = true;
  options.parse.collect_all_violations = true;
  options.pmx_path = write_file(dir, "dangling.pmx", b.build());
  EXPECT_EQ(run_probe(options), 2);

  options.pmx_path = write_file(dir, "short.pmx", minimal_pmx_builder().build().left(20));
  EXPECT_EQ(run_probe(options), 2);
}

TEST(ProbeCli, RunProbeFailsOnMissingFile) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  ProbeOptions options;
  options.quiet = true;
  options.pmx_path = dir.filePath("absent.pmx");
  EXPECT_EQ(run_probe(options), 2);
}

TEST(LogHandler, WritesSessionLog) {
  if (!qEnvironmentVariableIsEmpty("PMXKIT_DISABLE_QT_MESSAGE_HOOK")) {
    GTEST_SKIP() << "message hook disabled";
  }
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString path = dir.filePath("session.log");

  QString error;
  ASSERT_TRUE(platform::install_log_handler(path, &error)) << error.toStdString();
  EXPECT_EQ(platform::session_log_path(), path);
  qWarning("dangling bone 7");

  PmxFileBuilder b;
  b.add_vertex(0);
  b.add_face(0, 0, 4);
  b.add_bone("root");
  ProbeOptions options;
  options.quiet = true;
  options.pmx_path = write_file(dir, "dangling.pmx", b.build());
  EXPECT_EQ(run_probe(options), 2);
  qInstallMessageHandler(nullptr);

  QFile f(path);
  ASSERT_TRUE(f.open(QIODevice::ReadOnly));
  const QStringList lines = QString::fromUtf8(f.readAll()).split('\n', Qt::SkipEmptyParts);
  ASSERT_FALSE(lines.isEmpty());
  EXPECT_TRUE(lines.first().startsWith("PmxKit "));
  EXPECT_TRUE(lines.last().contains("[ERROR] [dangling.pmx] DanglingReference: ")) << lines.last().toStdString();

  bool untagged_warning = false;
  for (const QString& line : lines) {
    untagged_warning |= line.endsWith("[WARN] dangling bone 7");
  }
  EXPECT_TRUE(untagged_warning);
}

TEST(LogHandler, TagsLinesWithTheModelBeingParsed) {
  EXPECT_TRUE(platform::format_log_line(QtInfoMsg, "loaded").endsWith("] [INFO] loaded"));
  {
    const platform::ScopedLogSubject outer("miku.pmx");
    EXPECT_TRUE(platform::format_log_line(QtWarningMsg, "odd").endsWith("] [WARN] [miku.pmx] odd"));
    {
      const platform::ScopedLogSubject inner("luka.pmx");
      EXPECT_EQ(platform::log_subject(), "luka.pmx");
    }
    EXPECT_EQ(platform::log_subject(), "miku.pmx");
  }
  EXPECT_TRUE(platform::log_subject().isEmpty());
}

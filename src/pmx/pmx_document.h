#pragma once

#include <QByteArray>
#include <QVector>

#include <optional>

#include "pmx/pmx_error.h"
#include "pmx/pmx_types.h"

struct PmxParseOptions {
  // Keep validating after the first dangling reference and report every one of them.
  bool collect_all_violations = false;
  // Section and nested list counts above this are rejected as implausible.
  qint32 max_record_count = 0x1000000;
};

// Parses a complete PMX 2.0/2.1 file held in memory.
//
// Parsing is all-or-nothing: on failure std::nullopt is returned and `error` receives the
// first problem found. The returned document owns all of its data; `bytes` may be released
// as soon as the call returns.
[[nodiscard]] std::optional<PmxDocument> parse_pmx(const QByteArray& bytes, PmxError* error = nullptr);

// As above. When `options.collect_all_violations` is set and the reference post-pass fails,
// `violations` receives every dangling reference in section order.
[[nodiscard]] std::optional<PmxDocument> parse_pmx(const QByteArray& bytes,
                                                   const PmxParseOptions& options,
                                                   PmxError* error = nullptr,
                                                   QVector<PmxError>* violations = nullptr);

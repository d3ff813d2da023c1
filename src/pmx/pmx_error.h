#pragma once

#include <QString>
#include <QtGlobal>

enum class PmxErrorKind {
  TruncatedInput,
  MalformedHeader,
  UnsupportedVersion,
  InvalidCount,
  UnknownVariant,
  InvalidText,
  DanglingReference,
};

enum class PmxSection {
  None,
  Header,
  Vertex,
  Face,
  Texture,
  Material,
  Bone,
  Morph,
  DisplayFrame,
  RigidBody,
  Joint,
  SoftBody,
};

// A single fatal decode or validation failure.
//
// Which fields are meaningful depends on `kind`:
// - TruncatedInput: offset
// - MalformedHeader: offset, context
// - UnsupportedVersion: offset, version
// - InvalidCount: offset, section, value, context
// - UnknownVariant: offset, section, record_index, value (the tag), context
// - InvalidText: offset, section, record_index
// - DanglingReference: section, record_index, target_section, value, context
struct PmxError {
  PmxErrorKind kind = PmxErrorKind::TruncatedInput;
  qint64 offset = -1;  // Byte offset in the input, or -1 when the error is not tied to one.
  PmxSection section = PmxSection::None;
  int record_index = -1;
  PmxSection target_section = PmxSection::None;
  qint64 value = 0;
  float version = 0.0f;
  QString context;

  [[nodiscard]] QString message() const;
};

[[nodiscard]] QString pmx_error_kind_name(PmxErrorKind kind);
[[nodiscard]] QString pmx_section_name(PmxSection section);

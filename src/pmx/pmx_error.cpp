#include "pmx/pmx_error.h"

namespace {
QString offset_suffix(qint64 offset) {
  if (offset < 0) {
    return QString();
  }
  return QString(" at offset 0x%1").arg(offset, 0, 16);
}

QString record_label(PmxSection section, int record_index) {
  if (section == PmxSection::None) {
    return QString();
  }
  if (record_index < 0) {
    return pmx_section_name(section);
  }
  return QString("%1 #%2").arg(pmx_section_name(section)).arg(record_index);
}
}  // namespace

QString pmx_error_kind_name(PmxErrorKind kind) {
  switch (kind) {
    case PmxErrorKind::TruncatedInput:
      return "TruncatedInput";
    case PmxErrorKind::MalformedHeader:
      return "MalformedHeader";
    case PmxErrorKind::UnsupportedVersion:
      return "UnsupportedVersion";
    case PmxErrorKind::InvalidCount:
      return "InvalidCount";
    case PmxErrorKind::UnknownVariant:
      return "UnknownVariant";
    case PmxErrorKind::InvalidText:
      return "InvalidText";
    case PmxErrorKind::DanglingReference:
      return "DanglingReference";
  }
  return "Unknown";
}

QString pmx_section_name(PmxSection section) {
  switch (section) {
    case PmxSection::None:
      return "none";
    case PmxSection::Header:
      return "header";
    case PmxSection::Vertex:
      return "vertex";
    case PmxSection::Face:
      return "face";
    case PmxSection::Texture:
      return "texture";
    case PmxSection::Material:
      return "material";
    case PmxSection::Bone:
      return "bone";
    case PmxSection::Morph:
      return "morph";
    case PmxSection::DisplayFrame:
      return "display frame";
    case PmxSection::RigidBody:
      return "rigid body";
    case PmxSection::Joint:
      return "joint";
    case PmxSection::SoftBody:
      return "soft body";
  }
  return "unknown";
}

QString PmxError::message() const {
  const QString where = offset_suffix(offset);
  const QString record = record_label(section, record_index);
  switch (kind) {
    case PmxErrorKind::TruncatedInput:
      if (record.isEmpty()) {
        return QString("PMX data is truncated%1.").arg(where);
      }
      return QString("PMX data is truncated in %1%2.").arg(record, where);
    case PmxErrorKind::MalformedHeader:
      return QString("Not a valid PMX header%1 (%2).")
          .arg(where, context.isEmpty() ? QStringLiteral("bad signature") : context);
    case PmxErrorKind::UnsupportedVersion:
      return QString("PMX version %1 is not supported (expected 2.0 or 2.1).").arg(version);
    case PmxErrorKind::InvalidCount:
      return QString("Invalid %1 count %2 in %3%4.")
          .arg(context.isEmpty() ? QStringLiteral("record") : context)
          .arg(value)
          .arg(pmx_section_name(section), where);
    case PmxErrorKind::UnknownVariant:
      return QString("Unknown %1 %2 in %3%4.")
          .arg(context.isEmpty() ? QStringLiteral("tag") : context)
          .arg(value)
          .arg(record.isEmpty() ? pmx_section_name(section) : record, where);
    case PmxErrorKind::InvalidText:
      if (record.isEmpty()) {
        return QString("Invalid text encoding%1.").arg(where);
      }
      return QString("Invalid text encoding in %1%2.").arg(record, where);
    case PmxErrorKind::DanglingReference:
      return QString("%1 references %2 %3%4, which does not exist.")
          .arg(record.isEmpty() ? pmx_section_name(section) : record)
          .arg(pmx_section_name(target_section))
          .arg(value)
          .arg(context.isEmpty() ? QString() : QString(" (%1)").arg(context));
  }
  return "Unknown PMX error.";
}

#include "pmx/pmx_header.h"

#include <cmath>

namespace {
constexpr char kPmxSignature[4] = {'P', 'M', 'X', ' '};
constexpr int kRequiredGlobals = 8;
constexpr int kMaxAdditionalUvs = 4;
constexpr float kVersionTolerance = 0.001f;

const char* const kIndexWidthContexts[kPmxIndexKindCount] = {
    "vertex index width",
    "texture index width",
    "material index width",
    "bone index width",
    "morph index width",
    "rigid body index width",
};

bool is_valid_index_width(int width) {
  return width == 1 || width == 2 || width == 4;
}
}  // namespace

bool read_pmx_header(PmxCursor& cur, PmxHeader* out) {
  if (!out) {
    return false;
  }
  cur.begin_section(PmxSection::Header);
  if (!cur.ensure(kPmxFixedHeaderSize)) {
    return false;
  }

  const int signature_offset = cur.pos();
  QByteArray signature;
  if (!cur.read_bytes(4, &signature)) {
    return false;
  }
  if (signature != QByteArray(kPmxSignature, 4)) {
    PmxError e;
    e.kind = PmxErrorKind::MalformedHeader;
    e.offset = signature_offset;
    e.section = PmxSection::Header;
    e.context = "missing \"PMX \" signature";
    return cur.fail(e);
  }

  const int version_offset = cur.pos();
  float version = 0.0f;
  if (!cur.read_f32(&version)) {
    return false;
  }
  if (std::fabs(version - 2.0f) < kVersionTolerance) {
    out->version = PmxVersion::V2_0;
  } else if (std::fabs(version - 2.1f) < kVersionTolerance) {
    out->version = PmxVersion::V2_1;
  } else {
    PmxError e;
    e.kind = PmxErrorKind::UnsupportedVersion;
    e.offset = version_offset;
    e.section = PmxSection::Header;
    e.version = version;
    return cur.fail(e);
  }
  out->version_value = version;

  const int globals_count_offset = cur.pos();
  quint8 globals_count = 0;
  if (!cur.read_u8(&globals_count)) {
    return false;
  }
  if (globals_count < kRequiredGlobals) {
    PmxError e;
    e.kind = PmxErrorKind::MalformedHeader;
    e.offset = globals_count_offset;
    e.section = PmxSection::Header;
    e.value = globals_count;
    e.context = QString("%1 globals, expected at least %2").arg(globals_count).arg(kRequiredGlobals);
    return cur.fail(e);
  }

  const int globals_offset = cur.pos();
  QByteArray globals;
  if (!cur.read_bytes(globals_count, &globals)) {
    return false;
  }

  const quint8 encoding = static_cast<quint8>(globals[0]);
  if (encoding > 1) {
    return cur.fail_unknown_variant("text encoding", encoding, globals_offset);
  }
  out->encoding = encoding == 0 ? PmxTextEncoding::Utf16Le : PmxTextEncoding::Utf8;

  const quint8 additional_uvs = static_cast<quint8>(globals[1]);
  if (additional_uvs > kMaxAdditionalUvs) {
    return cur.fail_invalid_count("additional UV", additional_uvs, globals_offset + 1);
  }
  out->additional_uv_count = additional_uvs;

  for (int i = 0; i < kPmxIndexKindCount; ++i) {
    const int width = static_cast<quint8>(globals[2 + i]);
    if (!is_valid_index_width(width)) {
      return cur.fail_unknown_variant(kIndexWidthContexts[i], width, globals_offset + 2 + i);
    }
    out->index_widths[i] = width;
  }

  cur.configure(out->encoding, out->index_widths);

  return cur.read_text(&out->model_name) && cur.read_text(&out->model_name_universal) &&
         cur.read_text(&out->comment) && cur.read_text(&out->comment_universal);
}

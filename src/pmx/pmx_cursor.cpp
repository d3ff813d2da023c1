#include "pmx/pmx_cursor.h"

#include <cstring>

#include <QByteArrayView>
#include <QStringDecoder>

namespace {
QString index_kind_label(PmxIndexKind kind) {
  switch (kind) {
    case PmxIndexKind::Vertex:
      return "vertex";
    case PmxIndexKind::Texture:
      return "texture";
    case PmxIndexKind::Material:
      return "material";
    case PmxIndexKind::Bone:
      return "bone";
    case PmxIndexKind::Morph:
      return "morph";
    case PmxIndexKind::RigidBody:
      return "rigid body";
  }
  return "unknown";
}

bool has_paired_surrogates(const QString& text) {
  const int n = static_cast<int>(text.size());
  for (int i = 0; i < n; ++i) {
    const QChar c = text[i];
    if (c.isHighSurrogate()) {
      if (i + 1 >= n || !text[i + 1].isLowSurrogate()) {
        return false;
      }
      ++i;
      continue;
    }
    if (c.isLowSurrogate()) {
      return false;
    }
  }
  return true;
}
}  // namespace

PmxCursor::PmxCursor(const QByteArray& bytes) : bytes_(&bytes) {}

void PmxCursor::configure(PmxTextEncoding encoding, const std::array<int, kPmxIndexKindCount>& index_widths) {
  encoding_ = encoding;
  index_widths_ = index_widths;
  for (int i = 0; i < kPmxIndexKindCount; ++i) {
    index_readers_[i] = index_reader_for(static_cast<PmxIndexKind>(i), index_widths[i]);
  }
}

bool PmxCursor::can_read(qint64 n) const {
  if (!bytes_ || n < 0) {
    return false;
  }
  return static_cast<qint64>(pos_) + n <= static_cast<qint64>(bytes_->size());
}

bool PmxCursor::ensure(qint64 n) {
  if (failed_) {
    return false;
  }
  if (!can_read(n)) {
    return fail_truncated(pos_);
  }
  return true;
}

bool PmxCursor::skip(qint64 n) {
  if (!ensure(n)) {
    return false;
  }
  pos_ += static_cast<int>(n);
  return true;
}

bool PmxCursor::read_bytes(qint64 n, QByteArray* out) {
  if (!ensure(n)) {
    return false;
  }
  if (out) {
    *out = bytes_->mid(pos_, static_cast<int>(n));
  }
  pos_ += static_cast<int>(n);
  return true;
}

bool PmxCursor::read_u8(quint8* out) {
  if (!ensure(1) || !out) {
    return false;
  }
  *out = byte_at(pos_);
  ++pos_;
  return true;
}

bool PmxCursor::read_i8(qint8* out) {
  quint8 u = 0;
  if (!read_u8(&u) || !out) {
    return false;
  }
  *out = static_cast<qint8>(u);
  return true;
}

bool PmxCursor::read_u16(quint16* out) {
  if (!ensure(2) || !out) {
    return false;
  }
  const quint8 b0 = byte_at(pos_ + 0);
  const quint8 b1 = byte_at(pos_ + 1);
  *out = static_cast<quint16>(b0 | (b1 << 8));
  pos_ += 2;
  return true;
}

bool PmxCursor::read_i16(qint16* out) {
  quint16 u = 0;
  if (!read_u16(&u) || !out) {
    return false;
  }
  *out = static_cast<qint16>(u);
  return true;
}

bool PmxCursor::read_i32(qint32* out) {
  if (!ensure(4) || !out) {
    return false;
  }
  const quint8 b0 = byte_at(pos_ + 0);
  const quint8 b1 = byte_at(pos_ + 1);
  const quint8 b2 = byte_at(pos_ + 2);
  const quint8 b3 = byte_at(pos_ + 3);
  const quint32 u = static_cast<quint32>(b0) | (static_cast<quint32>(b1) << 8) |
                    (static_cast<quint32>(b2) << 16) | (static_cast<quint32>(b3) << 24);
  *out = static_cast<qint32>(u);
  pos_ += 4;
  return true;
}

bool PmxCursor::read_f32(float* out) {
  qint32 v = 0;
  if (!read_i32(&v) || !out) {
    return false;
  }
  static_assert(sizeof(float) == sizeof(qint32));
  const quint32 u = static_cast<quint32>(v);
  float f = 0.0f;
  std::memcpy(&f, &u, sizeof(float));
  *out = f;
  return true;
}

bool PmxCursor::read_vec2(QVector2D* out) {
  float v[2]{};
  if (!ensure(8) || !read_f32(&v[0]) || !read_f32(&v[1]) || !out) {
    return false;
  }
  *out = QVector2D(v[0], v[1]);
  return true;
}

bool PmxCursor::read_vec3(QVector3D* out) {
  float v[3]{};
  if (!ensure(12) || !read_f32(&v[0]) || !read_f32(&v[1]) || !read_f32(&v[2]) || !out) {
    return false;
  }
  *out = QVector3D(v[0], v[1], v[2]);
  return true;
}

bool PmxCursor::read_vec4(QVector4D* out) {
  float v[4]{};
  if (!ensure(16) || !read_f32(&v[0]) || !read_f32(&v[1]) || !read_f32(&v[2]) || !read_f32(&v[3]) || !out) {
    return false;
  }
  *out = QVector4D(v[0], v[1], v[2], v[3]);
  return true;
}

bool PmxCursor::read_bool(bool* out) {
  quint8 u = 0;
  if (!read_u8(&u) || !out) {
    return false;
  }
  *out = u != 0;
  return true;
}

bool PmxCursor::read_index_u8(PmxCursor& cur, qint32* out) {
  quint8 v = 0;
  if (!cur.read_u8(&v)) {
    return false;
  }
  *out = v;
  return true;
}

bool PmxCursor::read_index_u16(PmxCursor& cur, qint32* out) {
  quint16 v = 0;
  if (!cur.read_u16(&v)) {
    return false;
  }
  *out = v;
  return true;
}

bool PmxCursor::read_index_i8(PmxCursor& cur, qint32* out) {
  qint8 v = 0;
  if (!cur.read_i8(&v)) {
    return false;
  }
  *out = v;
  return true;
}

bool PmxCursor::read_index_i16(PmxCursor& cur, qint32* out) {
  qint16 v = 0;
  if (!cur.read_i16(&v)) {
    return false;
  }
  *out = v;
  return true;
}

bool PmxCursor::read_index_i32(PmxCursor& cur, qint32* out) {
  return cur.read_i32(out);
}

PmxCursor::IndexReadFn PmxCursor::index_reader_for(PmxIndexKind kind, int width) {
  // Vertex indices are unsigned below 4 bytes; every other kind is signed so that -1 can
  // mean "none".
  const bool vertex = kind == PmxIndexKind::Vertex;
  switch (width) {
    case 1:
      return vertex ? &PmxCursor::read_index_u8 : &PmxCursor::read_index_i8;
    case 2:
      return vertex ? &PmxCursor::read_index_u16 : &PmxCursor::read_index_i16;
    case 4:
      return &PmxCursor::read_index_i32;
    default:
      return nullptr;
  }
}

bool PmxCursor::read_index(PmxIndexKind kind, qint32* out) {
  if (failed_ || !out) {
    return false;
  }
  const IndexReadFn fn = index_readers_[static_cast<int>(kind)];
  if (!fn) {
    return fail_unknown_variant(index_kind_label(kind) + " index width", index_width(kind), pos_);
  }
  return fn(*this, out);
}

bool PmxCursor::read_text(QString* out) {
  const int length_offset = pos_;
  qint32 length = 0;
  if (!read_i32(&length)) {
    return false;
  }
  if (length < 0) {
    pos_ = length_offset;
    return fail_invalid_count("text length", length, length_offset);
  }
  if (!ensure(length)) {
    return false;
  }

  const int text_offset = pos_;
  const QByteArrayView raw(bytes_->constData() + pos_, length);
  QString text;
  bool valid = true;
  if (encoding_ == PmxTextEncoding::Utf16Le) {
    if ((length & 1) != 0) {
      valid = false;
    } else {
      QStringDecoder decoder(QStringConverter::Utf16LE, QStringConverter::Flag::ConvertInitialBom);
      text = decoder.decode(raw);
      valid = !decoder.hasError() && has_paired_surrogates(text);
    }
  } else {
    QStringDecoder decoder(QStringConverter::Utf8, QStringConverter::Flag::ConvertInitialBom);
    text = decoder.decode(raw);
    valid = !decoder.hasError();
  }

  if (!valid) {
    PmxError e;
    e.kind = PmxErrorKind::InvalidText;
    e.offset = text_offset;
    e.section = section_;
    e.record_index = record_;
    e.context = encoding_ == PmxTextEncoding::Utf16Le ? "UTF-16LE" : "UTF-8";
    return fail(e);
  }

  pos_ += length;
  if (out) {
    *out = text;
  }
  return true;
}

bool PmxCursor::read_count(const QString& context, qint32* out) {
  const int count_offset = pos_;
  qint32 count = 0;
  if (!read_i32(&count) || !out) {
    return false;
  }
  if (count < 0 || count > max_record_count_) {
    pos_ = count_offset;
    return fail_invalid_count(context, count, count_offset);
  }
  *out = count;
  return true;
}

int PmxCursor::reserve_hint(qint32 count, int min_record_size) const {
  if (count <= 0) {
    return 0;
  }
  if (min_record_size <= 0) {
    return count;
  }
  return static_cast<int>(qMin<qint64>(count, remaining() / min_record_size));
}

bool PmxCursor::fail(const PmxError& error) {
  if (!failed_) {
    failed_ = true;
    error_ = error;
  }
  return false;
}

bool PmxCursor::fail_truncated(qint64 offset) {
  PmxError e;
  e.kind = PmxErrorKind::TruncatedInput;
  e.offset = offset;
  e.section = section_;
  e.record_index = record_;
  return fail(e);
}

bool PmxCursor::fail_unknown_variant(const QString& context, qint64 tag, qint64 tag_offset) {
  PmxError e;
  e.kind = PmxErrorKind::UnknownVariant;
  e.offset = tag_offset;
  e.section = section_;
  e.record_index = record_;
  e.value = tag;
  e.context = context;
  return fail(e);
}

bool PmxCursor::fail_invalid_count(const QString& context, qint64 value, qint64 count_offset) {
  PmxError e;
  e.kind = PmxErrorKind::InvalidCount;
  e.offset = count_offset;
  e.section = section_;
  e.record_index = record_;
  e.value = value;
  e.context = context;
  return fail(e);
}

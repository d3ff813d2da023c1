#pragma once

#include <QByteArray>
#include <QString>
#include <QVector2D>
#include <QVector3D>
#include <QVector4D>
#include <QtGlobal>

#include <array>

#include "pmx/pmx_error.h"
#include "pmx/pmx_types.h"

// Bounds-checked little-endian reader over a PMX buffer.
//
// Every read either succeeds and advances, or fails, records a PmxError and leaves the
// position where the failing field starts. Only the first error is kept; readers return
// false all the way up once something fails.
class PmxCursor {
public:
  explicit PmxCursor(const QByteArray& bytes);

  // Selects the text decoder and the per-kind index decoders. Must be called once the
  // header globals are known and before any text or index read.
  void configure(PmxTextEncoding encoding, const std::array<int, kPmxIndexKindCount>& index_widths);

  void set_max_record_count(qint32 max_count) { max_record_count_ = max_count; }

  int pos() const { return pos_; }
  int size() const { return bytes_ ? static_cast<int>(bytes_->size()) : 0; }
  int remaining() const { return size() - pos_; }
  bool at_end() const { return pos_ >= size(); }

  // Context stamped on UnknownVariant/InvalidText/InvalidCount errors.
  void begin_section(PmxSection section) {
    section_ = section;
    record_ = -1;
  }
  void set_record(int record) { record_ = record; }
  PmxSection section() const { return section_; }

  bool failed() const { return failed_; }
  const PmxError& error() const { return error_; }

  bool can_read(qint64 n) const;
  bool ensure(qint64 n);
  bool skip(qint64 n);
  bool read_bytes(qint64 n, QByteArray* out);

  bool read_u8(quint8* out);
  bool read_i8(qint8* out);
  bool read_u16(quint16* out);
  bool read_i16(qint16* out);
  bool read_i32(qint32* out);
  bool read_f32(float* out);
  bool read_vec2(QVector2D* out);
  bool read_vec3(QVector3D* out);
  bool read_vec4(QVector4D* out);
  bool read_bool(bool* out);

  bool read_index(PmxIndexKind kind, qint32* out);
  int index_width(PmxIndexKind kind) const { return index_widths_[static_cast<int>(kind)]; }

  // Length-prefixed string in the configured encoding.
  bool read_text(QString* out);

  // Signed 32-bit record count. Negative or above the configured maximum is InvalidCount.
  bool read_count(const QString& context, qint32* out);

  // How many records of at least `min_record_size` bytes could still fit; used to cap
  // up-front reservations for counts that the rest of the buffer cannot back.
  int reserve_hint(qint32 count, int min_record_size) const;

  bool fail(const PmxError& error);
  bool fail_truncated(qint64 offset);
  bool fail_unknown_variant(const QString& context, qint64 tag, qint64 tag_offset);
  bool fail_invalid_count(const QString& context, qint64 value, qint64 count_offset);

private:
  using IndexReadFn = bool (*)(PmxCursor&, qint32*);

  static bool read_index_u8(PmxCursor& cur, qint32* out);
  static bool read_index_u16(PmxCursor& cur, qint32* out);
  static bool read_index_i8(PmxCursor& cur, qint32* out);
  static bool read_index_i16(PmxCursor& cur, qint32* out);
  static bool read_index_i32(PmxCursor& cur, qint32* out);
  static IndexReadFn index_reader_for(PmxIndexKind kind, int width);

  quint8 byte_at(int p) const { return static_cast<quint8>((*bytes_)[p]); }

  const QByteArray* bytes_ = nullptr;
  int pos_ = 0;
  qint32 max_record_count_ = 0x1000000;
  PmxTextEncoding encoding_ = PmxTextEncoding::Utf16Le;
  std::array<int, kPmxIndexKindCount> index_widths_{{0, 0, 0, 0, 0, 0}};
  std::array<IndexReadFn, kPmxIndexKindCount> index_readers_{};
  PmxSection section_ = PmxSection::None;
  int record_ = -1;
  bool failed_ = false;
  PmxError error_;
};

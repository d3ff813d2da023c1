#include "pmx/pmx_sections.h"

#include <utility>

bool read_pmx_display_frames(PmxCursor& cur, const PmxHeader&, QVector<PmxDisplayFrame>* out) {
  if (!out) {
    return false;
  }
  cur.begin_section(PmxSection::DisplayFrame);
  out->clear();

  qint32 count = 0;
  if (!cur.read_count("display frame", &count)) {
    return false;
  }
  out->reserve(cur.reserve_hint(count, 4 + 4 + 1 + 4));

  for (int i = 0; i < count; ++i) {
    cur.set_record(i);
    PmxDisplayFrame frame;
    if (!cur.read_text(&frame.name) || !cur.read_text(&frame.name_universal) || !cur.read_bool(&frame.special)) {
      return false;
    }

    qint32 item_count = 0;
    if (!cur.read_count("display item", &item_count)) {
      return false;
    }
    frame.items.reserve(cur.reserve_hint(item_count, 2));
    for (int k = 0; k < item_count; ++k) {
      const int tag_offset = cur.pos();
      quint8 tag = 0;
      if (!cur.read_u8(&tag)) {
        return false;
      }
      PmxDisplayItem item;
      if (tag == 0) {
        item.target = PmxDisplayTarget::Bone;
        if (!cur.read_index(PmxIndexKind::Bone, &item.index)) {
          return false;
        }
      } else if (tag == 1) {
        item.target = PmxDisplayTarget::Morph;
        if (!cur.read_index(PmxIndexKind::Morph, &item.index)) {
          return false;
        }
      } else {
        return cur.fail_unknown_variant("display item type", tag, tag_offset);
      }
      frame.items.push_back(item);
    }
    out->push_back(std::move(frame));
  }
  return true;
}

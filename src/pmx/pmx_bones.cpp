#include "pmx/pmx_sections.h"

#include <utility>

namespace {
bool read_ik(PmxCursor& cur, PmxBoneIk* out) {
  if (!cur.read_index(PmxIndexKind::Bone, &out->target) || !cur.read_i32(&out->loop_count) ||
      !cur.read_f32(&out->limit_angle)) {
    return false;
  }

  qint32 link_count = 0;
  if (!cur.read_count("IK link", &link_count)) {
    return false;
  }
  out->links.reserve(cur.reserve_hint(link_count, cur.index_width(PmxIndexKind::Bone) + 1));
  for (int i = 0; i < link_count; ++i) {
    PmxIkLink link;
    bool limited = false;
    if (!cur.read_index(PmxIndexKind::Bone, &link.bone) || !cur.read_bool(&limited)) {
      return false;
    }
    if (limited) {
      PmxIkAngleLimit limit;
      if (!cur.read_vec3(&limit.min) || !cur.read_vec3(&limit.max)) {
        return false;
      }
      link.limit = limit;
    }
    out->links.push_back(link);
  }
  return true;
}

bool read_bone(PmxCursor& cur, PmxBone* b) {
  if (!cur.read_text(&b->name) || !cur.read_text(&b->name_universal)) {
    return false;
  }
  if (!cur.read_vec3(&b->position) || !cur.read_index(PmxIndexKind::Bone, &b->parent) || !cur.read_i32(&b->layer) ||
      !cur.read_u16(&b->flags)) {
    return false;
  }

  if (b->has_flag(kPmxBoneTailIsBone)) {
    PmxBoneTailBone tail;
    if (!cur.read_index(PmxIndexKind::Bone, &tail.bone)) {
      return false;
    }
    b->tail = tail;
  } else {
    PmxBoneTailOffset tail;
    if (!cur.read_vec3(&tail.offset)) {
      return false;
    }
    b->tail = tail;
  }

  if (b->has_flag(kPmxBoneInheritRotation) || b->has_flag(kPmxBoneInheritTranslation)) {
    PmxBoneInherit inherit;
    if (!cur.read_index(PmxIndexKind::Bone, &inherit.parent) || !cur.read_f32(&inherit.ratio)) {
      return false;
    }
    b->inherit = inherit;
  }

  if (b->has_flag(kPmxBoneFixedAxis)) {
    QVector3D axis;
    if (!cur.read_vec3(&axis)) {
      return false;
    }
    b->fixed_axis = axis;
  }

  if (b->has_flag(kPmxBoneLocalAxes)) {
    PmxBoneLocalAxes axes;
    if (!cur.read_vec3(&axes.x) || !cur.read_vec3(&axes.z)) {
      return false;
    }
    b->local_axes = axes;
  }

  if (b->has_flag(kPmxBoneExternalParent)) {
    qint32 key = 0;
    if (!cur.read_i32(&key)) {
      return false;
    }
    b->external_parent = key;
  }

  if (b->has_flag(kPmxBoneIk)) {
    PmxBoneIk ik;
    if (!read_ik(cur, &ik)) {
      return false;
    }
    b->ik = std::move(ik);
  }
  return true;
}
}  // namespace

bool read_pmx_bones(PmxCursor& cur, const PmxHeader& header, QVector<PmxBone>* out) {
  if (!out) {
    return false;
  }
  cur.begin_section(PmxSection::Bone);
  out->clear();

  qint32 count = 0;
  if (!cur.read_count("bone", &count)) {
    return false;
  }
  const int bone_width = header.index_width(PmxIndexKind::Bone);
  out->reserve(cur.reserve_hint(count, 4 + 4 + 12 + bone_width + 4 + 2 + bone_width));

  for (int i = 0; i < count; ++i) {
    cur.set_record(i);
    PmxBone b;
    if (!read_bone(cur, &b)) {
      return false;
    }
    out->push_back(std::move(b));
  }
  return true;
}

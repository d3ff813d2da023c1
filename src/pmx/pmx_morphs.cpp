#include "pmx/pmx_sections.h"

#include <utility>

namespace {
template <typename Offset, typename ReadOne>
bool read_offsets(PmxCursor& cur, qint32 count, int min_size, ReadOne read_one, PmxMorphOffsets* out) {
  QVector<Offset> offsets;
  offsets.reserve(cur.reserve_hint(count, min_size));
  for (int i = 0; i < count; ++i) {
    Offset o;
    if (!read_one(cur, &o)) {
      return false;
    }
    offsets.push_back(o);
  }
  *out = std::move(offsets);
  return true;
}

bool read_group_offset(PmxCursor& cur, PmxGroupMorphOffset* o) {
  return cur.read_index(PmxIndexKind::Morph, &o->morph) && cur.read_f32(&o->weight);
}

bool read_vertex_offset(PmxCursor& cur, PmxVertexMorphOffset* o) {
  return cur.read_index(PmxIndexKind::Vertex, &o->vertex) && cur.read_vec3(&o->translation);
}

bool read_bone_offset(PmxCursor& cur, PmxBoneMorphOffset* o) {
  return cur.read_index(PmxIndexKind::Bone, &o->bone) && cur.read_vec3(&o->translation) &&
         cur.read_vec4(&o->rotation);
}

bool read_uv_offset(PmxCursor& cur, PmxUvMorphOffset* o) {
  return cur.read_index(PmxIndexKind::Vertex, &o->vertex) && cur.read_vec4(&o->delta);
}

bool read_material_offset(PmxCursor& cur, PmxMaterialMorphOffset* o) {
  if (!cur.read_index(PmxIndexKind::Material, &o->material)) {
    return false;
  }
  const int op_offset = cur.pos();
  quint8 op = 0;
  if (!cur.read_u8(&op)) {
    return false;
  }
  if (op > 1) {
    return cur.fail_unknown_variant("material morph operation", op, op_offset);
  }
  o->op = static_cast<PmxMaterialMorphOp>(op);
  return cur.read_vec4(&o->diffuse) && cur.read_vec3(&o->specular) && cur.read_f32(&o->specular_strength) &&
         cur.read_vec3(&o->ambient) && cur.read_vec4(&o->edge_color) && cur.read_f32(&o->edge_size) &&
         cur.read_vec4(&o->texture_tint) && cur.read_vec4(&o->sphere_tint) && cur.read_vec4(&o->toon_tint);
}

bool read_flip_offset(PmxCursor& cur, PmxFlipMorphOffset* o) {
  return cur.read_index(PmxIndexKind::Morph, &o->morph) && cur.read_f32(&o->weight);
}

bool read_impulse_offset(PmxCursor& cur, PmxImpulseMorphOffset* o) {
  return cur.read_index(PmxIndexKind::RigidBody, &o->rigid_body) && cur.read_bool(&o->local) &&
         cur.read_vec3(&o->velocity) && cur.read_vec3(&o->torque);
}

bool read_morph(PmxCursor& cur, PmxMorph* m) {
  if (!cur.read_text(&m->name) || !cur.read_text(&m->name_universal)) {
    return false;
  }

  const int panel_offset = cur.pos();
  quint8 panel = 0;
  if (!cur.read_u8(&panel)) {
    return false;
  }
  if (panel > 4) {
    return cur.fail_unknown_variant("morph panel", panel, panel_offset);
  }
  m->panel = static_cast<PmxMorphPanel>(panel);

  const int kind_offset = cur.pos();
  quint8 kind = 0;
  if (!cur.read_u8(&kind)) {
    return false;
  }
  if (kind > 10) {
    return cur.fail_unknown_variant("morph type", kind, kind_offset);
  }
  m->kind = static_cast<PmxMorphKind>(kind);

  qint32 count = 0;
  if (!cur.read_count("morph offset", &count)) {
    return false;
  }

  const int vertex_width = cur.index_width(PmxIndexKind::Vertex);
  switch (m->kind) {
    case PmxMorphKind::Group:
      return read_offsets<PmxGroupMorphOffset>(cur, count, cur.index_width(PmxIndexKind::Morph) + 4,
                                               read_group_offset, &m->offsets);
    case PmxMorphKind::Vertex:
      return read_offsets<PmxVertexMorphOffset>(cur, count, vertex_width + 12, read_vertex_offset, &m->offsets);
    case PmxMorphKind::Bone:
      return read_offsets<PmxBoneMorphOffset>(cur, count, cur.index_width(PmxIndexKind::Bone) + 28,
                                              read_bone_offset, &m->offsets);
    case PmxMorphKind::Uv:
    case PmxMorphKind::AdditionalUv1:
    case PmxMorphKind::AdditionalUv2:
    case PmxMorphKind::AdditionalUv3:
    case PmxMorphKind::AdditionalUv4:
      return read_offsets<PmxUvMorphOffset>(cur, count, vertex_width + 16, read_uv_offset, &m->offsets);
    case PmxMorphKind::Material:
      return read_offsets<PmxMaterialMorphOffset>(cur, count, cur.index_width(PmxIndexKind::Material) + 113,
                                                  read_material_offset, &m->offsets);
    case PmxMorphKind::Flip:
      return read_offsets<PmxFlipMorphOffset>(cur, count, cur.index_width(PmxIndexKind::Morph) + 4,
                                              read_flip_offset, &m->offsets);
    case PmxMorphKind::Impulse:
      return read_offsets<PmxImpulseMorphOffset>(cur, count, cur.index_width(PmxIndexKind::RigidBody) + 25,
                                                 read_impulse_offset, &m->offsets);
  }
  return cur.fail_unknown_variant("morph type", kind, kind_offset);
}
}  // namespace

bool read_pmx_morphs(PmxCursor& cur, const PmxHeader&, QVector<PmxMorph>* out) {
  if (!out) {
    return false;
  }
  cur.begin_section(PmxSection::Morph);
  out->clear();

  qint32 count = 0;
  if (!cur.read_count("morph", &count)) {
    return false;
  }
  out->reserve(cur.reserve_hint(count, 4 + 4 + 1 + 1 + 4));
  for (int i = 0; i < count; ++i) {
    cur.set_record(i);
    PmxMorph m;
    if (!read_morph(cur, &m)) {
      return false;
    }
    out->push_back(std::move(m));
  }
  return true;
}

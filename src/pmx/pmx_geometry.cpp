#include "pmx/pmx_sections.h"

#include <utility>

namespace {
bool read_bone_indices(PmxCursor& cur, qint32* bones, int n) {
  for (int i = 0; i < n; ++i) {
    if (!cur.read_index(PmxIndexKind::Bone, &bones[i])) {
      return false;
    }
  }
  return true;
}

bool read_weights(PmxCursor& cur, float* weights, int n) {
  for (int i = 0; i < n; ++i) {
    if (!cur.read_f32(&weights[i])) {
      return false;
    }
  }
  return true;
}

bool read_skinning(PmxCursor& cur, const PmxHeader& header, PmxSkinning* out) {
  const int tag_offset = cur.pos();
  quint8 tag = 0;
  if (!cur.read_u8(&tag)) {
    return false;
  }

  switch (tag) {
    case 0: {
      PmxBdef1 s;
      if (!cur.read_index(PmxIndexKind::Bone, &s.bone)) {
        return false;
      }
      *out = s;
      return true;
    }
    case 1: {
      PmxBdef2 s;
      if (!read_bone_indices(cur, s.bones.data(), 2) || !cur.read_f32(&s.weight)) {
        return false;
      }
      *out = s;
      return true;
    }
    case 2: {
      PmxBdef4 s;
      if (!read_bone_indices(cur, s.bones.data(), 4) || !read_weights(cur, s.weights.data(), 4)) {
        return false;
      }
      *out = s;
      return true;
    }
    case 3: {
      PmxSdef s;
      if (!read_bone_indices(cur, s.bones.data(), 2) || !cur.read_f32(&s.weight) || !cur.read_vec3(&s.c) ||
          !cur.read_vec3(&s.r0) || !cur.read_vec3(&s.r1)) {
        return false;
      }
      *out = s;
      return true;
    }
    case 4: {
      // QDEF only exists from 2.1 on.
      if (header.version != PmxVersion::V2_1) {
        break;
      }
      PmxQdef s;
      if (!read_bone_indices(cur, s.bones.data(), 4) || !read_weights(cur, s.weights.data(), 4)) {
        return false;
      }
      *out = s;
      return true;
    }
    default:
      break;
  }
  return cur.fail_unknown_variant("skinning type", tag, tag_offset);
}

bool read_toon(PmxCursor& cur, PmxToonReference* out) {
  const int tag_offset = cur.pos();
  quint8 tag = 0;
  if (!cur.read_u8(&tag)) {
    return false;
  }
  if (tag == 0) {
    PmxTextureToon toon;
    if (!cur.read_index(PmxIndexKind::Texture, &toon.texture)) {
      return false;
    }
    *out = toon;
    return true;
  }
  if (tag == 1) {
    const int index_offset = cur.pos();
    PmxInternalToon toon;
    if (!cur.read_u8(&toon.index)) {
      return false;
    }
    if (toon.index > 9) {
      return cur.fail_unknown_variant("internal toon index", toon.index, index_offset);
    }
    *out = toon;
    return true;
  }
  return cur.fail_unknown_variant("toon reference type", tag, tag_offset);
}
}  // namespace

bool read_pmx_vertices(PmxCursor& cur, const PmxHeader& header, QVector<PmxVertex>* out) {
  if (!out) {
    return false;
  }
  cur.begin_section(PmxSection::Vertex);
  out->clear();

  qint32 count = 0;
  if (!cur.read_count("vertex", &count)) {
    return false;
  }
  const int min_size = 12 + 12 + 8 + 16 * header.additional_uv_count + 1 + header.index_width(PmxIndexKind::Bone) + 4;
  out->reserve(cur.reserve_hint(count, min_size));

  for (int i = 0; i < count; ++i) {
    cur.set_record(i);
    PmxVertex v;
    if (!cur.read_vec3(&v.position) || !cur.read_vec3(&v.normal) || !cur.read_vec2(&v.uv)) {
      return false;
    }
    v.additional_uvs.resize(header.additional_uv_count);
    for (int k = 0; k < header.additional_uv_count; ++k) {
      if (!cur.read_vec4(&v.additional_uvs[k])) {
        return false;
      }
    }
    if (!read_skinning(cur, header, &v.skinning) || !cur.read_f32(&v.edge_scale)) {
      return false;
    }
    out->push_back(std::move(v));
  }
  return true;
}

bool read_pmx_faces(PmxCursor& cur, const PmxHeader& header, QVector<PmxFace>* out) {
  if (!out) {
    return false;
  }
  cur.begin_section(PmxSection::Face);
  out->clear();

  // The count is the number of vertex indices, not triangles.
  const int count_offset = cur.pos();
  qint32 index_count = 0;
  if (!cur.read_count("face index", &index_count)) {
    return false;
  }
  if (index_count % 3 != 0) {
    return cur.fail_invalid_count("face index", index_count, count_offset);
  }

  const int face_count = index_count / 3;
  out->reserve(cur.reserve_hint(face_count, 3 * header.index_width(PmxIndexKind::Vertex)));
  for (int i = 0; i < face_count; ++i) {
    cur.set_record(i);
    PmxFace f;
    for (int k = 0; k < 3; ++k) {
      if (!cur.read_index(PmxIndexKind::Vertex, &f.vertices[k])) {
        return false;
      }
    }
    out->push_back(f);
  }
  return true;
}

bool read_pmx_textures(PmxCursor& cur, const PmxHeader&, QVector<PmxTexture>* out) {
  if (!out) {
    return false;
  }
  cur.begin_section(PmxSection::Texture);
  out->clear();

  qint32 count = 0;
  if (!cur.read_count("texture", &count)) {
    return false;
  }
  out->reserve(cur.reserve_hint(count, 4));
  for (int i = 0; i < count; ++i) {
    cur.set_record(i);
    PmxTexture t;
    if (!cur.read_text(&t.path)) {
      return false;
    }
    out->push_back(std::move(t));
  }
  return true;
}

bool read_pmx_materials(PmxCursor& cur, const PmxHeader& header, QVector<PmxMaterial>* out) {
  if (!out) {
    return false;
  }
  cur.begin_section(PmxSection::Material);
  out->clear();

  qint32 count = 0;
  if (!cur.read_count("material", &count)) {
    return false;
  }
  const int texture_width = header.index_width(PmxIndexKind::Texture);
  const int min_size = 4 + 4 + 16 + 12 + 4 + 12 + 1 + 16 + 4 + 2 * texture_width + 1 + 1 + 1 + 4 + 4;
  out->reserve(cur.reserve_hint(count, min_size));

  for (int i = 0; i < count; ++i) {
    cur.set_record(i);
    PmxMaterial m;
    if (!cur.read_text(&m.name) || !cur.read_text(&m.name_universal)) {
      return false;
    }
    if (!cur.read_vec4(&m.diffuse) || !cur.read_vec3(&m.specular) || !cur.read_f32(&m.specular_strength) ||
        !cur.read_vec3(&m.ambient) || !cur.read_u8(&m.flags) || !cur.read_vec4(&m.edge_color) ||
        !cur.read_f32(&m.edge_size)) {
      return false;
    }
    if (!cur.read_index(PmxIndexKind::Texture, &m.texture) ||
        !cur.read_index(PmxIndexKind::Texture, &m.sphere_texture)) {
      return false;
    }

    const int sphere_offset = cur.pos();
    quint8 sphere_mode = 0;
    if (!cur.read_u8(&sphere_mode)) {
      return false;
    }
    if (sphere_mode > 3) {
      return cur.fail_unknown_variant("sphere mode", sphere_mode, sphere_offset);
    }
    m.sphere_mode = static_cast<PmxSphereMode>(sphere_mode);

    if (!read_toon(cur, &m.toon) || !cur.read_text(&m.memo)) {
      return false;
    }
    const int index_count_offset = cur.pos();
    if (!cur.read_i32(&m.index_count)) {
      return false;
    }
    if (m.index_count < 0 || m.index_count % 3 != 0) {
      return cur.fail_invalid_count("material index", m.index_count, index_count_offset);
    }
    out->push_back(std::move(m));
  }
  return true;
}

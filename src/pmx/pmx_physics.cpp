#include "pmx/pmx_sections.h"

#include <utility>

namespace {
bool read_shape(PmxCursor& cur, PmxRigidShape* out) {
  const int tag_offset = cur.pos();
  quint8 tag = 0;
  if (!cur.read_u8(&tag)) {
    return false;
  }
  if (tag > 2) {
    return cur.fail_unknown_variant("rigid body shape", tag, tag_offset);
  }
  QVector3D size;
  if (!cur.read_vec3(&size)) {
    return false;
  }
  switch (tag) {
    case 0: {
      PmxSphereShape s;
      s.radius = size.x();
      *out = s;
      break;
    }
    case 1: {
      PmxBoxShape s;
      s.half_extents = size;
      *out = s;
      break;
    }
    default: {
      PmxCapsuleShape s;
      s.radius = size.x();
      s.height = size.y();
      *out = s;
      break;
    }
  }
  return true;
}

bool read_rigid_body(PmxCursor& cur, PmxRigidBody* rb) {
  if (!cur.read_text(&rb->name) || !cur.read_text(&rb->name_universal)) {
    return false;
  }
  if (!cur.read_index(PmxIndexKind::Bone, &rb->bone) || !cur.read_u8(&rb->group) ||
      !cur.read_u16(&rb->collision_mask) || !read_shape(cur, &rb->shape)) {
    return false;
  }
  if (!cur.read_vec3(&rb->position) || !cur.read_vec3(&rb->rotation) || !cur.read_f32(&rb->mass) ||
      !cur.read_f32(&rb->linear_damping) || !cur.read_f32(&rb->angular_damping) || !cur.read_f32(&rb->restitution) ||
      !cur.read_f32(&rb->friction)) {
    return false;
  }

  const int mode_offset = cur.pos();
  quint8 mode = 0;
  if (!cur.read_u8(&mode)) {
    return false;
  }
  if (mode > 2) {
    return cur.fail_unknown_variant("physics mode", mode, mode_offset);
  }
  rb->mode = static_cast<PmxPhysicsMode>(mode);
  return true;
}

bool read_joint(PmxCursor& cur, const PmxHeader& header, PmxJoint* j) {
  if (!cur.read_text(&j->name) || !cur.read_text(&j->name_universal)) {
    return false;
  }

  const int type_offset = cur.pos();
  quint8 type = 0;
  if (!cur.read_u8(&type)) {
    return false;
  }
  // 2.0 only knows the spring 6-DOF joint.
  const quint8 max_type = header.version == PmxVersion::V2_1 ? 5 : 0;
  if (type > max_type) {
    return cur.fail_unknown_variant("joint type", type, type_offset);
  }
  j->type = static_cast<PmxJointType>(type);

  return cur.read_index(PmxIndexKind::RigidBody, &j->rigid_body_a) &&
         cur.read_index(PmxIndexKind::RigidBody, &j->rigid_body_b) && cur.read_vec3(&j->position) &&
         cur.read_vec3(&j->rotation) && cur.read_vec3(&j->linear_min) && cur.read_vec3(&j->linear_max) &&
         cur.read_vec3(&j->angular_min) && cur.read_vec3(&j->angular_max) && cur.read_vec3(&j->linear_spring) &&
         cur.read_vec3(&j->angular_spring);
}

bool read_soft_body_config(PmxCursor& cur, PmxSoftBodyConfig* c) {
  return cur.read_f32(&c->vcf) && cur.read_f32(&c->dp) && cur.read_f32(&c->dg) && cur.read_f32(&c->lf) &&
         cur.read_f32(&c->pr) && cur.read_f32(&c->vc) && cur.read_f32(&c->df) && cur.read_f32(&c->mt) &&
         cur.read_f32(&c->chr) && cur.read_f32(&c->khr) && cur.read_f32(&c->shr) && cur.read_f32(&c->ahr);
}

bool read_soft_body_cluster(PmxCursor& cur, PmxSoftBodyCluster* c) {
  return cur.read_f32(&c->srhr) && cur.read_f32(&c->skhr) && cur.read_f32(&c->sshr) && cur.read_f32(&c->sr_split) &&
         cur.read_f32(&c->sk_split) && cur.read_f32(&c->ss_split);
}

bool read_soft_body(PmxCursor& cur, PmxSoftBody* sb) {
  if (!cur.read_text(&sb->name) || !cur.read_text(&sb->name_universal)) {
    return false;
  }

  const int shape_offset = cur.pos();
  quint8 shape = 0;
  if (!cur.read_u8(&shape)) {
    return false;
  }
  if (shape > 1) {
    return cur.fail_unknown_variant("soft body shape", shape, shape_offset);
  }
  sb->shape = static_cast<PmxSoftBodyShape>(shape);

  if (!cur.read_index(PmxIndexKind::Material, &sb->material) || !cur.read_u8(&sb->group) ||
      !cur.read_u16(&sb->collision_mask) || !cur.read_u8(&sb->flags) || !cur.read_i32(&sb->b_link_distance) ||
      !cur.read_i32(&sb->cluster_count) || !cur.read_f32(&sb->total_mass) || !cur.read_f32(&sb->collision_margin)) {
    return false;
  }

  const int aero_offset = cur.pos();
  qint32 aero = 0;
  if (!cur.read_i32(&aero)) {
    return false;
  }
  if (aero < 0 || aero > 4) {
    return cur.fail_unknown_variant("aero model", aero, aero_offset);
  }
  sb->aero_model = static_cast<PmxAeroModel>(aero);

  PmxSoftBodyIterations& it = sb->iterations;
  PmxSoftBodyMaterial& mat = sb->physics_material;
  if (!read_soft_body_config(cur, &sb->config) || !read_soft_body_cluster(cur, &sb->cluster) ||
      !cur.read_i32(&it.velocity) || !cur.read_i32(&it.position) || !cur.read_i32(&it.drift) ||
      !cur.read_i32(&it.cluster) || !cur.read_f32(&mat.linear_stiffness) || !cur.read_f32(&mat.angular_stiffness) ||
      !cur.read_f32(&mat.volume_stiffness)) {
    return false;
  }

  qint32 anchor_count = 0;
  if (!cur.read_count("soft body anchor", &anchor_count)) {
    return false;
  }
  sb->anchors.reserve(cur.reserve_hint(anchor_count, 3));
  for (int i = 0; i < anchor_count; ++i) {
    PmxSoftBodyAnchor anchor;
    if (!cur.read_index(PmxIndexKind::RigidBody, &anchor.rigid_body) ||
        !cur.read_index(PmxIndexKind::Vertex, &anchor.vertex) || !cur.read_bool(&anchor.near_mode)) {
      return false;
    }
    sb->anchors.push_back(anchor);
  }

  qint32 pin_count = 0;
  if (!cur.read_count("soft body pin", &pin_count)) {
    return false;
  }
  sb->pinned_vertices.reserve(cur.reserve_hint(pin_count, 1));
  for (int i = 0; i < pin_count; ++i) {
    qint32 vertex = 0;
    if (!cur.read_index(PmxIndexKind::Vertex, &vertex)) {
      return false;
    }
    sb->pinned_vertices.push_back(vertex);
  }
  return true;
}
}  // namespace

bool read_pmx_rigid_bodies(PmxCursor& cur, const PmxHeader& header, QVector<PmxRigidBody>* out) {
  if (!out) {
    return false;
  }
  cur.begin_section(PmxSection::RigidBody);
  out->clear();

  qint32 count = 0;
  if (!cur.read_count("rigid body", &count)) {
    return false;
  }
  out->reserve(cur.reserve_hint(count, 4 + 4 + header.index_width(PmxIndexKind::Bone) + 1 + 2 + 1 + 12 * 3 + 4 * 5 + 1));
  for (int i = 0; i < count; ++i) {
    cur.set_record(i);
    PmxRigidBody rb;
    if (!read_rigid_body(cur, &rb)) {
      return false;
    }
    out->push_back(std::move(rb));
  }
  return true;
}

bool read_pmx_joints(PmxCursor& cur, const PmxHeader& header, QVector<PmxJoint>* out) {
  if (!out) {
    return false;
  }
  cur.begin_section(PmxSection::Joint);
  out->clear();

  qint32 count = 0;
  if (!cur.read_count("joint", &count)) {
    return false;
  }
  out->reserve(cur.reserve_hint(count, 4 + 4 + 1 + 2 * header.index_width(PmxIndexKind::RigidBody) + 12 * 8));
  for (int i = 0; i < count; ++i) {
    cur.set_record(i);
    PmxJoint j;
    if (!read_joint(cur, header, &j)) {
      return false;
    }
    out->push_back(std::move(j));
  }
  return true;
}

bool read_pmx_soft_bodies(PmxCursor& cur, const PmxHeader&, QVector<PmxSoftBody>* out) {
  if (!out) {
    return false;
  }
  cur.begin_section(PmxSection::SoftBody);
  out->clear();

  qint32 count = 0;
  if (!cur.read_count("soft body", &count)) {
    return false;
  }
  out->reserve(cur.reserve_hint(count, 4 + 4 + 1 + 1 + 1 + 2 + 1 + 4 * 5 + 4 * 25 + 4 + 4));
  for (int i = 0; i < count; ++i) {
    cur.set_record(i);
    PmxSoftBody sb;
    if (!read_soft_body(cur, &sb)) {
      return false;
    }
    out->push_back(std::move(sb));
  }
  return true;
}

#include "pmx/pmx_validate.h"

#include <algorithm>
#include <variant>

namespace {
QVector<qint32> skinning_bones(const PmxSkinning& skinning) {
  if (const auto* s = std::get_if<PmxBdef1>(&skinning)) {
    return {s->bone};
  }
  if (const auto* s = std::get_if<PmxBdef2>(&skinning)) {
    return {s->bones[0], s->bones[1]};
  }
  if (const auto* s = std::get_if<PmxBdef4>(&skinning)) {
    return {s->bones[0], s->bones[1], s->bones[2], s->bones[3]};
  }
  if (const auto* s = std::get_if<PmxSdef>(&skinning)) {
    return {s->bones[0], s->bones[1]};
  }
  if (const auto* s = std::get_if<PmxQdef>(&skinning)) {
    return {s->bones[0], s->bones[1], s->bones[2], s->bones[3]};
  }
  return {};
}

class ReferenceChecker {
public:
  ReferenceChecker(const PmxDocument& doc, bool collect_all) : doc_(doc), collect_all_(collect_all) {}

  const QVector<PmxError>& violations() const { return violations_; }

  // True when no violation was found. Each check returns false once checking should stop.
  bool run() {
    const bool finished = check_vertices() && check_faces() && check_materials() && check_bones() &&
                          check_morphs() && check_display_frames() && check_rigid_bodies() && check_joints() &&
                          check_soft_bodies();
    return finished && violations_.isEmpty();
  }

private:
  int target_count(PmxSection target) const {
    switch (target) {
      case PmxSection::Vertex:
        return doc_.vertices.size();
      case PmxSection::Texture:
        return doc_.textures.size();
      case PmxSection::Material:
        return doc_.materials.size();
      case PmxSection::Bone:
        return doc_.bones.size();
      case PmxSection::Morph:
        return doc_.morphs.size();
      case PmxSection::RigidBody:
        return doc_.rigid_bodies.size();
      default:
        return 0;
    }
  }

  bool ref(PmxSection section, int record, PmxSection target, qint32 value, const char* context) {
    // Vertices are the only kind without a "none" value.
    if (value == kPmxNoIndex && target != PmxSection::Vertex) {
      return true;
    }
    if (value >= 0 && value < target_count(target)) {
      return true;
    }
    return report(section, record, target, value, context);
  }

  bool report(PmxSection section, int record, PmxSection target, qint32 value, const char* context) {
    PmxError e;
    e.kind = PmxErrorKind::DanglingReference;
    e.section = section;
    e.record_index = record;
    e.target_section = target;
    e.value = value;
    e.context = context;
    violations_.push_back(e);
    return collect_all_;
  }

  bool check_vertices() {
    for (int i = 0; i < doc_.vertices.size(); ++i) {
      for (qint32 bone : skinning_bones(doc_.vertices[i].skinning)) {
        if (!ref(PmxSection::Vertex, i, PmxSection::Bone, bone, "skinning bone")) {
          return false;
        }
      }
    }
    return true;
  }

  bool check_faces() {
    for (int i = 0; i < doc_.faces.size(); ++i) {
      for (qint32 v : doc_.faces[i].vertices) {
        if (!ref(PmxSection::Face, i, PmxSection::Vertex, v, "face vertex")) {
          return false;
        }
      }
    }
    return true;
  }

  bool check_materials() {
    for (int i = 0; i < doc_.materials.size(); ++i) {
      const PmxMaterial& m = doc_.materials[i];
      if (!ref(PmxSection::Material, i, PmxSection::Texture, m.texture, "texture") ||
          !ref(PmxSection::Material, i, PmxSection::Texture, m.sphere_texture, "sphere texture")) {
        return false;
      }
      if (const auto* toon = std::get_if<PmxTextureToon>(&m.toon)) {
        if (!ref(PmxSection::Material, i, PmxSection::Texture, toon->texture, "toon texture")) {
          return false;
        }
      }
    }
    return true;
  }

  bool check_bones() {
    for (int i = 0; i < doc_.bones.size(); ++i) {
      const PmxBone& b = doc_.bones[i];
      if (!ref(PmxSection::Bone, i, PmxSection::Bone, b.parent, "parent")) {
        return false;
      }
      if (const auto* tail = std::get_if<PmxBoneTailBone>(&b.tail)) {
        if (!ref(PmxSection::Bone, i, PmxSection::Bone, tail->bone, "tail")) {
          return false;
        }
      }
      if (b.inherit && !ref(PmxSection::Bone, i, PmxSection::Bone, b.inherit->parent, "inherit parent")) {
        return false;
      }
      if (b.ik) {
        if (!ref(PmxSection::Bone, i, PmxSection::Bone, b.ik->target, "IK target")) {
          return false;
        }
        for (const PmxIkLink& link : b.ik->links) {
          if (!ref(PmxSection::Bone, i, PmxSection::Bone, link.bone, "IK link")) {
            return false;
          }
        }
      }
    }
    return true;
  }

  bool check_morph(int i, const PmxMorph& m) {
    if (const auto* offsets = std::get_if<QVector<PmxGroupMorphOffset>>(&m.offsets)) {
      for (const PmxGroupMorphOffset& o : *offsets) {
        if (o.morph == i) {
          if (!report(PmxSection::Morph, i, PmxSection::Morph, o.morph, "self reference")) {
            return false;
          }
          continue;
        }
        if (!ref(PmxSection::Morph, i, PmxSection::Morph, o.morph, "group member")) {
          return false;
        }
      }
    } else if (const auto* offsets = std::get_if<QVector<PmxVertexMorphOffset>>(&m.offsets)) {
      for (const PmxVertexMorphOffset& o : *offsets) {
        if (!ref(PmxSection::Morph, i, PmxSection::Vertex, o.vertex, "vertex offset")) {
          return false;
        }
      }
    } else if (const auto* offsets = std::get_if<QVector<PmxBoneMorphOffset>>(&m.offsets)) {
      for (const PmxBoneMorphOffset& o : *offsets) {
        if (!ref(PmxSection::Morph, i, PmxSection::Bone, o.bone, "bone offset")) {
          return false;
        }
      }
    } else if (const auto* offsets = std::get_if<QVector<PmxUvMorphOffset>>(&m.offsets)) {
      for (const PmxUvMorphOffset& o : *offsets) {
        if (!ref(PmxSection::Morph, i, PmxSection::Vertex, o.vertex, "UV offset")) {
          return false;
        }
      }
    } else if (const auto* offsets = std::get_if<QVector<PmxMaterialMorphOffset>>(&m.offsets)) {
      for (const PmxMaterialMorphOffset& o : *offsets) {
        if (!ref(PmxSection::Morph, i, PmxSection::Material, o.material, "material offset")) {
          return false;
        }
      }
    } else if (const auto* offsets = std::get_if<QVector<PmxFlipMorphOffset>>(&m.offsets)) {
      for (const PmxFlipMorphOffset& o : *offsets) {
        if (!ref(PmxSection::Morph, i, PmxSection::Morph, o.morph, "flip member")) {
          return false;
        }
      }
    } else if (const auto* offsets = std::get_if<QVector<PmxImpulseMorphOffset>>(&m.offsets)) {
      for (const PmxImpulseMorphOffset& o : *offsets) {
        if (!ref(PmxSection::Morph, i, PmxSection::RigidBody, o.rigid_body, "impulse body")) {
          return false;
        }
      }
    }
    return true;
  }

  bool check_morphs() {
    for (int i = 0; i < doc_.morphs.size(); ++i) {
      if (!check_morph(i, doc_.morphs[i])) {
        return false;
      }
    }
    return true;
  }

  bool check_display_frames() {
    for (int i = 0; i < doc_.display_frames.size(); ++i) {
      for (const PmxDisplayItem& item : doc_.display_frames[i].items) {
        const bool bone = item.target == PmxDisplayTarget::Bone;
        if (!ref(PmxSection::DisplayFrame, i, bone ? PmxSection::Bone : PmxSection::Morph, item.index,
                 bone ? "bone item" : "morph item")) {
          return false;
        }
      }
    }
    return true;
  }

  bool check_rigid_bodies() {
    for (int i = 0; i < doc_.rigid_bodies.size(); ++i) {
      if (!ref(PmxSection::RigidBody, i, PmxSection::Bone, doc_.rigid_bodies[i].bone, "bone")) {
        return false;
      }
    }
    return true;
  }

  bool check_joints() {
    for (int i = 0; i < doc_.joints.size(); ++i) {
      const PmxJoint& j = doc_.joints[i];
      if (!ref(PmxSection::Joint, i, PmxSection::RigidBody, j.rigid_body_a, "rigid body A") ||
          !ref(PmxSection::Joint, i, PmxSection::RigidBody, j.rigid_body_b, "rigid body B")) {
        return false;
      }
    }
    return true;
  }

  bool check_soft_bodies() {
    for (int i = 0; i < doc_.soft_bodies.size(); ++i) {
      const PmxSoftBody& sb = doc_.soft_bodies[i];
      if (!ref(PmxSection::SoftBody, i, PmxSection::Material, sb.material, "material")) {
        return false;
      }
      for (const PmxSoftBodyAnchor& a : sb.anchors) {
        if (!ref(PmxSection::SoftBody, i, PmxSection::RigidBody, a.rigid_body, "anchor body") ||
            !ref(PmxSection::SoftBody, i, PmxSection::Vertex, a.vertex, "anchor vertex")) {
          return false;
        }
      }
      for (qint32 v : sb.pinned_vertices) {
        if (!ref(PmxSection::SoftBody, i, PmxSection::Vertex, v, "pinned vertex")) {
          return false;
        }
      }
    }
    return true;
  }

  const PmxDocument& doc_;
  const bool collect_all_;
  QVector<PmxError> violations_;
};
}  // namespace

bool validate_pmx_references(const PmxDocument& doc, bool collect_all, PmxError* first, QVector<PmxError>* violations) {
  ReferenceChecker checker(doc, collect_all);
  const bool consistent = checker.run();

  if (violations) {
    *violations = checker.violations();
  }
  if (consistent) {
    return true;
  }
  if (first) {
    *first = checker.violations().first();
  }
  return false;
}

QVector<PmxFaceRange> pmx_material_face_ranges(const PmxDocument& doc) {
  QVector<PmxFaceRange> ranges;
  ranges.reserve(doc.materials.size());
  const int total = doc.faces.size() * 3;
  int next = 0;
  for (const PmxMaterial& m : doc.materials) {
    PmxFaceRange r;
    r.first_index = std::min(next, total);
    r.index_count = std::max(0, std::min(m.index_count, total - r.first_index));
    ranges.push_back(r);
    next = r.first_index + r.index_count;
  }
  return ranges;
}

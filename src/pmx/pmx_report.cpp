#include "pmx/pmx_report.h"

#include <QJsonArray>
#include <QStringList>
#include <QTextStream>

#include <array>
#include <cstddef>
#include <variant>

#include "pmx/pmx_validate.h"

namespace {
QJsonArray vec_json(const QVector2D& v) {
  return QJsonArray{v.x(), v.y()};
}

QJsonArray vec_json(const QVector3D& v) {
  return QJsonArray{v.x(), v.y(), v.z()};
}

QJsonArray vec_json(const QVector4D& v) {
  return QJsonArray{v.x(), v.y(), v.z(), v.w()};
}

template <typename T, std::size_t N>
QJsonArray array_json(const std::array<T, N>& values) {
  QJsonArray arr;
  for (const T& v : values) {
    arr.append(v);
  }
  return arr;
}

QString version_string(PmxVersion version) {
  return version == PmxVersion::V2_1 ? "2.1" : "2.0";
}

QString index_kind_key(int kind) {
  static const char* const kKeys[kPmxIndexKindCount] = {"vertex", "texture", "material", "bone", "morph", "rigidBody"};
  return kKeys[kind];
}

QJsonObject header_json(const PmxHeader& h) {
  QJsonObject obj;
  obj.insert("version", version_string(h.version));
  obj.insert("encoding", pmx_text_encoding_name(h.encoding));
  obj.insert("additionalUvCount", h.additional_uv_count);
  QJsonObject widths;
  for (int k = 0; k < kPmxIndexKindCount; ++k) {
    widths.insert(index_kind_key(k), h.index_widths[k]);
  }
  obj.insert("indexWidths", widths);
  obj.insert("modelName", h.model_name);
  obj.insert("modelNameUniversal", h.model_name_universal);
  obj.insert("comment", h.comment);
  obj.insert("commentUniversal", h.comment_universal);
  return obj;
}

QJsonObject skinning_json(const PmxSkinning& skinning) {
  QJsonObject obj;
  if (const auto* s = std::get_if<PmxBdef1>(&skinning)) {
    obj.insert("type", "BDEF1");
    obj.insert("bones", QJsonArray{s->bone});
  } else if (const auto* s = std::get_if<PmxBdef2>(&skinning)) {
    obj.insert("type", "BDEF2");
    obj.insert("bones", array_json(s->bones));
    obj.insert("weight", s->weight);
  } else if (const auto* s = std::get_if<PmxBdef4>(&skinning)) {
    obj.insert("type", "BDEF4");
    obj.insert("bones", array_json(s->bones));
    obj.insert("weights", array_json(s->weights));
  } else if (const auto* s = std::get_if<PmxSdef>(&skinning)) {
    obj.insert("type", "SDEF");
    obj.insert("bones", array_json(s->bones));
    obj.insert("weight", s->weight);
    obj.insert("c", vec_json(s->c));
    obj.insert("r0", vec_json(s->r0));
    obj.insert("r1", vec_json(s->r1));
  } else if (const auto* s = std::get_if<PmxQdef>(&skinning)) {
    obj.insert("type", "QDEF");
    obj.insert("bones", array_json(s->bones));
    obj.insert("weights", array_json(s->weights));
  }
  return obj;
}

QJsonObject vertex_json(const PmxVertex& v) {
  QJsonObject obj;
  obj.insert("position", vec_json(v.position));
  obj.insert("normal", vec_json(v.normal));
  obj.insert("uv", vec_json(v.uv));
  QJsonArray extra;
  for (const QVector4D& uv : v.additional_uvs) {
    extra.append(vec_json(uv));
  }
  obj.insert("additionalUvs", extra);
  obj.insert("skinning", skinning_json(v.skinning));
  obj.insert("edgeScale", v.edge_scale);
  return obj;
}

QJsonObject material_json(const PmxMaterial& m) {
  QJsonObject obj;
  obj.insert("name", m.name);
  obj.insert("nameUniversal", m.name_universal);
  obj.insert("diffuse", vec_json(m.diffuse));
  obj.insert("specular", vec_json(m.specular));
  obj.insert("specularStrength", m.specular_strength);
  obj.insert("ambient", vec_json(m.ambient));
  obj.insert("flags", m.flags);
  obj.insert("edgeColor", vec_json(m.edge_color));
  obj.insert("edgeSize", m.edge_size);
  obj.insert("texture", m.texture);
  obj.insert("sphereTexture", m.sphere_texture);
  obj.insert("sphereMode", static_cast<int>(m.sphere_mode));
  QJsonObject toon;
  if (const auto* t = std::get_if<PmxTextureToon>(&m.toon)) {
    toon.insert("type", "texture");
    toon.insert("texture", t->texture);
  } else if (const auto* t = std::get_if<PmxInternalToon>(&m.toon)) {
    toon.insert("type", "internal");
    toon.insert("index", t->index);
  }
  obj.insert("toon", toon);
  obj.insert("memo", m.memo);
  obj.insert("indexCount", m.index_count);
  return obj;
}

QJsonObject bone_json(const PmxBone& b) {
  QJsonObject obj;
  obj.insert("name", b.name);
  obj.insert("nameUniversal", b.name_universal);
  obj.insert("position", vec_json(b.position));
  obj.insert("parent", b.parent);
  obj.insert("layer", b.layer);
  obj.insert("flags", b.flags);
  if (const auto* t = std::get_if<PmxBoneTailBone>(&b.tail)) {
    obj.insert("tailBone", t->bone);
  } else if (const auto* t = std::get_if<PmxBoneTailOffset>(&b.tail)) {
    obj.insert("tailOffset", vec_json(t->offset));
  }
  if (b.inherit) {
    QJsonObject inherit;
    inherit.insert("parent", b.inherit->parent);
    inherit.insert("ratio", b.inherit->ratio);
    obj.insert("inherit", inherit);
  }
  if (b.fixed_axis) {
    obj.insert("fixedAxis", vec_json(*b.fixed_axis));
  }
  if (b.local_axes) {
    QJsonObject axes;
    axes.insert("x", vec_json(b.local_axes->x));
    axes.insert("z", vec_json(b.local_axes->z));
    obj.insert("localAxes", axes);
  }
  if (b.external_parent) {
    obj.insert("externalParent", *b.external_parent);
  }
  if (b.ik) {
    QJsonObject ik;
    ik.insert("target", b.ik->target);
    ik.insert("loopCount", b.ik->loop_count);
    ik.insert("limitAngle", b.ik->limit_angle);
    QJsonArray links;
    for (const PmxIkLink& link : b.ik->links) {
      QJsonObject l;
      l.insert("bone", link.bone);
      if (link.limit) {
        l.insert("min", vec_json(link.limit->min));
        l.insert("max", vec_json(link.limit->max));
      }
      links.append(l);
    }
    ik.insert("links", links);
    obj.insert("ik", ik);
  }
  return obj;
}

QJsonArray morph_offsets_json(const PmxMorphOffsets& offsets) {
  QJsonArray arr;
  if (const auto* list = std::get_if<QVector<PmxGroupMorphOffset>>(&offsets)) {
    for (const PmxGroupMorphOffset& o : *list) {
      arr.append(QJsonObject{{"morph", o.morph}, {"weight", o.weight}});
    }
  } else if (const auto* list = std::get_if<QVector<PmxVertexMorphOffset>>(&offsets)) {
    for (const PmxVertexMorphOffset& o : *list) {
      arr.append(QJsonObject{{"vertex", o.vertex}, {"translation", vec_json(o.translation)}});
    }
  } else if (const auto* list = std::get_if<QVector<PmxBoneMorphOffset>>(&offsets)) {
    for (const PmxBoneMorphOffset& o : *list) {
      arr.append(QJsonObject{
          {"bone", o.bone}, {"translation", vec_json(o.translation)}, {"rotation", vec_json(o.rotation)}});
    }
  } else if (const auto* list = std::get_if<QVector<PmxUvMorphOffset>>(&offsets)) {
    for (const PmxUvMorphOffset& o : *list) {
      arr.append(QJsonObject{{"vertex", o.vertex}, {"delta", vec_json(o.delta)}});
    }
  } else if (const auto* list = std::get_if<QVector<PmxMaterialMorphOffset>>(&offsets)) {
    for (const PmxMaterialMorphOffset& o : *list) {
      QJsonObject m;
      m.insert("material", o.material);
      m.insert("operation", o.op == PmxMaterialMorphOp::Add ? "add" : "multiply");
      m.insert("diffuse", vec_json(o.diffuse));
      m.insert("specular", vec_json(o.specular));
      m.insert("specularStrength", o.specular_strength);
      m.insert("ambient", vec_json(o.ambient));
      m.insert("edgeColor", vec_json(o.edge_color));
      m.insert("edgeSize", o.edge_size);
      m.insert("textureTint", vec_json(o.texture_tint));
      m.insert("sphereTint", vec_json(o.sphere_tint));
      m.insert("toonTint", vec_json(o.toon_tint));
      arr.append(m);
    }
  } else if (const auto* list = std::get_if<QVector<PmxFlipMorphOffset>>(&offsets)) {
    for (const PmxFlipMorphOffset& o : *list) {
      arr.append(QJsonObject{{"morph", o.morph}, {"weight", o.weight}});
    }
  } else if (const auto* list = std::get_if<QVector<PmxImpulseMorphOffset>>(&offsets)) {
    for (const PmxImpulseMorphOffset& o : *list) {
      arr.append(QJsonObject{{"rigidBody", o.rigid_body},
                             {"local", o.local},
                             {"velocity", vec_json(o.velocity)},
                             {"torque", vec_json(o.torque)}});
    }
  }
  return arr;
}

QJsonObject morph_json(const PmxMorph& m) {
  QJsonObject obj;
  obj.insert("name", m.name);
  obj.insert("nameUniversal", m.name_universal);
  obj.insert("panel", static_cast<int>(m.panel));
  obj.insert("type", pmx_morph_kind_name(m.kind));
  obj.insert("offsets", morph_offsets_json(m.offsets));
  return obj;
}

QJsonObject display_frame_json(const PmxDisplayFrame& f) {
  QJsonObject obj;
  obj.insert("name", f.name);
  obj.insert("nameUniversal", f.name_universal);
  obj.insert("special", f.special);
  QJsonArray items;
  for (const PmxDisplayItem& item : f.items) {
    items.append(QJsonObject{{"type", item.target == PmxDisplayTarget::Bone ? "bone" : "morph"},
                             {"index", item.index}});
  }
  obj.insert("items", items);
  return obj;
}

QJsonObject rigid_body_json(const PmxRigidBody& rb) {
  QJsonObject obj;
  obj.insert("name", rb.name);
  obj.insert("nameUniversal", rb.name_universal);
  obj.insert("bone", rb.bone);
  obj.insert("group", rb.group);
  obj.insert("collisionMask", rb.collision_mask);
  QJsonObject shape;
  if (const auto* s = std::get_if<PmxSphereShape>(&rb.shape)) {
    shape.insert("type", "sphere");
    shape.insert("radius", s->radius);
  } else if (const auto* s = std::get_if<PmxBoxShape>(&rb.shape)) {
    shape.insert("type", "box");
    shape.insert("halfExtents", vec_json(s->half_extents));
  } else if (const auto* s = std::get_if<PmxCapsuleShape>(&rb.shape)) {
    shape.insert("type", "capsule");
    shape.insert("radius", s->radius);
    shape.insert("height", s->height);
  }
  obj.insert("shape", shape);
  obj.insert("position", vec_json(rb.position));
  obj.insert("rotation", vec_json(rb.rotation));
  obj.insert("mass", rb.mass);
  obj.insert("linearDamping", rb.linear_damping);
  obj.insert("angularDamping", rb.angular_damping);
  obj.insert("restitution", rb.restitution);
  obj.insert("friction", rb.friction);
  obj.insert("mode", static_cast<int>(rb.mode));
  return obj;
}

QJsonObject joint_json(const PmxJoint& j) {
  QJsonObject obj;
  obj.insert("name", j.name);
  obj.insert("nameUniversal", j.name_universal);
  obj.insert("type", static_cast<int>(j.type));
  obj.insert("rigidBodyA", j.rigid_body_a);
  obj.insert("rigidBodyB", j.rigid_body_b);
  obj.insert("position", vec_json(j.position));
  obj.insert("rotation", vec_json(j.rotation));
  obj.insert("linearMin", vec_json(j.linear_min));
  obj.insert("linearMax", vec_json(j.linear_max));
  obj.insert("angularMin", vec_json(j.angular_min));
  obj.insert("angularMax", vec_json(j.angular_max));
  obj.insert("linearSpring", vec_json(j.linear_spring));
  obj.insert("angularSpring", vec_json(j.angular_spring));
  return obj;
}

QJsonObject soft_body_json(const PmxSoftBody& sb) {
  QJsonObject obj;
  obj.insert("name", sb.name);
  obj.insert("nameUniversal", sb.name_universal);
  obj.insert("shape", sb.shape == PmxSoftBodyShape::Rope ? "rope" : "triMesh");
  obj.insert("material", sb.material);
  obj.insert("group", sb.group);
  obj.insert("collisionMask", sb.collision_mask);
  obj.insert("flags", sb.flags);
  obj.insert("bLinkDistance", sb.b_link_distance);
  obj.insert("clusterCount", sb.cluster_count);
  obj.insert("totalMass", sb.total_mass);
  obj.insert("collisionMargin", sb.collision_margin);
  obj.insert("aeroModel", static_cast<int>(sb.aero_model));

  const PmxSoftBodyConfig& c = sb.config;
  obj.insert("config", QJsonArray{c.vcf, c.dp, c.dg, c.lf, c.pr, c.vc, c.df, c.mt, c.chr, c.khr, c.shr, c.ahr});
  const PmxSoftBodyCluster& cl = sb.cluster;
  obj.insert("cluster", QJsonArray{cl.srhr, cl.skhr, cl.sshr, cl.sr_split, cl.sk_split, cl.ss_split});
  const PmxSoftBodyIterations& it = sb.iterations;
  obj.insert("iterations", QJsonArray{it.velocity, it.position, it.drift, it.cluster});
  const PmxSoftBodyMaterial& mat = sb.physics_material;
  obj.insert("materialStiffness",
             QJsonArray{mat.linear_stiffness, mat.angular_stiffness, mat.volume_stiffness});

  QJsonArray anchors;
  for (const PmxSoftBodyAnchor& a : sb.anchors) {
    anchors.append(QJsonObject{{"rigidBody", a.rigid_body}, {"vertex", a.vertex}, {"nearMode", a.near_mode}});
  }
  obj.insert("anchors", anchors);
  QJsonArray pins;
  for (qint32 v : sb.pinned_vertices) {
    pins.append(v);
  }
  obj.insert("pinnedVertices", pins);
  return obj;
}

template <typename T, typename Fn>
QJsonArray list_json(const QVector<T>& items, Fn to_json) {
  QJsonArray arr;
  for (const T& item : items) {
    arr.append(to_json(item));
  }
  return arr;
}
}  // namespace

QString pmx_text_encoding_name(PmxTextEncoding encoding) {
  return encoding == PmxTextEncoding::Utf8 ? "UTF-8" : "UTF-16LE";
}

QString pmx_morph_kind_name(PmxMorphKind kind) {
  switch (kind) {
    case PmxMorphKind::Group:
      return "group";
    case PmxMorphKind::Vertex:
      return "vertex";
    case PmxMorphKind::Bone:
      return "bone";
    case PmxMorphKind::Uv:
      return "uv";
    case PmxMorphKind::AdditionalUv1:
      return "additionalUv1";
    case PmxMorphKind::AdditionalUv2:
      return "additionalUv2";
    case PmxMorphKind::AdditionalUv3:
      return "additionalUv3";
    case PmxMorphKind::AdditionalUv4:
      return "additionalUv4";
    case PmxMorphKind::Material:
      return "material";
    case PmxMorphKind::Flip:
      return "flip";
    case PmxMorphKind::Impulse:
      return "impulse";
  }
  return "unknown";
}

QJsonObject pmx_document_to_json(const PmxDocument& doc) {
  QJsonObject root;
  root.insert("header", header_json(doc.header));
  root.insert("vertices", list_json(doc.vertices, vertex_json));
  root.insert("faces", list_json(doc.faces, [](const PmxFace& f) { return array_json(f.vertices); }));
  root.insert("textures", list_json(doc.textures, [](const PmxTexture& t) { return QJsonValue(t.path); }));
  root.insert("materials", list_json(doc.materials, material_json));
  root.insert("bones", list_json(doc.bones, bone_json));
  root.insert("morphs", list_json(doc.morphs, morph_json));
  root.insert("displayFrames", list_json(doc.display_frames, display_frame_json));
  root.insert("rigidBodies", list_json(doc.rigid_bodies, rigid_body_json));
  root.insert("joints", list_json(doc.joints, joint_json));
  root.insert("softBodies", list_json(doc.soft_bodies, soft_body_json));
  return root;
}

QString describe_pmx_document(const PmxDocument& doc, int max_materials) {
  QString text;
  QTextStream out(&text);
  const PmxHeader& h = doc.header;

  out << "Format: PMX " << version_string(h.version) << "\n";
  out << "Encoding: " << pmx_text_encoding_name(h.encoding) << "\n";
  out << "Additional UVs: " << h.additional_uv_count << "\n";
  QStringList widths;
  for (int k = 0; k < kPmxIndexKindCount; ++k) {
    widths << QString("%1=%2").arg(index_kind_key(k)).arg(h.index_widths[k]);
  }
  out << "Index widths: " << widths.join(' ') << "\n";
  out << "Name: " << h.model_name;
  if (!h.model_name_universal.isEmpty()) {
    out << " (" << h.model_name_universal << ")";
  }
  out << "\n";

  out << "Vertices: " << doc.vertices.size() << "\n";
  out << "Faces: " << doc.faces.size() << " (indices=" << doc.faces.size() * 3 << ")\n";
  out << "Textures: " << doc.textures.size() << "\n";
  out << "Materials: " << doc.materials.size() << "\n";
  out << "Bones: " << doc.bones.size() << "\n";
  out << "Morphs: " << doc.morphs.size() << "\n";
  out << "Display frames: " << doc.display_frames.size() << "\n";
  out << "Rigid bodies: " << doc.rigid_bodies.size() << "\n";
  out << "Joints: " << doc.joints.size() << "\n";
  out << "Soft bodies: " << doc.soft_bodies.size() << "\n";

  const QVector<PmxFaceRange> ranges = pmx_material_face_ranges(doc);
  for (int i = 0; i < ranges.size() && i < max_materials; ++i) {
    const PmxMaterial& m = doc.materials[i];
    out << "Material " << i << ": name=" << m.name << " texture=" << m.texture << " first=" << ranges[i].first_index
        << " count=" << ranges[i].index_count << "\n";
  }
  if (ranges.size() > max_materials) {
    out << "...\n";
  }

  out.flush();
  return text;
}

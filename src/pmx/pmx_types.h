#pragma once

#include <QString>
#include <QVector>
#include <QVector2D>
#include <QVector3D>
#include <QVector4D>
#include <QtGlobal>

#include <array>
#include <optional>
#include <variant>

// Reserved index value meaning "no reference" for every index kind except vertices.
constexpr qint32 kPmxNoIndex = -1;

enum class PmxVersion {
  V2_0,
  V2_1,
};

enum class PmxTextEncoding {
  Utf16Le = 0,
  Utf8 = 1,
};

enum class PmxIndexKind {
  Vertex = 0,
  Texture,
  Material,
  Bone,
  Morph,
  RigidBody,
};

constexpr int kPmxIndexKindCount = 6;

struct PmxHeader {
  PmxVersion version = PmxVersion::V2_0;
  float version_value = 2.0f;  // As stored in the file.
  PmxTextEncoding encoding = PmxTextEncoding::Utf16Le;
  int additional_uv_count = 0;  // 0..4
  // Byte width (1, 2 or 4) per PmxIndexKind.
  std::array<int, kPmxIndexKindCount> index_widths{{1, 1, 1, 1, 1, 1}};
  QString model_name;
  QString model_name_universal;
  QString comment;
  QString comment_universal;

  [[nodiscard]] int index_width(PmxIndexKind kind) const { return index_widths[static_cast<int>(kind)]; }
};

// Vertex skinning.
struct PmxBdef1 {
  qint32 bone = kPmxNoIndex;
};

struct PmxBdef2 {
  std::array<qint32, 2> bones{{kPmxNoIndex, kPmxNoIndex}};
  float weight = 1.0f;  // Weight of bones[0]; bones[1] gets 1 - weight.
};

struct PmxBdef4 {
  std::array<qint32, 4> bones{{kPmxNoIndex, kPmxNoIndex, kPmxNoIndex, kPmxNoIndex}};
  std::array<float, 4> weights{{0.0f, 0.0f, 0.0f, 0.0f}};
};

struct PmxSdef {
  std::array<qint32, 2> bones{{kPmxNoIndex, kPmxNoIndex}};
  float weight = 1.0f;
  QVector3D c;
  QVector3D r0;
  QVector3D r1;
};

// Dual-quaternion skinning (PMX 2.1). Same layout as BDEF4.
struct PmxQdef {
  std::array<qint32, 4> bones{{kPmxNoIndex, kPmxNoIndex, kPmxNoIndex, kPmxNoIndex}};
  std::array<float, 4> weights{{0.0f, 0.0f, 0.0f, 0.0f}};
};

using PmxSkinning = std::variant<PmxBdef1, PmxBdef2, PmxBdef4, PmxSdef, PmxQdef>;

struct PmxVertex {
  QVector3D position;
  QVector3D normal;
  QVector2D uv;
  QVector<QVector4D> additional_uvs;  // header.additional_uv_count entries
  PmxSkinning skinning;
  float edge_scale = 1.0f;
};

struct PmxFace {
  std::array<qint32, 3> vertices{{0, 0, 0}};
};

struct PmxTexture {
  QString path;
};

enum PmxMaterialFlag : quint8 {
  kPmxMaterialDoubleSided = 0x01,
  kPmxMaterialGroundShadow = 0x02,
  kPmxMaterialSelfShadowMap = 0x04,
  kPmxMaterialSelfShadow = 0x08,
  kPmxMaterialEdge = 0x10,
  kPmxMaterialVertexColor = 0x20,  // 2.1
  kPmxMaterialPointDraw = 0x40,    // 2.1
  kPmxMaterialLineDraw = 0x80,     // 2.1
};

enum class PmxSphereMode {
  Disabled = 0,
  Multiply = 1,
  Add = 2,
  SubTexture = 3,
};

struct PmxInternalToon {
  quint8 index = 0;  // toon01.bmp .. toon10.bmp
};

struct PmxTextureToon {
  qint32 texture = kPmxNoIndex;
};

using PmxToonReference = std::variant<PmxTextureToon, PmxInternalToon>;

struct PmxMaterial {
  QString name;
  QString name_universal;
  QVector4D diffuse;
  QVector3D specular;
  float specular_strength = 0.0f;
  QVector3D ambient;
  quint8 flags = 0;
  QVector4D edge_color;
  float edge_size = 0.0f;
  qint32 texture = kPmxNoIndex;
  qint32 sphere_texture = kPmxNoIndex;
  PmxSphereMode sphere_mode = PmxSphereMode::Disabled;
  PmxToonReference toon;
  QString memo;
  qint32 index_count = 0;  // Number of face vertex indices drawn with this material.

  [[nodiscard]] bool has_flag(PmxMaterialFlag flag) const { return (flags & flag) != 0; }
};

enum PmxBoneFlag : quint16 {
  kPmxBoneTailIsBone = 0x0001,
  kPmxBoneRotatable = 0x0002,
  kPmxBoneTranslatable = 0x0004,
  kPmxBoneVisible = 0x0008,
  kPmxBoneEnabled = 0x0010,
  kPmxBoneIk = 0x0020,
  kPmxBoneInheritRotation = 0x0100,
  kPmxBoneInheritTranslation = 0x0200,
  kPmxBoneFixedAxis = 0x0400,
  kPmxBoneLocalAxes = 0x0800,
  kPmxBonePhysicsAfterDeform = 0x1000,
  kPmxBoneExternalParent = 0x2000,
};

struct PmxBoneTailOffset {
  QVector3D offset;
};

struct PmxBoneTailBone {
  qint32 bone = kPmxNoIndex;
};

using PmxBoneTail = std::variant<PmxBoneTailOffset, PmxBoneTailBone>;

struct PmxBoneInherit {
  qint32 parent = kPmxNoIndex;
  float ratio = 1.0f;
};

struct PmxBoneLocalAxes {
  QVector3D x;
  QVector3D z;
};

struct PmxIkAngleLimit {
  QVector3D min;  // radians
  QVector3D max;  // radians
};

struct PmxIkLink {
  qint32 bone = kPmxNoIndex;
  std::optional<PmxIkAngleLimit> limit;
};

struct PmxBoneIk {
  qint32 target = kPmxNoIndex;
  qint32 loop_count = 0;
  float limit_angle = 0.0f;  // radians per iteration
  QVector<PmxIkLink> links;
};

struct PmxBone {
  QString name;
  QString name_universal;
  QVector3D position;
  qint32 parent = kPmxNoIndex;
  qint32 layer = 0;
  quint16 flags = 0;
  PmxBoneTail tail;
  std::optional<PmxBoneInherit> inherit;
  std::optional<QVector3D> fixed_axis;
  std::optional<PmxBoneLocalAxes> local_axes;
  std::optional<qint32> external_parent;  // external parent key, not a bone index
  std::optional<PmxBoneIk> ik;

  [[nodiscard]] bool has_flag(PmxBoneFlag flag) const { return (flags & flag) != 0; }
};

enum class PmxMorphPanel {
  Hidden = 0,
  Eyebrow = 1,
  Eye = 2,
  Mouth = 3,
  Other = 4,
};

enum class PmxMorphKind {
  Group = 0,
  Vertex = 1,
  Bone = 2,
  Uv = 3,
  AdditionalUv1 = 4,
  AdditionalUv2 = 5,
  AdditionalUv3 = 6,
  AdditionalUv4 = 7,
  Material = 8,
  Flip = 9,
  Impulse = 10,
};

struct PmxGroupMorphOffset {
  qint32 morph = kPmxNoIndex;
  float weight = 0.0f;
};

struct PmxVertexMorphOffset {
  qint32 vertex = 0;
  QVector3D translation;
};

struct PmxBoneMorphOffset {
  qint32 bone = kPmxNoIndex;
  QVector3D translation;
  QVector4D rotation;  // quaternion x, y, z, w
};

struct PmxUvMorphOffset {
  qint32 vertex = 0;
  QVector4D delta;
};

enum class PmxMaterialMorphOp {
  Multiply = 0,
  Add = 1,
};

struct PmxMaterialMorphOffset {
  qint32 material = kPmxNoIndex;  // kPmxNoIndex applies to every material
  PmxMaterialMorphOp op = PmxMaterialMorphOp::Multiply;
  QVector4D diffuse;
  QVector3D specular;
  float specular_strength = 0.0f;
  QVector3D ambient;
  QVector4D edge_color;
  float edge_size = 0.0f;
  QVector4D texture_tint;
  QVector4D sphere_tint;
  QVector4D toon_tint;
};

struct PmxFlipMorphOffset {
  qint32 morph = kPmxNoIndex;
  float weight = 0.0f;
};

struct PmxImpulseMorphOffset {
  qint32 rigid_body = kPmxNoIndex;
  bool local = false;
  QVector3D velocity;
  QVector3D torque;
};

using PmxMorphOffsets = std::variant<QVector<PmxGroupMorphOffset>,
                                     QVector<PmxVertexMorphOffset>,
                                     QVector<PmxBoneMorphOffset>,
                                     QVector<PmxUvMorphOffset>,
                                     QVector<PmxMaterialMorphOffset>,
                                     QVector<PmxFlipMorphOffset>,
                                     QVector<PmxImpulseMorphOffset>>;

struct PmxMorph {
  QString name;
  QString name_universal;
  PmxMorphPanel panel = PmxMorphPanel::Hidden;
  PmxMorphKind kind = PmxMorphKind::Group;
  PmxMorphOffsets offsets;
};

enum class PmxDisplayTarget {
  Bone = 0,
  Morph = 1,
};

struct PmxDisplayItem {
  PmxDisplayTarget target = PmxDisplayTarget::Bone;
  qint32 index = kPmxNoIndex;
};

struct PmxDisplayFrame {
  QString name;
  QString name_universal;
  bool special = false;
  QVector<PmxDisplayItem> items;
};

struct PmxSphereShape {
  float radius = 0.0f;
};

struct PmxBoxShape {
  QVector3D half_extents;
};

struct PmxCapsuleShape {
  float radius = 0.0f;
  float height = 0.0f;
};

using PmxRigidShape = std::variant<PmxSphereShape, PmxBoxShape, PmxCapsuleShape>;

enum class PmxPhysicsMode {
  Static = 0,          // follows its bone
  Dynamic = 1,
  DynamicBoneTrack = 2,  // dynamic, position snapped to its bone
};

struct PmxRigidBody {
  QString name;
  QString name_universal;
  qint32 bone = kPmxNoIndex;
  quint8 group = 0;
  quint16 collision_mask = 0;  // Groups this body does NOT collide with (bit per group).
  PmxRigidShape shape;
  QVector3D position;
  QVector3D rotation;  // radians
  float mass = 0.0f;
  float linear_damping = 0.0f;
  float angular_damping = 0.0f;
  float restitution = 0.0f;
  float friction = 0.0f;
  PmxPhysicsMode mode = PmxPhysicsMode::Static;
};

enum class PmxJointType {
  Spring6Dof = 0,
  SixDof = 1,        // 2.1
  PointToPoint = 2,  // 2.1
  ConeTwist = 3,     // 2.1
  Slider = 4,        // 2.1
  Hinge = 5,         // 2.1
};

struct PmxJoint {
  QString name;
  QString name_universal;
  PmxJointType type = PmxJointType::Spring6Dof;
  qint32 rigid_body_a = kPmxNoIndex;
  qint32 rigid_body_b = kPmxNoIndex;
  QVector3D position;
  QVector3D rotation;
  QVector3D linear_min;
  QVector3D linear_max;
  QVector3D angular_min;
  QVector3D angular_max;
  QVector3D linear_spring;
  QVector3D angular_spring;
};

enum class PmxSoftBodyShape {
  TriMesh = 0,
  Rope = 1,
};

enum PmxSoftBodyFlag : quint8 {
  kPmxSoftBodyBLink = 0x01,
  kPmxSoftBodyClusters = 0x02,
  kPmxSoftBodyLinkCrossing = 0x04,
};

enum class PmxAeroModel {
  VPoint = 0,
  VTwoSided = 1,
  VOneSided = 2,
  FTwoSided = 3,
  FOneSided = 4,
};

struct PmxSoftBodyConfig {
  float vcf = 0.0f;  // velocity correction factor
  float dp = 0.0f;   // damping
  float dg = 0.0f;   // drag
  float lf = 0.0f;   // lift
  float pr = 0.0f;   // pressure
  float vc = 0.0f;   // volume conservation
  float df = 0.0f;   // dynamic friction
  float mt = 0.0f;   // pose matching
  float chr = 0.0f;  // rigid contact hardness
  float khr = 0.0f;  // kinetic contact hardness
  float shr = 0.0f;  // soft contact hardness
  float ahr = 0.0f;  // anchor hardness
};

struct PmxSoftBodyCluster {
  float srhr = 0.0f;
  float skhr = 0.0f;
  float sshr = 0.0f;
  float sr_split = 0.0f;
  float sk_split = 0.0f;
  float ss_split = 0.0f;
};

struct PmxSoftBodyIterations {
  qint32 velocity = 0;
  qint32 position = 0;
  qint32 drift = 0;
  qint32 cluster = 0;
};

struct PmxSoftBodyMaterial {
  float linear_stiffness = 0.0f;
  float angular_stiffness = 0.0f;
  float volume_stiffness = 0.0f;
};

struct PmxSoftBodyAnchor {
  qint32 rigid_body = kPmxNoIndex;
  qint32 vertex = 0;
  bool near_mode = false;
};

struct PmxSoftBody {
  QString name;
  QString name_universal;
  PmxSoftBodyShape shape = PmxSoftBodyShape::TriMesh;
  qint32 material = kPmxNoIndex;
  quint8 group = 0;
  quint16 collision_mask = 0;
  quint8 flags = 0;
  qint32 b_link_distance = 0;
  qint32 cluster_count = 0;
  float total_mass = 0.0f;
  float collision_margin = 0.0f;
  PmxAeroModel aero_model = PmxAeroModel::VPoint;
  PmxSoftBodyConfig config;
  PmxSoftBodyCluster cluster;
  PmxSoftBodyIterations iterations;
  PmxSoftBodyMaterial physics_material;
  QVector<PmxSoftBodyAnchor> anchors;
  QVector<qint32> pinned_vertices;
};

// A fully decoded and validated PMX model. Owns every decoded value; nothing refers back
// into the source buffer.
struct PmxDocument {
  PmxHeader header;
  QVector<PmxVertex> vertices;
  QVector<PmxFace> faces;
  QVector<PmxTexture> textures;
  QVector<PmxMaterial> materials;
  QVector<PmxBone> bones;
  QVector<PmxMorph> morphs;
  QVector<PmxDisplayFrame> display_frames;
  QVector<PmxRigidBody> rigid_bodies;
  QVector<PmxJoint> joints;
  QVector<PmxSoftBody> soft_bodies;  // Empty unless the file is PMX 2.1 and carries them.
};

#include <gtest/gtest.h>

#include <QJsonArray>

#include "pmx/pmx_document.h"
#include "pmx/pmx_report.h"
#include "pmx_test_builder.h"

namespace {
PmxDocument parsed(const PmxFileBuilder& b) {
  PmxError e;
  std::optional<PmxDocument> doc = parse_pmx(b.build(), &e);
  EXPECT_TRUE(doc.has_value()) << e.message().toStdString();
  return doc ? *doc : PmxDocument();
}
}  // namespace

TEST(PmxReport, SummaryListsHeaderAndCounts) {
  PmxFileBuilder b;
  b.widths = {{2, 1, 1, 4, 1, 1}};
  b.add_vertex(0);
  b.add_face(0, 0, 0);
  b.add_bone("root");
  b.add_texture("skin.png");
  b.add_material("skin", 0, 3);

  const QString text = describe_pmx_document(parsed(b));
  const QStringList lines = text.split('\n', Qt::SkipEmptyParts);
  EXPECT_TRUE(lines.contains("Format: PMX 2.0"));
  EXPECT_TRUE(lines.contains("Encoding: UTF-8"));
  EXPECT_TRUE(lines.contains("Additional UVs: 0"));
  EXPECT_TRUE(lines.contains("Index widths: vertex=2 texture=1 material=1 bone=4 morph=1 rigidBody=1"));
  EXPECT_TRUE(lines.contains("Name: model (model_en)"));
  EXPECT_TRUE(lines.contains("Vertices: 1"));
  EXPECT_TRUE(lines.contains("Faces: 1 (indices=3)"));
  EXPECT_TRUE(lines.contains("Bones: 1"));
  EXPECT_TRUE(lines.contains("Soft bodies: 0"));
  EXPECT_TRUE(lines.contains("Material 0: name=skin texture=0 first=0 count=3"));
}

TEST(PmxReport, SummaryElidesLongMaterialLists) {
  PmxDocument doc;
  doc.faces.resize(3);
  for (int i = 0; i < 3; ++i) {
    PmxMaterial m;
    m.name = QString("m%1").arg(i);
    m.index_count = 3;
    doc.materials.push_back(m);
  }

  const QStringList lines = describe_pmx_document(doc, 2).split('\n', Qt::SkipEmptyParts);
  EXPECT_TRUE(lines.contains("Material 1: name=m1 texture=-1 first=3 count=3"));
  EXPECT_FALSE(lines.contains("Material 2: name=m2 texture=-1 first=6 count=3"));
  EXPECT_EQ(lines.last(), "...");
}

TEST(PmxReport, JsonCarriesEverySection) {
  PmxFileBuilder b;
  b.version = 2.1f;
  b.encoding = PmxTextEncoding::Utf16Le;
  b.add_vertex(0);
  b.add_vertex(0);
  b.add_face(0, 1, 0);
  b.add_bone("root");
  b.add_vertex_morph("smile", 1);
  b.add_group_morph("combo", {{0, 0.5f}});
  b.add_rigid_body("head", 0);
  b.add_rigid_body("hair", 0);
  b.add_joint("neck", 0, 1);
  b.add_texture("skin.png");
  b.add_material("skin", 0, 3);
  b.add_soft_body("cloth", 0, 1, 1);

  const QJsonObject root = pmx_document_to_json(parsed(b));
  for (const char* key : {"header", "vertices", "faces", "textures", "materials", "bones", "morphs",
                          "displayFrames", "rigidBodies", "joints", "softBodies"}) {
    EXPECT_TRUE(root.contains(key)) << key;
  }

  const QJsonObject header = root.value("header").toObject();
  EXPECT_EQ(header.value("version").toString(), "2.1");
  EXPECT_EQ(header.value("encoding").toString(), "UTF-16LE");
  EXPECT_EQ(header.value("modelName").toString(), "model");
  EXPECT_EQ(header.value("indexWidths").toObject().value("rigidBody").toInt(), 1);

  const QJsonObject vertex = root.value("vertices").toArray().at(0).toObject();
  EXPECT_EQ(vertex.value("skinning").toObject().value("type").toString(), "BDEF1");

  EXPECT_EQ(root.value("faces").toArray().at(0).toArray(), (QJsonArray{0, 1, 0}));
  EXPECT_EQ(root.value("textures").toArray().at(0).toString(), "skin.png");

  const QJsonObject material = root.value("materials").toArray().at(0).toObject();
  EXPECT_EQ(material.value("toon").toObject().value("type").toString(), "internal");
  EXPECT_EQ(material.value("indexCount").toInt(), 3);

  const QJsonArray morphs = root.value("morphs").toArray();
  ASSERT_EQ(morphs.size(), 2);
  EXPECT_EQ(morphs.at(0).toObject().value("type").toString(), "vertex");
  const QJsonObject member = morphs.at(1).toObject().value("offsets").toArray().at(0).toObject();
  EXPECT_EQ(member.value("morph").toInt(), 0);
  EXPECT_DOUBLE_EQ(member.value("weight").toDouble(), 0.5);

  const QJsonObject body = root.value("rigidBodies").toArray().at(0).toObject();
  EXPECT_EQ(body.value("shape").toObject().value("type").toString(), "sphere");

  const QJsonObject joint = root.value("joints").toArray().at(0).toObject();
  EXPECT_EQ(joint.value("rigidBodyB").toInt(), 1);

  const QJsonObject soft = root.value("softBodies").toArray().at(0).toObject();
  EXPECT_EQ(soft.value("shape").toString(), "triMesh");
  EXPECT_EQ(soft.value("materialStiffness").toArray().size(), 3);
  EXPECT_EQ(soft.value("pinnedVertices").toArray(), (QJsonArray{1}));
}

TEST(PmxReport, MorphKindNames) {
  EXPECT_EQ(pmx_morph_kind_name(PmxMorphKind::Group), "group");
  EXPECT_EQ(pmx_morph_kind_name(PmxMorphKind::AdditionalUv3), "additionalUv3");
  EXPECT_EQ(pmx_morph_kind_name(PmxMorphKind::Impulse), "impulse");
  EXPECT_EQ(pmx_text_encoding_name(PmxTextEncoding::Utf8), "UTF-8");
}

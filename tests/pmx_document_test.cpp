#include <gtest/gtest.h>

#include "pmx/pmx_document.h"
#include "pmx/pmx_report.h"
#include "pmx_test_builder.h"

namespace {
// Touches every section, with one cross reference of each kind.
PmxFileBuilder full_builder() {
  PmxFileBuilder b;
  b.add_vertex(0, 0.0f);
  b.add_vertex(1, 1.0f);
  b.add_vertex(1, 2.0f);
  b.add_face(0, 1, 2);
  b.add_face(2, 1, 0);
  b.add_texture("body.png");
  b.add_material("body", 0, 6);
  b.add_bone("root");
  b.add_bone("child", 0);
  b.add_vertex_morph("smile", 2);
  b.add_group_morph("combo", {{0, 1.0f}});
  b.add_display_frame("Root", 0);
  b.add_rigid_body("body", 1);
  b.add_rigid_body("hair", 1);
  b.add_joint("link", 0, 1);
  return b;
}
}  // namespace

TEST(PmxDocument, MinimalModelParses) {
  const QByteArray bytes = minimal_pmx_builder().build();

  PmxError e;
  const std::optional<PmxDocument> doc = parse_pmx(bytes, &e);
  ASSERT_TRUE(doc.has_value()) << e.message().toStdString();
  EXPECT_EQ(doc->vertices.size(), 1);
  EXPECT_EQ(doc->bones.size(), 1);
  EXPECT_EQ(doc->faces.size(), 1);
  EXPECT_EQ(doc->header.encoding, PmxTextEncoding::Utf8);
  EXPECT_EQ(doc->header.model_name, "model");
  EXPECT_TRUE(doc->soft_bodies.isEmpty());
}

TEST(PmxDocument, FaceIndexPastLastVertexDangles) {
  PmxFileBuilder b;
  b.add_vertex(0);
  b.add_face(1, 1, 1);
  b.add_bone("root");

  PmxError e;
  EXPECT_FALSE(parse_pmx(b.build(), &e).has_value());
  EXPECT_EQ(e.kind, PmxErrorKind::DanglingReference);
  EXPECT_EQ(e.section, PmxSection::Face);
  EXPECT_EQ(e.target_section, PmxSection::Vertex);
  EXPECT_EQ(e.value, 1);
}

TEST(PmxDocument, SkinningBonePastLastBoneDangles) {
  PmxFileBuilder b;
  b.add_vertex(1);
  b.add_face(0, 0, 0);
  b.add_bone("root");

  PmxError e;
  EXPECT_FALSE(parse_pmx(b.build(), &e).has_value());
  EXPECT_EQ(e.kind, PmxErrorKind::DanglingReference);
  EXPECT_EQ(e.section, PmxSection::Vertex);
  EXPECT_EQ(e.value, 1);
}

TEST(PmxDocument, SectionLengthsMatchDeclaredCounts) {
  for (int n = 0; n < 6; ++n) {
    PmxFileBuilder b;
    b.widths = {{2, 1, 1, 2, 1, 1}};
    for (int i = 0; i < n + 1; ++i) {
      b.add_bone(QString("bone%1").arg(i), i - 1);
    }
    for (int i = 0; i < 3 * n; ++i) {
      b.add_vertex(i % (n + 1));
    }
    for (int i = 0; i < n; ++i) {
      b.add_face(3 * i, 3 * i + 1, 3 * i + 2);
      b.add_texture(QString("t%1.png").arg(i));
    }
    for (int i = 0; i < n; ++i) {
      b.add_material(QString("m%1").arg(i), i, 3);
    }

    PmxError e;
    const std::optional<PmxDocument> doc = parse_pmx(b.build(), &e);
    ASSERT_TRUE(doc.has_value()) << n << ": " << e.message().toStdString();
    EXPECT_EQ(doc->vertices.size(), 3 * n);
    EXPECT_EQ(doc->faces.size(), n);
    EXPECT_EQ(doc->textures.size(), n);
    EXPECT_EQ(doc->materials.size(), n);
    EXPECT_EQ(doc->bones.size(), n + 1);
  }
}

TEST(PmxDocument, FullModelParses) {
  const QByteArray bytes = full_builder().build();

  PmxError e;
  const std::optional<PmxDocument> doc = parse_pmx(bytes, &e);
  ASSERT_TRUE(doc.has_value()) << e.message().toStdString();
  EXPECT_EQ(doc->vertices.size(), 3);
  EXPECT_EQ(doc->faces.size(), 2);
  EXPECT_EQ(doc->materials.size(), 1);
  EXPECT_EQ(doc->bones.size(), 2);
  EXPECT_EQ(doc->morphs.size(), 2);
  EXPECT_EQ(doc->display_frames.size(), 1);
  EXPECT_EQ(doc->rigid_bodies.size(), 2);
  EXPECT_EQ(doc->joints.size(), 1);
}

TEST(PmxDocument, TruncationAnywhereIsTruncatedInput) {
  PmxFileBuilder v21 = full_builder();
  v21.version = 2.1f;
  v21.add_soft_body("skirt", 0, 1, 2);

  for (const QByteArray& bytes : {full_builder().build(), v21.build()}) {
    ASSERT_TRUE(parse_pmx(bytes).has_value());
    for (int size = 0; size < bytes.size(); ++size) {
      PmxError e;
      const std::optional<PmxDocument> doc = parse_pmx(bytes.left(size), &e);
      ASSERT_FALSE(doc.has_value()) << size;
      ASSERT_EQ(e.kind, PmxErrorKind::TruncatedInput) << size << ": " << e.message().toStdString();
      EXPECT_LE(e.offset, size);
    }
  }
}

TEST(PmxDocument, AlteredSignatureIsMalformedHeader) {
  const QByteArray bytes = full_builder().build();
  for (int i = 0; i < 4; ++i) {
    QByteArray tampered = bytes;
    tampered[i] = static_cast<char>(tampered[i] ^ 0x20);

    PmxError e;
    EXPECT_FALSE(parse_pmx(tampered, &e).has_value());
    EXPECT_EQ(e.kind, PmxErrorKind::MalformedHeader) << i;
    EXPECT_EQ(e.section, PmxSection::Header);
  }
}

TEST(PmxDocument, ParsingIsRepeatable) {
  const QByteArray bytes = full_builder().build();
  const std::optional<PmxDocument> first = parse_pmx(bytes);
  const std::optional<PmxDocument> second = parse_pmx(bytes);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(pmx_document_to_json(*first), pmx_document_to_json(*second));
}

TEST(PmxDocument, DocumentOutlivesInputBuffer) {
  std::optional<PmxDocument> doc;
  {
    QByteArray bytes = full_builder().build();
    doc = parse_pmx(bytes);
    bytes.fill('\0');
  }
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->bones[1].name, "child");
  EXPECT_EQ(doc->textures[0].path, "body.png");
}

TEST(PmxDocument, Utf16AndUtf8DecodeToSameNames) {
  const QString name = QString::fromUtf8("右腕捩\xF0\x9F\x98\x80 ümlaut");

  PmxFileBuilder utf8;
  PmxFileBuilder utf16;
  utf16.encoding = PmxTextEncoding::Utf16Le;
  for (PmxFileBuilder* b : {&utf8, &utf16}) {
    b->model_name = name;
    b->add_vertex(0);
    b->add_face(0, 0, 0);
    b->add_bone(name);
  }

  const std::optional<PmxDocument> a = parse_pmx(utf8.build());
  const std::optional<PmxDocument> b = parse_pmx(utf16.build());
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(a->header.model_name, name);
  EXPECT_EQ(b->header.model_name, name);
  EXPECT_EQ(a->bones[0].name, b->bones[0].name);
}

TEST(PmxDocument, SoftBodiesAreReadFrom21Files) {
  PmxFileBuilder b = full_builder();
  b.version = 2.1f;
  b.add_soft_body("skirt", 0, 1, 2);

  PmxError e;
  const std::optional<PmxDocument> doc = parse_pmx(b.build(), &e);
  ASSERT_TRUE(doc.has_value()) << e.message().toStdString();
  EXPECT_EQ(doc->header.version, PmxVersion::V2_1);
  ASSERT_EQ(doc->soft_bodies.size(), 1);
  EXPECT_EQ(doc->soft_bodies[0].anchors[0].vertex, 2);
}

TEST(PmxDocument, EmptySoftBodySectionIn21) {
  PmxFileBuilder b = full_builder();
  b.version = 2.1f;

  const std::optional<PmxDocument> doc = parse_pmx(b.build());
  ASSERT_TRUE(doc.has_value());
  EXPECT_TRUE(doc->soft_bodies.isEmpty());
}

TEST(PmxDocument, MissingSoftBodySectionIn21IsTruncated) {
  PmxFileBuilder b = full_builder();
  b.version = 2.1f;
  b.add_soft_body("skirt", 0, 1, 2);
  const QByteArray bytes = b.build();
  const int joints_end = bytes.size() - b.section_bytes(PmxSection::SoftBody).size();

  PmxError e;
  EXPECT_FALSE(parse_pmx(bytes.left(joints_end), &e).has_value());
  EXPECT_EQ(e.kind, PmxErrorKind::TruncatedInput);
  EXPECT_EQ(e.section, PmxSection::SoftBody);
  EXPECT_EQ(e.offset, joints_end);
}

TEST(PmxDocument, TrailingBytesAfter20JointsAreIgnored) {
  QByteArray bytes = full_builder().build();
  bytes.append("trailing", 8);

  const std::optional<PmxDocument> doc = parse_pmx(bytes);
  ASSERT_TRUE(doc.has_value());
  EXPECT_TRUE(doc->soft_bodies.isEmpty());
}

TEST(PmxDocument, SoftBodyReferencesAreValidated) {
  PmxFileBuilder b = full_builder();
  b.version = 2.1f;
  b.add_soft_body("skirt", 0, 1, 3);

  PmxError e;
  EXPECT_FALSE(parse_pmx(b.build(), &e).has_value());
  EXPECT_EQ(e.kind, PmxErrorKind::DanglingReference);
  EXPECT_EQ(e.section, PmxSection::SoftBody);
  EXPECT_EQ(e.value, 3);
}

TEST(PmxDocument, MaxRecordCountRejectsLargeCounts) {
  const QByteArray bytes = full_builder().build();
  PmxParseOptions options;
  options.max_record_count = 2;

  PmxError e;
  EXPECT_FALSE(parse_pmx(bytes, options, &e).has_value());
  EXPECT_EQ(e.kind, PmxErrorKind::InvalidCount);
  EXPECT_EQ(e.section, PmxSection::Vertex);
  EXPECT_EQ(e.value, 3);
}

TEST(PmxDocument, HugeDeclaredCountFailsWithoutHugeAllocation) {
  PmxFileBuilder b;
  PmxWriter w = b.writer();
  const QByteArray header = b.header_bytes();
  w.raw(header).i32(0x00ffffff);

  PmxError e;
  EXPECT_FALSE(parse_pmx(w.bytes(), &e).has_value());
  EXPECT_EQ(e.kind, PmxErrorKind::TruncatedInput);
  EXPECT_EQ(e.section, PmxSection::Vertex);
}

TEST(PmxDocument, CollectsAllViolationsOnRequest) {
  PmxFileBuilder b;
  b.add_vertex(4);
  b.add_face(0, 2, 3);
  b.add_bone("root", 7);

  PmxParseOptions options;
  options.collect_all_violations = true;
  PmxError e;
  QVector<PmxError> violations;
  EXPECT_FALSE(parse_pmx(b.build(), options, &e, &violations).has_value());
  ASSERT_EQ(violations.size(), 4);
  EXPECT_EQ(e.section, PmxSection::Vertex);
  EXPECT_EQ(violations[3].section, PmxSection::Bone);
}

TEST(PmxDocument, StructuralErrorsCarrySectionAndRecord) {
  PmxFileBuilder b;
  b.add_vertex(0);
  b.add_vertex(0);
  PmxWriter bad = b.writer();
  bad.vec3(0.0f, 0.0f, 0.0f).vec3(0.0f, 0.0f, 0.0f).vec2(0.0f, 0.0f).u8(7);
  b.append(PmxSection::Vertex, bad);

  PmxError e;
  EXPECT_FALSE(parse_pmx(b.build(), &e).has_value());
  EXPECT_EQ(e.kind, PmxErrorKind::UnknownVariant);
  EXPECT_EQ(e.section, PmxSection::Vertex);
  EXPECT_EQ(e.record_index, 2);
  EXPECT_EQ(e.value, 7);
  EXPECT_TRUE(e.message().contains("vertex #2"));
}

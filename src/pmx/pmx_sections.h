#pragma once

#include <QVector>

#include "pmx/pmx_cursor.h"
#include "pmx/pmx_types.h"

// Section readers, in file order. Each reads a signed record count followed by that many
// records, replaces the contents of `out`, and stops at the first failing record with the
// error left on the cursor. Index values are stored as read; range checks happen in
// validate_pmx_references() once every section is loaded.

[[nodiscard]] bool read_pmx_vertices(PmxCursor& cur, const PmxHeader& header, QVector<PmxVertex>* out);
[[nodiscard]] bool read_pmx_faces(PmxCursor& cur, const PmxHeader& header, QVector<PmxFace>* out);
[[nodiscard]] bool read_pmx_textures(PmxCursor& cur, const PmxHeader& header, QVector<PmxTexture>* out);
[[nodiscard]] bool read_pmx_materials(PmxCursor& cur, const PmxHeader& header, QVector<PmxMaterial>* out);
[[nodiscard]] bool read_pmx_bones(PmxCursor& cur, const PmxHeader& header, QVector<PmxBone>* out);
[[nodiscard]] bool read_pmx_morphs(PmxCursor& cur, const PmxHeader& header, QVector<PmxMorph>* out);
[[nodiscard]] bool read_pmx_display_frames(PmxCursor& cur, const PmxHeader& header, QVector<PmxDisplayFrame>* out);
[[nodiscard]] bool read_pmx_rigid_bodies(PmxCursor& cur, const PmxHeader& header, QVector<PmxRigidBody>* out);
[[nodiscard]] bool read_pmx_joints(PmxCursor& cur, const PmxHeader& header, QVector<PmxJoint>* out);

// PMX 2.1 only. Callers decide whether the section is present at all.
[[nodiscard]] bool read_pmx_soft_bodies(PmxCursor& cur, const PmxHeader& header, QVector<PmxSoftBody>* out);

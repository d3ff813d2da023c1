#pragma once

#include <QVector>

#include "pmx/pmx_error.h"
#include "pmx/pmx_types.h"

// Checks every index embedded in the document against the section it refers to. Indices
// must address an existing record or, for every kind except vertices, equal kPmxNoIndex.
// A group morph that lists itself is also rejected.
//
// Returns true when the document is consistent. Otherwise `first` receives the first
// DanglingReference in section order and, when `collect_all` is set, `violations` receives
// every one of them (only the first otherwise).
[[nodiscard]] bool validate_pmx_references(const PmxDocument& doc,
                                           bool collect_all,
                                           PmxError* first = nullptr,
                                           QVector<PmxError>* violations = nullptr);

struct PmxFaceRange {
  int first_index = 0;  // Into the flattened face vertex index list (3 per face).
  int index_count = 0;
};

// Per-material spans of the face index list, in material order. Materials are drawn from
// consecutive runs of faces; a run that would extend past the face list is clamped.
[[nodiscard]] QVector<PmxFaceRange> pmx_material_face_ranges(const PmxDocument& doc);

#pragma once

#include <QJsonObject>
#include <QString>

#include "pmx/pmx_types.h"

// Multi-line, human-readable overview: version, encoding, index widths, names, section
// counts and the face range drawn by each material (first `max_materials` only).
[[nodiscard]] QString describe_pmx_document(const PmxDocument& doc, int max_materials = 12);

// Every decoded field of the document. Vectors become arrays, variant records carry a
// "type" key naming the alternative.
[[nodiscard]] QJsonObject pmx_document_to_json(const PmxDocument& doc);

[[nodiscard]] QString pmx_text_encoding_name(PmxTextEncoding encoding);
[[nodiscard]] QString pmx_morph_kind_name(PmxMorphKind kind);

#include "pmx/pmx_document.h"

#include "pmx/pmx_cursor.h"
#include "pmx/pmx_header.h"
#include "pmx/pmx_sections.h"
#include "pmx/pmx_validate.h"

namespace {
bool read_sections(PmxCursor& cur, PmxDocument* doc) {
  const PmxHeader& h = doc->header;
  if (!read_pmx_vertices(cur, h, &doc->vertices) || !read_pmx_faces(cur, h, &doc->faces) ||
      !read_pmx_textures(cur, h, &doc->textures) || !read_pmx_materials(cur, h, &doc->materials) ||
      !read_pmx_bones(cur, h, &doc->bones) || !read_pmx_morphs(cur, h, &doc->morphs) ||
      !read_pmx_display_frames(cur, h, &doc->display_frames) ||
      !read_pmx_rigid_bodies(cur, h, &doc->rigid_bodies) || !read_pmx_joints(cur, h, &doc->joints)) {
    return false;
  }

  // A 2.1 file always ends with the soft body section, even when it is empty. Anything
  // after the joints of a 2.0 file is ignored.
  doc->soft_bodies.clear();
  if (h.version == PmxVersion::V2_1) {
    return read_pmx_soft_bodies(cur, h, &doc->soft_bodies);
  }
  return true;
}
}  // namespace

std::optional<PmxDocument> parse_pmx(const QByteArray& bytes, PmxError* error) {
  return parse_pmx(bytes, PmxParseOptions(), error);
}

std::optional<PmxDocument> parse_pmx(const QByteArray& bytes,
                                     const PmxParseOptions& options,
                                     PmxError* error,
                                     QVector<PmxError>* violations) {
  if (violations) {
    violations->clear();
  }

  PmxCursor cur(bytes);
  cur.set_max_record_count(options.max_record_count);

  PmxDocument doc;
  if (!read_pmx_header(cur, &doc.header) || !read_sections(cur, &doc)) {
    if (error) {
      *error = cur.error();
    }
    return std::nullopt;
  }

  PmxError first;
  if (!validate_pmx_references(doc, options.collect_all_violations, &first, violations)) {
    if (error) {
      *error = first;
    }
    return std::nullopt;
  }
  return doc;
}

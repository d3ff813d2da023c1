#pragma once

#include "pmx/pmx_cursor.h"
#include "pmx/pmx_types.h"

// Signature, version and globals: everything before the model name.
constexpr int kPmxFixedHeaderSize = 4 + 4 + 1 + 8;

// Reads the header at the cursor (expected at offset 0) and configures the cursor's text
// and index decoders from its globals.
[[nodiscard]] bool read_pmx_header(PmxCursor& cur, PmxHeader* out);

#pragma once

#include <lina/formatter.hpp>
#include <lina/text_stream.hpp>
#include <lina/token.hpp>

namespace lina {

  // Find the close token matching an open block. The stream must be
  // positioned just past the open token; on return it is positioned just past
  // the matching close. Nested blocks of any name are skipped.
  //
  // Throws invalid_block when a close does not match the innermost open
  // block or when the input ends first.
  token
  find_block_end(text_stream& in, const token& open,
                 const formatter_registry& formatters =
                     formatter_registry::builtin());

} // namespace lina

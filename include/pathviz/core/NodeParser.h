#pragma once

#include "Types.h"

#include <string_view>

namespace pathviz {

/// Parse a node identifier typed by a user.
///
/// Recognized forms, tried in order on the trimmed text:
/// - integer literal with optional sign: "7", "-3"
/// - integer pair: "(2, 3)", "( 2 ,3 )"
/// - quoted name: "'Gate'" or "\"Gate\"" (quotes removed)
/// - anything else is taken verbatim as a name
///
/// The text is never evaluated as an expression. An integer that does not
/// fit the key's range is kept as a name.
NodeKey parseNodeKey(std::string_view text);

}  // namespace pathviz

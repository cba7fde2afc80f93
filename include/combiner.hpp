#pragma once

#include "relaxation_message.hpp"

// Minimum-weight merge of two messages bound for the same vertex in one superstep.
// Ties are broken by the lexicographically smaller path, so the merge is
// associative and commutative.
const RelaxationMessage& combine_messages(const RelaxationMessage& a, const RelaxationMessage& b);

// Fold `incoming` into `slot` in place
void combine_into(RelaxationMessage& slot, RelaxationMessage&& incoming);

#include "combiner.hpp"
#include <algorithm>
#include <utility>

const RelaxationMessage& combine_messages(const RelaxationMessage& a, const RelaxationMessage& b) {
    if (a.total_weight < b.total_weight) {
        return a;
    }
    if (b.total_weight < a.total_weight) {
        return b;
    }
    // Equal weights
    if (std::lexicographical_compare(b.path.begin(), b.path.end(),
                                     a.path.begin(), a.path.end())) {
        return b;
    }
    return a;
}

void combine_into(RelaxationMessage& slot, RelaxationMessage&& incoming) {
    if (&combine_messages(slot, incoming) == &incoming) {
        slot = std::move(incoming);
    }
}

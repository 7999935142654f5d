#include <slip/alignment-state.h>

namespace slip {

void AlignmentState::apply(const Element& element) noexcept {
    if (const auto* align = std::get_if<AlignElement>(&element)) {
        _alignment = align->alignment;
    }
}

Alignment lookbackAlignment(const Document& doc, std::size_t index) {
    if (doc.empty()) return Alignment::Left;
    if (index >= doc.size()) index = doc.size() - 1;

    for (std::size_t i = index + 1; i-- > 0;) {
        if (const auto* align = std::get_if<AlignElement>(&doc[i])) {
            return align->alignment;
        }
    }
    return Alignment::Left;
}

std::vector<Alignment> ambientAlignments(const Document& doc) {
    std::vector<Alignment> trace;
    trace.reserve(doc.size());

    AlignmentState state;
    for (const auto& element : doc) {
        state.apply(element);
        trace.push_back(state.currentAlignment());
    }
    return trace;
}

} // namespace slip

#pragma once

#include <slip/command.h>
#include <slip/element.h>

#include <cstddef>
#include <vector>

namespace slip {

/**
 * AlignmentState - the ambient text alignment threaded through a render pass.
 *
 * Starts LEFT. At document level only `align` elements change it; item
 * templates use their own instance so inline directives never leak back.
 */
class AlignmentState {
public:
    AlignmentState() = default;
    explicit AlignmentState(Alignment initial) noexcept : _alignment(initial) {}

    void setAlignment(Alignment alignment) noexcept { _alignment = alignment; }

    [[nodiscard]] Alignment currentAlignment() const noexcept { return _alignment; }

    void reset() noexcept { _alignment = Alignment::Left; }

    /**
     * Fold one element into the state. Only `align` elements have an effect;
     * dividers center their own output without touching the ambient value.
     */
    void apply(const Element& element) noexcept;

private:
    Alignment _alignment = Alignment::Left;
};

/**
 * Alignment in effect at `index` found by scanning backward for the nearest
 * `align` element at or before it; LEFT when there is none. This is the
 * editor preview's formulation and must agree with forward-running state.
 */
Alignment lookbackAlignment(const Document& doc, std::size_t index);

/**
 * Ambient alignment after processing each element, computed forward with a
 * single AlignmentState.
 */
std::vector<Alignment> ambientAlignments(const Document& doc);

} // namespace slip

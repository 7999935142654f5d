//=============================================================================
// Alignment State Tests
//
// Ambient alignment: forward state, backward lookup, and printer tracking in
// CommandBuilder
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include <slip/alignment-state.h>
#include <slip/command-builder.h>
#include <slip/interpreter.h>
#include "test-helpers.h"

#include <cstdint>
#include <vector>

using namespace boost::ut;
using namespace slip;
using slip::test::sameCommands;

namespace {

// Small deterministic generator so document shapes repeat run to run
class Lcg {
public:
    explicit Lcg(uint32_t seed) : _state(seed) {}

    uint32_t next() {
        _state = _state * 1664525u + 1013904223u;
        return _state >> 8;
    }

    uint32_t below(uint32_t n) { return next() % n; }

private:
    uint32_t _state;
};

Element randomElement(Lcg& rng) {
    switch (rng.below(6)) {
        case 0: return AlignElement{static_cast<Alignment>(rng.below(3))};
        case 1: return TextElement{"x", {}};
        case 2: return FeedLineElement{1};
        case 3: return DividerElement{};
        case 4: return DynamicElement{"TOTAL"};
        default: return CutPaperElement{};
    }
}

// Elements that render as exactly one Text command without an order
Element randomLayoutElement(Lcg& rng) {
    switch (rng.below(5)) {
        case 0: return AlignElement{static_cast<Alignment>(rng.below(3))};
        case 1: return TextElement{"x", {}};
        case 2: return FeedLineElement{1};
        case 3: return DividerElement{};
        default: return CutPaperElement{};
    }
}

} // namespace

suite alignment_state_tests = [] {
    "starts left"_test = [] {
        AlignmentState state;
        expect(state.currentAlignment() == Alignment::Left);
    };

    "set and reset"_test = [] {
        AlignmentState state;
        state.setAlignment(Alignment::Right);
        expect(state.currentAlignment() == Alignment::Right);
        state.reset();
        expect(state.currentAlignment() == Alignment::Left);
    };

    "only align elements change the state"_test = [] {
        AlignmentState state(Alignment::Center);
        state.apply(TextElement{"hello", {}});
        state.apply(DividerElement{});
        state.apply(FeedLineElement{2});
        expect(state.currentAlignment() == Alignment::Center);

        state.apply(AlignElement{Alignment::Right});
        expect(state.currentAlignment() == Alignment::Right);
    };
};

suite alignment_lookback_tests = [] {
    "empty document is left"_test = [] {
        expect(lookbackAlignment({}, 0) == Alignment::Left);
    };

    "nearest preceding align wins"_test = [] {
        Document doc = {
            AlignElement{Alignment::Center},
            TextElement{"a", {}},
            AlignElement{Alignment::Right},
            TextElement{"b", {}},
        };
        expect(lookbackAlignment(doc, 1) == Alignment::Center);
        expect(lookbackAlignment(doc, 2) == Alignment::Right);
        expect(lookbackAlignment(doc, 3) == Alignment::Right);
    };

    "no preceding align is left"_test = [] {
        Document doc = {TextElement{"a", {}}, AlignElement{Alignment::Right}};
        expect(lookbackAlignment(doc, 0) == Alignment::Left);
    };

    "index past the end clamps to the last element"_test = [] {
        Document doc = {AlignElement{Alignment::Center}, TextElement{"a", {}}};
        expect(lookbackAlignment(doc, 99) == Alignment::Center);
    };

    "forward trace matches lookback on random documents"_test = [] {
        Lcg rng(20240315u);
        for (int round = 0; round < 200; ++round) {
            Document doc;
            const uint32_t length = rng.below(24);
            for (uint32_t i = 0; i < length; ++i) {
                doc.push_back(randomElement(rng));
            }

            auto trace = ambientAlignments(doc);
            expect(trace.size() == doc.size());
            for (std::size_t i = 0; i < doc.size(); ++i) {
                expect(trace[i] == lookbackAlignment(doc, i)) << "round" << round << "index" << i;
            }
        }
    };

    "rendered text follows the nearest preceding align"_test = [] {
        Lcg rng(20241019u);
        for (int round = 0; round < 200; ++round) {
            Document doc;
            const uint32_t length = rng.below(24);
            for (uint32_t i = 0; i < length; ++i) {
                doc.push_back(randomLayoutElement(rng));
            }

            // Source index of every element that prints a line
            std::vector<std::size_t> lines;
            for (std::size_t i = 0; i < doc.size(); ++i) {
                auto type = elementType(doc[i]);
                if (type == ElementType::Text || type == ElementType::Divider) {
                    lines.push_back(i);
                }
            }

            auto out = render(doc, nullptr);
            Alignment printer = Alignment::Left;
            std::size_t next = 0;
            for (const auto& cmd : out) {
                if (cmd.type == Command::Type::SetAlignment) {
                    printer = cmd.alignment;
                } else if (cmd.type == Command::Type::Text) {
                    expect((next < lines.size()) >> fatal) << "round" << round;
                    const std::size_t i = lines[next++];
                    const Alignment wanted = elementType(doc[i]) == ElementType::Divider
                                                 ? Alignment::Center
                                                 : lookbackAlignment(doc, i);
                    expect(printer == wanted) << "round" << round << "index" << i;
                }
            }
            expect(next == lines.size()) << "round" << round;
        }
    };
};

suite command_builder_tests = [] {
    "printer starts left"_test = [] {
        CommandBuilder out;
        expect(out.printerAlignment() == Alignment::Left);
        out.ensureAlignment(Alignment::Left);
        expect(out.size() == 0_u);
    };

    "ensure emits only on change"_test = [] {
        CommandBuilder out;
        out.ensureAlignment(Alignment::Center);
        out.ensureAlignment(Alignment::Center);
        out.text("a");
        out.ensureAlignment(Alignment::Left);

        expect(sameCommands(out.commands(), {
            Command::setAlignment(Alignment::Center),
            Command::textLine("a"),
            Command::setAlignment(Alignment::Left),
        })) << slip::test::dump(out.commands());
    };

    "align always emits"_test = [] {
        CommandBuilder out;
        out.align(Alignment::Left);
        out.align(Alignment::Left);
        expect(out.size() == 2_u);
        expect(out.printerAlignment() == Alignment::Left);
    };

    "take hands over commands and resets"_test = [] {
        CommandBuilder out;
        out.align(Alignment::Right);
        out.feed(2);
        out.cut();

        CommandList taken = out.take();
        expect(taken.size() == 3_u);
        expect(out.size() == 0_u);
        expect(out.printerAlignment() == Alignment::Left);
    };
};

#pragma once

#include <slip/alignment-state.h>
#include <slip/command-builder.h>
#include <slip/element.h>
#include <slip/order.h>
#include <slip/result.hpp>
#include <slip/value-resolver.h>

#include <string>
#include <utility>

namespace YAML { class Node; }

namespace slip {

struct RenderOptions {
    ResolverOptions resolver;
    std::string errorText = "Error occurred";
};

/**
 * Interpreter - turns a design document plus optional order into commands.
 *
 * Walks the element list once, front to back, with one ambient alignment
 * and one command accumulator. Holds no state between calls; render() is
 * safe to call concurrently on distinct or shared (immutable) inputs.
 *
 * If any element fails, the partial output is discarded and the fixed error
 * receipt is returned instead: bold error text, Feed(1), Cut.
 */
class Interpreter {
public:
    explicit Interpreter(RenderOptions options = {}) : _options(std::move(options)) {}

    /**
     * Render an already-decoded document. `order` may be null.
     */
    CommandList render(const Document& doc, const Order* order) const;

    /**
     * Decode and render element records one at a time. A record that fails
     * to decode triggers the error receipt.
     */
    CommandList render(const YAML::Node& design, const Order* order) const;

    CommandList errorReceipt() const;

    const RenderOptions& options() const noexcept { return _options; }

private:
    struct Pass {
        AlignmentState ambient;
        CommandBuilder out;
        const Order* order = nullptr;
    };

    void renderElement(const Element& element, Pass& pass) const;

    void emit(const TextElement& el, Pass& pass) const;
    void emit(const AlignElement& el, Pass& pass) const;
    void emit(const FeedLineElement& el, Pass& pass) const;
    void emit(const BarcodeElement& el, Pass& pass) const;
    void emit(const QrCodeElement& el, Pass& pass) const;
    void emit(const DividerElement& el, Pass& pass) const;
    void emit(const DynamicElement& el, Pass& pass) const;
    void emit(const ItemsListElement& el, Pass& pass) const;
    void emit(const SplitPaymentsElement& el, Pass& pass) const;
    void emit(const CutPaperElement& el, Pass& pass) const;
    void emit(const UnknownElement& el, Pass& pass) const;

    RenderOptions _options;
};

/**
 * Convenience wrapper: render with default options.
 */
CommandList render(const Document& doc, const Order* order);

} // namespace slip

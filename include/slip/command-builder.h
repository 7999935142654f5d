#pragma once

#include <slip/command.h>

#include <cstddef>
#include <string>

namespace slip {

/**
 * CommandBuilder - accumulates the command sequence of one render pass.
 *
 * Remembers the alignment last sent to the printer (LEFT when the pass
 * starts) so callers can request an alignment without emitting redundant
 * SetAlignment commands.
 */
class CommandBuilder {
public:
    CommandBuilder() = default;

    // Always emits SetAlignment
    void align(Alignment alignment);

    // Emits SetAlignment only if the printer is not already there
    void ensureAlignment(Alignment alignment);

    void text(std::string text, TextStyle style = {});
    void feed(int lines);
    void barcode(std::string data, BarcodeType type);
    void qrCode(std::string data, int size);
    void cut();

    [[nodiscard]] Alignment printerAlignment() const noexcept { return _printerAlignment; }
    [[nodiscard]] const CommandList& commands() const noexcept { return _commands; }
    [[nodiscard]] size_t size() const noexcept { return _commands.size(); }

    // Move the accumulated commands out and start over
    CommandList take();
    void clear();

private:
    CommandList _commands;
    Alignment _printerAlignment = Alignment::Left;
};

} // namespace slip

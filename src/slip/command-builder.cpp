#include <slip/command-builder.h>

#include <utility>

namespace slip {

void CommandBuilder::align(Alignment alignment) {
    _commands.push_back(Command::setAlignment(alignment));
    _printerAlignment = alignment;
}

void CommandBuilder::ensureAlignment(Alignment alignment) {
    if (_printerAlignment != alignment) {
        align(alignment);
    }
}

void CommandBuilder::text(std::string text, TextStyle style) {
    _commands.push_back(Command::textLine(std::move(text), style));
}

void CommandBuilder::feed(int lines) {
    _commands.push_back(Command::feed(lines));
}

void CommandBuilder::barcode(std::string data, BarcodeType type) {
    _commands.push_back(Command::barcode(std::move(data), type));
}

void CommandBuilder::qrCode(std::string data, int size) {
    _commands.push_back(Command::qrCode(std::move(data), size));
}

void CommandBuilder::cut() {
    _commands.push_back(Command::cut());
}

CommandList CommandBuilder::take() {
    CommandList out = std::move(_commands);
    clear();
    return out;
}

void CommandBuilder::clear() {
    _commands.clear();
    _printerAlignment = Alignment::Left;
}

} // namespace slip

#pragma once

#include <slip/command.h>

#include <string>

namespace slip {

/**
 * Monospace preview of a command list, `width` columns wide.
 *
 * Text is padded according to the alignment in effect and hard-wrapped at
 * `width`; Feed(n) adds n blank lines; barcodes and QR codes show as
 * bracketed markers; Cut shows as a dashed line. Styles are not rendered.
 */
std::string renderTextPreview(const CommandList& commands, int width = 32);

} // namespace slip

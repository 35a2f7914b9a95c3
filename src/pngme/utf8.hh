//
// UTF-8 validation for text payloads.
//

#pragma once

#include <cstddef>
#include <optional>

#include <pngme/export_pngme.h>

namespace pngme {
    // Offset of the first byte that does not start a well-formed UTF-8
    // sequence (RFC 3629: no overlongs, no surrogates, nothing above U+10FFFF),
    // or nullopt if the whole buffer is valid
    PNGME_EXPORT std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size);
}

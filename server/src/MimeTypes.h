#pragma once
#include "Models.h"
#include <string>

namespace BlackRoom {

    /// Lowercased, trimmed MIME type with parameters kept ("audio/ogg; codecs=opus").
    std::string NormalizeMime(const std::string& mime);

    /// Extension for a voice upload. Unknown audio types fall back to "webm".
    std::string AudioExtensionFor(const std::string& mime);

    /// Extension for a generic blob: MIME table first, then the original filename's
    /// extension, then "bin". Always alphanumeric and safe to use in an object key.
    std::string BlobExtensionFor(const std::string& mime, const std::string& filename);

    /// Response content type for a stored voice blob ("audio/webm" when unknown).
    std::string AudioContentTypeForKey(const std::string& key);

    /// Response content type for a stored blob ("application/octet-stream" when unknown).
    std::string BlobContentTypeForKey(const std::string& key);

    /// image/* -> Image, video/* -> Video, anything else -> File.
    ContentKind ClassifyMime(const std::string& mime);

} // namespace BlackRoom

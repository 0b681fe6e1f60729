/**
 * FileGate - Single-part multipart/form-data extraction.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace filegate::multipart
{

    struct MultipartFile
    {
        std::string filename;
        std::string content;
    };

    // Boundary token from a `multipart/form-data; boundary=...` header value.
    std::optional<std::string> extract_boundary(std::string_view content_type);

    // Returns the first file part of `body`, or std::nullopt when the body is not a
    // well-formed part or the part carries no `filename` attribute.
    std::optional<MultipartFile> parse_multipart(std::string_view content_type, std::string_view body);

} // namespace filegate::multipart

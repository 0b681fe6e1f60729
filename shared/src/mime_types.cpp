#include "filegate/mime_types.hpp"

#include <array>
#include <string>

#include "filegate/http.hpp"

namespace filegate
{

    namespace
    {
        constexpr std::string_view kDefaultMimeType = "application/octet-stream";

        struct MimeMapping
        {
            std::string_view extension;
            std::string_view mime_type;
        };

        constexpr std::array<MimeMapping, 29> kMimeMappings{{
            {".txt", "text/plain"},
            {".html", "text/html"},
            {".htm", "text/html"},
            {".css", "text/css"},
            {".js", "application/javascript"},
            {".json", "application/json"},
            {".xml", "application/xml"},
            {".pdf", "application/pdf"},
            {".doc", "application/msword"},
            {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
            {".xls", "application/vnd.ms-excel"},
            {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
            {".ppt", "application/vnd.ms-powerpoint"},
            {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
            {".jpg", "image/jpeg"},
            {".jpeg", "image/jpeg"},
            {".png", "image/png"},
            {".gif", "image/gif"},
            {".svg", "image/svg+xml"},
            {".mp3", "audio/mpeg"},
            {".wav", "audio/wav"},
            {".mp4", "video/mp4"},
            {".avi", "video/x-msvideo"},
            {".mov", "video/quicktime"},
            {".zip", "application/zip"},
            {".rar", "application/x-rar-compressed"},
            {".tar", "application/x-tar"},
            {".gz", "application/gzip"},
            {".webp", "image/webp"},
        }};
    } // namespace

    std::string_view mime_type_for(const std::filesystem::path &path)
    {
        const auto extension = http::to_lower(path.extension().string());
        for (const auto &mapping : kMimeMappings)
        {
            if (mapping.extension == extension)
            {
                return mapping.mime_type;
            }
        }
        return kDefaultMimeType;
    }

} // namespace filegate

#pragma once

#include <filesystem>
#include <string_view>

namespace filegate
{

    // Content type for a file name, chosen by its (case-insensitive) extension.
    std::string_view mime_type_for(const std::filesystem::path &path);

} // namespace filegate

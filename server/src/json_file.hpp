#pragma once

#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

namespace filegate::server::json_file
{

    // std::nullopt when the file does not exist; throws on unreadable or malformed content.
    std::optional<nlohmann::json> read(const std::filesystem::path &path);

    // Writes `<path>.tmp` and renames it over `path`.
    void write(const std::filesystem::path &path, const nlohmann::json &json);

} // namespace filegate::server::json_file

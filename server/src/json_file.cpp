#include "json_file.hpp"

#include <fstream>
#include <stdexcept>

namespace filegate::server::json_file
{

    std::optional<nlohmann::json> read(const std::filesystem::path &path)
    {
        if (!std::filesystem::exists(path))
        {
            return std::nullopt;
        }
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Failed to open " + path.string());
        }
        try
        {
            nlohmann::json json;
            in >> json;
            return json;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error("Malformed JSON in " + path.string() + ": " + ex.what());
        }
    }

    void write(const std::filesystem::path &path, const nlohmann::json &json)
    {
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path());
        }
        auto temp_path = path;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Failed to open " + temp_path.string() + " for writing");
            }
            out << json.dump(2);
            out.flush();
            if (!out)
            {
                throw std::runtime_error("Failed to write " + temp_path.string());
            }
        }
        std::filesystem::rename(temp_path, path);
    }

} // namespace filegate::server::json_file

#include "filegate/multipart.hpp"

#include <regex>

#include "filegate/http.hpp"

namespace filegate::multipart
{

    namespace
    {
        constexpr std::string_view kHeaderTerminator = "\r\n\r\n";
        constexpr std::string_view kCrlf = "\r\n";

        std::string_view trim_spaces(std::string_view text)
        {
            while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
            {
                text.remove_prefix(1);
            }
            while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
            {
                text.remove_suffix(1);
            }
            return text;
        }

        std::optional<std::string> extract_filename(std::string_view part_headers)
        {
            static const std::regex kFilenamePattern{R"re(filename="([^"]+)")re", std::regex::icase};
            std::match_results<std::string_view::const_iterator> match;
            if (!std::regex_search(part_headers.begin(), part_headers.end(), match, kFilenamePattern))
            {
                return std::nullopt;
            }
            return match[1].str();
        }

    } // namespace

    std::optional<std::string> extract_boundary(std::string_view content_type)
    {
        const auto lowered = http::to_lower(content_type);
        auto cursor = lowered.find(';');
        while (cursor != std::string::npos)
        {
            const auto next = lowered.find(';', cursor + 1);
            const auto length = next == std::string::npos ? std::string::npos : next - cursor - 1;
            const auto parameter = trim_spaces(std::string_view(content_type).substr(cursor + 1, length));
            const auto eq = parameter.find('=');
            if (eq != std::string_view::npos && http::to_lower(trim_spaces(parameter.substr(0, eq))) == "boundary")
            {
                auto value = trim_spaces(parameter.substr(eq + 1));
                if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
                {
                    value = value.substr(1, value.size() - 2);
                }
                if (value.empty())
                {
                    return std::nullopt;
                }
                return std::string(value);
            }
            cursor = next;
        }
        return std::nullopt;
    }

    std::optional<MultipartFile> parse_multipart(std::string_view content_type, std::string_view body)
    {
        const auto boundary = extract_boundary(content_type);
        if (!boundary)
        {
            return std::nullopt;
        }
        const std::string delimiter = "--" + *boundary;

        const auto opening = body.find(delimiter);
        if (opening == std::string_view::npos)
        {
            return std::nullopt;
        }
        const auto headers_begin = opening + delimiter.size();

        const auto headers_end = body.find(kHeaderTerminator, headers_begin);
        if (headers_end == std::string_view::npos)
        {
            return std::nullopt;
        }
        const auto content_begin = headers_end + kHeaderTerminator.size();

        auto filename = extract_filename(body.substr(headers_begin, headers_end - headers_begin));
        if (!filename)
        {
            return std::nullopt;
        }

        // The closing delimiter is `--boundary--`; a following part would start with `--boundary`.
        const auto closing = body.find(delimiter, content_begin);
        if (closing == std::string_view::npos)
        {
            return std::nullopt;
        }

        auto content = body.substr(content_begin, closing - content_begin);
        if (content.ends_with(kCrlf))
        {
            content.remove_suffix(kCrlf.size());
        }

        return MultipartFile{
            .filename = std::move(*filename),
            .content = std::string(content),
        };
    }

} // namespace filegate::multipart

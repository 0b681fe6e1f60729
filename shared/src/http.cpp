#include "filegate/http.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

namespace filegate::http
{

    namespace
    {
        constexpr std::string_view kBearerPrefix = "Bearer ";

        struct StatusMapping
        {
            std::uint16_t status;
            std::string_view reason;
        };

        constexpr std::array<StatusMapping, 13> kStatusMappings{{
            {100, "Continue"},
            {200, "OK"},
            {204, "No Content"},
            {400, "Bad Request"},
            {401, "Unauthorized"},
            {403, "Forbidden"},
            {404, "Not Found"},
            {405, "Method Not Allowed"},
            {408, "Request Timeout"},
            {409, "Conflict"},
            {413, "Payload Too Large"},
            {500, "Internal Server Error"},
            {503, "Service Unavailable"},
        }};

        std::string_view trim(std::string_view text)
        {
            while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
            {
                text.remove_prefix(1);
            }
            while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r'))
            {
                text.remove_suffix(1);
            }
            return text;
        }

        int hex_value(char ch)
        {
            if (ch >= '0' && ch <= '9')
            {
                return ch - '0';
            }
            if (ch >= 'a' && ch <= 'f')
            {
                return ch - 'a' + 10;
            }
            if (ch >= 'A' && ch <= 'F')
            {
                return ch - 'A' + 10;
            }
            return -1;
        }

        bool is_token_char(char ch)
        {
            const auto c = static_cast<unsigned char>(ch);
            return std::isalnum(c) || ch == '-' || ch == '_' || ch == '.' || ch == '!' || ch == '#' || ch == '$' ||
                   ch == '%' || ch == '&' || ch == '\'' || ch == '*' || ch == '+' || ch == '^' || ch == '`' ||
                   ch == '|' || ch == '~';
        }

        // Splits off the next line, accepting both CRLF and bare LF terminators.
        std::string_view next_line(std::string_view &text)
        {
            const auto pos = text.find('\n');
            std::string_view line = pos == std::string_view::npos ? text : text.substr(0, pos);
            text = pos == std::string_view::npos ? std::string_view{} : text.substr(pos + 1);
            if (!line.empty() && line.back() == '\r')
            {
                line.remove_suffix(1);
            }
            return line;
        }

    } // namespace

    std::optional<std::string> Request::header(std::string_view name) const
    {
        const auto it = headers.find(to_lower(name));
        if (it == headers.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::string> Request::query_param(std::string_view name) const
    {
        const auto it = query.find(std::string(name));
        if (it == query.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    void Response::set_header(std::string name, std::string value)
    {
        const auto lowered = to_lower(name);
        for (auto &existing : headers)
        {
            if (to_lower(existing.name) == lowered)
            {
                existing.value = std::move(value);
                return;
            }
        }
        headers.push_back(Header{.name = std::move(name), .value = std::move(value)});
    }

    std::optional<std::string> Response::header(std::string_view name) const
    {
        const auto lowered = to_lower(name);
        for (const auto &existing : headers)
        {
            if (to_lower(existing.name) == lowered)
            {
                return existing.value;
            }
        }
        return std::nullopt;
    }

    std::optional<Request> parse_request_head(std::string_view head)
    {
        auto remaining = head;
        const auto request_line = next_line(remaining);

        const auto first_space = request_line.find(' ');
        if (first_space == std::string_view::npos || first_space == 0)
        {
            return std::nullopt;
        }
        const auto second_space = request_line.find(' ', first_space + 1);
        if (second_space == std::string_view::npos || second_space == first_space + 1)
        {
            return std::nullopt;
        }

        Request request;
        request.method = std::string(request_line.substr(0, first_space));
        request.target = std::string(request_line.substr(first_space + 1, second_space - first_space - 1));
        request.version = std::string(request_line.substr(second_space + 1));

        if (!std::all_of(request.method.begin(), request.method.end(), is_token_char))
        {
            return std::nullopt;
        }
        if (!request.version.starts_with("HTTP/1."))
        {
            return std::nullopt;
        }
        if (request.target.empty() || request.target.front() != '/')
        {
            return std::nullopt;
        }

        const auto query_pos = request.target.find('?');
        const std::string_view target_view = request.target;
        request.path = url_decode(target_view.substr(0, query_pos));
        if (query_pos != std::string::npos)
        {
            request.query = parse_query(target_view.substr(query_pos + 1));
        }

        while (!remaining.empty())
        {
            const auto line = next_line(remaining);
            if (line.empty())
            {
                break;
            }
            if (line.front() == ' ' || line.front() == '\t')
            {
                // Obsolete line folding.
                return std::nullopt;
            }
            const auto colon = line.find(':');
            if (colon == std::string_view::npos || colon == 0)
            {
                return std::nullopt;
            }
            const auto name = line.substr(0, colon);
            if (!std::all_of(name.begin(), name.end(), is_token_char))
            {
                return std::nullopt;
            }
            request.headers[to_lower(name)] = std::string(trim(line.substr(colon + 1)));
        }

        return request;
    }

    std::map<std::string, std::string> parse_query(std::string_view query)
    {
        std::map<std::string, std::string> result;
        while (!query.empty())
        {
            const auto amp = query.find('&');
            const auto pair = query.substr(0, amp);
            query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

            const auto eq = pair.find('=');
            if (eq == std::string_view::npos)
            {
                continue;
            }
            result[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        }
        return result;
    }

    std::string url_decode(std::string_view text)
    {
        std::string output;
        output.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            if (text[i] == '%' && i + 2 < text.size())
            {
                const int high = hex_value(text[i + 1]);
                const int low = hex_value(text[i + 2]);
                if (high >= 0 && low >= 0)
                {
                    output.push_back(static_cast<char>((high << 4) | low));
                    i += 2;
                    continue;
                }
            }
            output.push_back(text[i]);
        }
        return output;
    }

    std::optional<std::uint64_t> content_length(const Request &request)
    {
        const auto value = request.header("Content-Length");
        if (!value)
        {
            return 0;
        }
        std::uint64_t length = 0;
        const auto *begin = value->data();
        const auto *end = value->data() + value->size();
        const auto [ptr, ec] = std::from_chars(begin, end, length);
        if (ec != std::errc{} || ptr != end || value->empty())
        {
            return std::nullopt;
        }
        return length;
    }

    std::optional<std::string> bearer_token(const Request &request)
    {
        const auto value = request.header("Authorization");
        if (!value || !value->starts_with(kBearerPrefix))
        {
            return std::nullopt;
        }
        auto token = std::string(trim(std::string_view(*value).substr(kBearerPrefix.size())));
        if (token.empty())
        {
            return std::nullopt;
        }
        return token;
    }

    std::string_view reason_phrase(std::uint16_t status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.reason;
            }
        }
        return "Unknown";
    }

    std::string serialize_head(const Response &response, std::uint64_t content_length)
    {
        std::string head;
        head.reserve(256);
        head += "HTTP/1.1 ";
        head += std::to_string(response.status);
        head += ' ';
        head += reason_phrase(response.status);
        head += "\r\n";
        for (const auto &header : response.headers)
        {
            head += header.name;
            head += ": ";
            head += header.value;
            head += "\r\n";
        }
        head += "Content-Length: ";
        head += std::to_string(content_length);
        head += "\r\nConnection: close\r\n\r\n";
        return head;
    }

    std::string to_lower(std::string_view text)
    {
        std::string lowered(text);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch)
                       { return static_cast<char>(std::tolower(ch)); });
        return lowered;
    }

} // namespace filegate::http

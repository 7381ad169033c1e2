#include "location.hpp"

#include <algorithm>
#include <cctype>

namespace tabshell
{

namespace
{

std::string to_lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(),
                   out.end(),
                   out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_scheme_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

// Strip "user:pass@" and ":port" from an authority.
std::string host_from_authority(std::string_view authority)
{
    auto at = authority.rfind('@');
    if (at != std::string_view::npos)
        authority.remove_prefix(at + 1);

    if (!authority.empty() && authority.front() == '[')
    {
        auto close = authority.find(']');
        if (close == std::string_view::npos)
            return {};
        return to_lower(authority.substr(1, close - 1));
    }

    auto colon = authority.find(':');
    if (colon != std::string_view::npos)
        authority = authority.substr(0, colon);
    return to_lower(authority);
}

}   // namespace

std::optional<ParsedLocation> parse_location(std::string_view location)
{
    auto colon = location.find(':');
    if (colon == std::string_view::npos || colon == 0)
        return std::nullopt;
    if (!std::isalpha(static_cast<unsigned char>(location[0])))
        return std::nullopt;
    for (size_t i = 1; i < colon; ++i)
    {
        if (!is_scheme_char(location[i]))
            return std::nullopt;
    }

    ParsedLocation parsed;
    parsed.scheme = to_lower(location.substr(0, colon));

    std::string_view rest = location.substr(colon + 1);
    if (rest.substr(0, 2) == "//")
    {
        rest.remove_prefix(2);
        auto end = rest.find_first_of("/?#");
        parsed.host = host_from_authority(rest.substr(0, end));
        rest        = end == std::string_view::npos ? std::string_view{} : rest.substr(end);
    }
    parsed.rest = std::string(rest);
    return parsed;
}

std::string derive_title(std::string_view location, std::string_view placeholder)
{
    auto parsed = parse_location(location);
    if (!parsed)
        return location.empty() ? std::string(placeholder) : std::string(location);
    if (parsed->host.empty())
        return std::string(placeholder);
    return parsed->host;
}

std::string derive_icon(std::string_view location)
{
    auto parsed = parse_location(location);
    if (!parsed || parsed->host.empty())
        return {};
    return parsed->scheme + "://" + parsed->host + "/favicon.ico";
}

}   // namespace tabshell

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tabshell
{

// Pieces of an absolute location ("scheme:[//authority]path...").
struct ParsedLocation
{
    std::string scheme;   // lower-case, without ':'
    std::string host;     // lower-case, no userinfo, no port, no brackets
    std::string rest;     // path + query + fragment, verbatim
};

// nullopt when `location` has no valid scheme.
std::optional<ParsedLocation> parse_location(std::string_view location);

// Placeholder title shown before the page reports one: the host of an
// absolute URL, `placeholder` when the URL has no host (about:blank), or
// the raw text when it is not a URL at all.
std::string derive_title(std::string_view location, std::string_view placeholder);

// "scheme://host/favicon.ico", or empty when there is no host.
std::string derive_icon(std::string_view location);

inline bool is_blank(std::string_view location, std::string_view blank)
{
    return location.empty() || location == blank;
}

}   // namespace tabshell

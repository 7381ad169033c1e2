#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <tabshell/config.hpp>
#include <tabshell/logger.hpp>

namespace tabshell
{

// ─── Validation ──────────────────────────────────────────────────────────────

int ShellConfig::validate()
{
    const ShellConfig defaults;
    int               fixed = 0;

    auto fix_positive = [&](int& value, int fallback)
    {
        if (value <= 0)
        {
            value = fallback;
            ++fixed;
        }
    };
    auto fix_non_negative = [&](int& value, int fallback)
    {
        if (value < 0)
        {
            value = fallback;
            ++fixed;
        }
    };
    auto fix_non_empty = [&](std::string& value, const std::string& fallback)
    {
        if (value.empty())
        {
            value = fallback;
            ++fixed;
        }
    };

    fix_positive(min_window_width, defaults.min_window_width);
    fix_positive(min_window_height, defaults.min_window_height);
    fix_positive(default_window_width, defaults.default_window_width);
    fix_positive(default_window_height, defaults.default_window_height);
    if (default_window_width < min_window_width)
    {
        default_window_width = min_window_width;
        ++fixed;
    }
    if (default_window_height < min_window_height)
    {
        default_window_height = min_window_height;
        ++fixed;
    }
    fix_non_negative(tab_strip_height, defaults.tab_strip_height);
    if (tab_strip_height >= min_window_height)
    {
        tab_strip_height = defaults.tab_strip_height < min_window_height ? defaults.tab_strip_height : 0;
        ++fixed;
    }

    fix_non_empty(blank_location, defaults.blank_location);
    fix_non_empty(new_tab_title, defaults.new_tab_title);
    fix_non_empty(failed_load_title, defaults.failed_load_title);

    fix_non_negative(network_phase_delay_ms, defaults.network_phase_delay_ms);
    fix_non_negative(completion_phase_delay_ms, defaults.completion_phase_delay_ms);
    // Completion is the second phase; it may not overtake the first.
    if (completion_phase_delay_ms < network_phase_delay_ms)
    {
        completion_phase_delay_ms = network_phase_delay_ms;
        ++fixed;
    }

    // An unknown name is the only input whose result depends on the fallback.
    if (Logger::level_from_string(log_level, LogLevel::Trace)
        != Logger::level_from_string(log_level, LogLevel::Critical))
    {
        log_level = defaults.log_level;
        ++fixed;
    }

    if (fixed > 0)
        TABSHELL_LOG_WARN("config", "corrected {} out-of-range settings", fixed);
    return fixed;
}

// ─── JSON serialization ──────────────────────────────────────────────────────

static std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

static std::string unescape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] != '\\' || i + 1 >= s.size())
        {
            out += s[i];
            continue;
        }
        char next = s[++i];
        switch (next)
        {
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            case 't':
                out += '\t';
                break;
            default:
                out += next;
                break;
        }
    }
    return out;
}

std::string ShellConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << CURRENT_VERSION << ",\n";
    os << "  \"window\": {\n";
    os << "    \"default_width\": " << default_window_width << ",\n";
    os << "    \"default_height\": " << default_window_height << ",\n";
    os << "    \"min_width\": " << min_window_width << ",\n";
    os << "    \"min_height\": " << min_window_height << ",\n";
    os << "    \"tab_strip_height\": " << tab_strip_height << "\n";
    os << "  },\n";
    os << "  \"tabs\": {\n";
    os << "    \"blank_location\": \"" << escape_json(blank_location) << "\",\n";
    os << "    \"new_tab_title\": \"" << escape_json(new_tab_title) << "\",\n";
    os << "    \"failed_load_title\": \"" << escape_json(failed_load_title) << "\"\n";
    os << "  },\n";
    os << "  \"loading\": {\n";
    os << "    \"network_phase_delay_ms\": " << network_phase_delay_ms << ",\n";
    os << "    \"completion_phase_delay_ms\": " << completion_phase_delay_ms << "\n";
    os << "  },\n";
    os << "  \"drag\": {\n";
    os << "    \"new_window_offset_x\": " << drag_new_window_offset_x << ",\n";
    os << "    \"new_window_offset_y\": " << drag_new_window_offset_y << "\n";
    os << "  },\n";
    os << "  \"log_level\": \"" << escape_json(log_level) << "\"\n";
    os << "}\n";
    return os.str();
}

// Minimal reader for the flat keys this document uses.  Keys are unique
// across sections, so section nesting is not tracked.
static size_t find_value(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return std::string::npos;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::string::npos;
    return json.find_first_not_of(" \t\r\n", pos + 1);
}

static bool read_json_string(const std::string& json, const std::string& key, std::string& out)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos || json[pos] != '"')
        return false;
    size_t end = pos + 1;
    while (end < json.size())
    {
        if (json[end] == '"' && json[end - 1] != '\\')
            break;
        ++end;
    }
    if (end >= json.size())
        return false;
    out = unescape_json(json.substr(pos + 1, end - pos - 1));
    return true;
}

static bool read_json_int(const std::string& json, const std::string& key, int& out)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return false;
    const char* begin = json.c_str() + pos;
    char*       end   = nullptr;
    long        value = std::strtol(begin, &end, 10);
    if (end == begin)
        return false;
    out = static_cast<int>(value);
    return true;
}

bool ShellConfig::deserialize(const std::string& json)
{
    if (json.empty() || json.find('{') == std::string::npos)
        return false;

    int version = CURRENT_VERSION;
    if (read_json_int(json, "version", version) && version > CURRENT_VERSION)
    {
        TABSHELL_LOG_WARN("config", "refusing config version {} (newest known is {})", version,
                          CURRENT_VERSION);
        return false;
    }

    ShellConfig next = *this;
    read_json_int(json, "default_width", next.default_window_width);
    read_json_int(json, "default_height", next.default_window_height);
    read_json_int(json, "min_width", next.min_window_width);
    read_json_int(json, "min_height", next.min_window_height);
    read_json_int(json, "tab_strip_height", next.tab_strip_height);
    read_json_string(json, "blank_location", next.blank_location);
    read_json_string(json, "new_tab_title", next.new_tab_title);
    read_json_string(json, "failed_load_title", next.failed_load_title);
    read_json_int(json, "network_phase_delay_ms", next.network_phase_delay_ms);
    read_json_int(json, "completion_phase_delay_ms", next.completion_phase_delay_ms);
    read_json_int(json, "new_window_offset_x", next.drag_new_window_offset_x);
    read_json_int(json, "new_window_offset_y", next.drag_new_window_offset_y);
    read_json_string(json, "log_level", next.log_level);

    *this = std::move(next);
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool ShellConfig::save(const std::string& path) const
{
    auto            dir = std::filesystem::path(path).parent_path();
    std::error_code ec;
    if (!dir.empty())
    {
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            TABSHELL_LOG_ERROR("config", "cannot create {}: {}", dir.string(), ec.message());
            return false;
        }
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        TABSHELL_LOG_ERROR("config", "cannot write {}", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool ShellConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        TABSHELL_LOG_DEBUG("config", "no config at {}, keeping defaults", path);
        return false;
    }
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!deserialize(json))
        return false;
    validate();
    TABSHELL_LOG_INFO("config", "loaded {}", path);
    return true;
}

std::string ShellConfig::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "shell.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "tabshell";
    return (dir / "shell.json").string();
}

}   // namespace tabshell

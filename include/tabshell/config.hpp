#pragma once

#include <string>

namespace tabshell
{

// Tunables for the shell core.  Defaults match the stock desktop shell.
// Persisted as a small versioned JSON document (see save()/load()).
struct ShellConfig
{
    static constexpr int CURRENT_VERSION = 1;

    // Window geometry
    int default_window_width  = 1200;
    int default_window_height = 800;
    int min_window_width      = 600;
    int min_window_height     = 400;

    // Height of the tab strip/toolbar reserved above each surface.
    int tab_strip_height = 60;

    // Placeholders
    std::string blank_location    = "about:blank";
    std::string new_tab_title     = "New Tab";
    std::string failed_load_title = "Problem loading page";

    // Simulated load phases, measured from load start.
    int network_phase_delay_ms    = 100;
    int completion_phase_delay_ms = 500;

    // Where a window spawned by dropping a tab outside every window goes,
    // relative to the drop point.
    int drag_new_window_offset_x = -100;
    int drag_new_window_offset_y = -30;

    std::string log_level = "info";

    // Restore defaults for anything out of range.  Returns the number of
    // fields that were corrected.
    int validate();

    std::string serialize() const;
    // Returns false (and leaves *this untouched) for empty input or a
    // document from a newer version.  Missing keys keep their value.
    bool deserialize(const std::string& json);

    bool save(const std::string& path) const;
    bool load(const std::string& path);

    // ~/.config/tabshell/shell.json
    static std::string default_path();
};

}   // namespace tabshell

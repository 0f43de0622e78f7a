#pragma once

#include <string>
#include <format>
#include <string_view>

void init_localization();
void load_strings_from(const std::string& file_path);
const std::string& get_string(const std::string& key);

// Formats a catalogue entry with std::format style placeholders.
template<typename... Args>
std::string string_format(const std::string& key, Args&&... args) {
    try {
        return std::vformat(get_string(key), std::make_format_args(args...));
    } catch (const std::format_error& e) {
        return "googet formatting error [key: " + key + "]: " + e.what();
    }
}

#include "localization.hpp"

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <unordered_map>

namespace {
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;
    std::mutex missing_mutex;

    std::string l10n_dir() {
        if (const char* dir = std::getenv("GOOGET_L10N_DIR"); dir && *dir) {
            std::string d(dir);
            if (d.back() != '/') d += '/';
            return d;
        }
        return GOOGET_L10N_DIR;
    }
}

void load_strings_from(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) return;

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        if (line.back() == '\r') line.pop_back();
        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            translations[line.substr(0, pos)] = line.substr(pos + 1);
        }
    }
}

void init_localization() {
    const char* lang_env = std::getenv("LANG");
    std::string lang = "en";
    if (lang_env && std::string(lang_env).size() >= 2) {
        lang = std::string(lang_env).substr(0, 2);
    }

    const std::string dir = l10n_dir();
    if (lang != "en") {
        load_strings_from(dir + "en.txt");
    }
    // Entries of the requested language override the English defaults.
    load_strings_from(dir + lang + ".txt");
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    std::lock_guard<std::mutex> lock(missing_mutex);
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}

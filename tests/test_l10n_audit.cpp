#include <gtest/gtest.h>
#include "localization.hpp"

#include <filesystem>
#include <fstream>
#include <regex>
#include <set>
#include <string>

namespace fs = std::filesystem;

class L10nIntegrityTest : public ::testing::Test {
protected:
    void SetUp() override {
        setenv("GOOGET_L10N_DIR", GOOGET_SOURCE_DIR "/l10n/", 0);
        init_localization();
    }

    static std::string slurp(const fs::path& p) {
        std::ifstream f(p);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }

    static std::vector<fs::path> sources() {
        std::vector<fs::path> files;
        for (const auto& entry : fs::directory_iterator(fs::path(GOOGET_SOURCE_DIR) / "src")) {
            const auto ext = entry.path().extension();
            if (entry.is_regular_file() && (ext == ".cpp" || ext == ".hpp")) files.push_back(entry.path());
        }
        return files;
    }

    // Keys passed as literals to get_string or string_format.
    static std::set<std::string> keys_used_in_sources() {
        std::set<std::string> keys;
        const std::regex key_regex("(?:get_string|string_format)\\s*\\(\\s*\"([^\"]+)\"");
        for (const auto& file : sources()) {
            const std::string content = slurp(file);
            for (auto it = std::sregex_iterator(content.begin(), content.end(), key_regex); it != std::sregex_iterator(); ++it) {
                keys.insert((*it)[1].str());
            }
        }
        return keys;
    }

    static std::set<std::string> catalogue_keys() {
        std::set<std::string> keys;
        std::ifstream f(fs::path(GOOGET_SOURCE_DIR) / "l10n" / "en.txt");
        std::string line;
        while (std::getline(f, line)) {
            if (line.empty() || line[0] == '#') continue;
            if (const size_t eq = line.find('='); eq != std::string::npos) keys.insert(line.substr(0, eq));
        }
        return keys;
    }
};

TEST_F(L10nIntegrityTest, AllSourceKeysExistInTranslations) {
    const auto source_keys = keys_used_in_sources();
    ASSERT_FALSE(source_keys.empty());

    std::string missing;
    for (const auto& key : source_keys) {
        if (get_string(key).find("[MISSING_STRING:") != std::string::npos) missing += key + ", ";
    }
    EXPECT_TRUE(missing.empty()) << "Keys missing from en.txt: " << missing;
}

TEST_F(L10nIntegrityTest, EveryCatalogueEntryIsReferenced) {
    std::string all_sources;
    for (const auto& file : sources()) all_sources += slurp(file);

    std::string unused;
    for (const auto& key : catalogue_keys()) {
        if (all_sources.find("\"" + key + "\"") == std::string::npos) unused += key + ", ";
    }
    EXPECT_TRUE(unused.empty()) << "Catalogue entries no source refers to: " << unused;
}

TEST_F(L10nIntegrityTest, FormattingSubstitutesArguments) {
    EXPECT_EQ(string_format("error.unknown_command", std::string("frobnicate")).find("{}"), std::string::npos);
    EXPECT_NE(string_format("error.unknown_command", std::string("frobnicate")).find("frobnicate"), std::string::npos);
}

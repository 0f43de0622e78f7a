#pragma once

#include <compare>
#include <string>
#include <string_view>

// A package version. Holds the original text; ordering is defined by compare().
class Version {
public:
    Version() = default;

    // Throws MalformedIdentifier for empty text, whitespace or empty components.
    static Version parse(std::string_view text);
    static bool is_valid(std::string_view text);

    const std::string& str() const { return text_; }
    bool empty() const { return text_.empty(); }

    // Returns <0, 0 or >0. Zero only for textually identical versions.
    static int compare(std::string_view a, std::string_view b);

    friend bool operator==(const Version& a, const Version& b) { return a.text_ == b.text_; }
    friend std::strong_ordering operator<=>(const Version& a, const Version& b) {
        return compare(a.text_, b.text_) <=> 0;
    }

private:
    explicit Version(std::string text) : text_(std::move(text)) {}

    std::string text_;
};

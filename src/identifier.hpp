#pragma once

#include "version.hpp"

#include <optional>
#include <string>
#include <string_view>

inline constexpr std::string_view NOARCH = "noarch";

// name.arch.version; arch and version may be empty for partial references.
struct PackageId {
    std::string name;
    std::string arch;
    std::string version;

    // "name", "name.arch" or "name.arch.version".
    std::string to_string() const;
    // "name.arch", the database key.
    std::string key() const;
    // name.arch.version.goo
    std::string archive_name() const;

    bool operator==(const PackageId&) const = default;
};

// Splits on the first two dots. Throws MalformedIdentifier.
PackageId parse_package_id(std::string_view text);

// Like parse_package_id but also requires arch and a valid version.
PackageId parse_full_package_id(std::string_view text);

// A name.arch.version predicate. Each position is "*" or an exact value; the
// version position additionally accepts "V+" for "at least V". Omitted
// positions match anything.
class PackagePattern {
public:
    static PackagePattern parse(std::string_view text);

    bool matches(const PackageId& id) const;
    bool matches(std::string_view name, std::string_view arch, std::string_view version) const;

    const std::string& name() const { return name_; }
    const std::string& text() const { return text_; }

private:
    std::string text_;
    std::string name_;
    std::optional<std::string> arch_;
    std::optional<std::string> version_;
    bool version_at_least_ = false;
};

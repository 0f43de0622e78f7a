#include "identifier.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <cctype>

namespace {

bool valid_token(std::string_view s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (std::isspace(c) || !std::isprint(c)) return false;
    }
    return true;
}

[[noreturn]] void malformed(std::string_view text) {
    throw GoogetException(string_format("error.malformed_identifier", std::string(text)), ErrorKind::MalformedIdentifier);
}

} // anonymous namespace

std::string PackageId::to_string() const {
    if (!arch.empty() && !version.empty()) return name + "." + arch + "." + version;
    if (!arch.empty()) return name + "." + arch;
    return name;
}

std::string PackageId::key() const {
    return name + "." + arch;
}

std::string PackageId::archive_name() const {
    return name + "." + arch + "." + version + ".goo";
}

PackageId parse_package_id(std::string_view text) {
    PackageId id;
    const size_t first = text.find('.');
    if (first == std::string_view::npos) {
        id.name = std::string(text);
    } else {
        id.name = std::string(text.substr(0, first));
        std::string_view rest = text.substr(first + 1);
        const size_t second = rest.find('.');
        if (second == std::string_view::npos) {
            id.arch = std::string(rest);
            if (id.arch.empty()) malformed(text);
        } else {
            id.arch = std::string(rest.substr(0, second));
            id.version = std::string(rest.substr(second + 1));
            if (id.arch.empty() || !Version::is_valid(id.version)) malformed(text);
        }
    }
    if (!valid_token(id.name) || (!id.arch.empty() && !valid_token(id.arch))) malformed(text);
    return id;
}

PackageId parse_full_package_id(std::string_view text) {
    PackageId id = parse_package_id(text);
    if (id.arch.empty() || id.version.empty()) malformed(text);
    return id;
}

PackagePattern PackagePattern::parse(std::string_view text) {
    PackagePattern p;
    p.text_ = std::string(text);

    const size_t first = text.find('.');
    p.name_ = std::string(text.substr(0, first));
    if (first != std::string_view::npos) {
        std::string_view rest = text.substr(first + 1);
        const size_t second = rest.find('.');
        std::string arch(rest.substr(0, second));
        if (arch.empty()) malformed(text);
        if (arch != "*") p.arch_ = arch;
        if (second != std::string_view::npos) {
            std::string ver(rest.substr(second + 1));
            if (ver.empty()) malformed(text);
            if (ver != "*") {
                if (ver.back() == '+') {
                    ver.pop_back();
                    p.version_at_least_ = true;
                }
                if (!Version::is_valid(ver)) malformed(text);
                p.version_ = ver;
            }
        }
    }
    if (!valid_token(p.name_)) malformed(text);
    return p;
}

bool PackagePattern::matches(std::string_view name, std::string_view arch, std::string_view version) const {
    if (name_ != "*" && name_ != name) return false;
    if (arch_ && *arch_ != arch) return false;
    if (version_) {
        if (version_at_least_) return Version::compare(version, *version_) >= 0;
        return *version_ == version;
    }
    return true;
}

bool PackagePattern::matches(const PackageId& id) const {
    return matches(id.name, id.arch, id.version);
}

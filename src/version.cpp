#include "version.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace {

struct VersionParts {
    std::string_view release;
    std::string_view pre;
    std::string_view build;
    std::string_view release_number; // after '@', compared numerically
    bool has_pre = false;
};

VersionParts split_parts(std::string_view v) {
    VersionParts parts;
    if (const size_t at = v.rfind('@'); at != std::string_view::npos) {
        parts.release_number = v.substr(at + 1);
        v = v.substr(0, at);
    }
    const size_t first = v.find_first_of("-+");
    if (first == std::string_view::npos) {
        parts.release = v;
        return parts;
    }
    parts.release = v.substr(0, first);
    std::string_view rest = v.substr(first + 1);
    if (v[first] == '-') {
        parts.has_pre = true;
        const size_t plus = rest.find('+');
        parts.pre = rest.substr(0, plus);
        if (plus != std::string_view::npos) parts.build = rest.substr(plus + 1);
    } else {
        parts.build = rest;
    }
    return parts;
}

std::vector<std::string_view> components(std::string_view s) {
    std::vector<std::string_view> out;
    if (s.empty()) return out;
    size_t start = 0;
    while (true) {
        const size_t end = s.find_first_of(".-+", start);
        out.push_back(s.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
        if (end == std::string_view::npos) break;
        start = end + 1;
    }
    return out;
}

bool is_numeric(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::string_view strip_zeros(std::string_view s) {
    const size_t nz = s.find_first_not_of('0');
    return nz == std::string_view::npos ? std::string_view("0") : s.substr(nz);
}

int compare_component(std::string_view a, std::string_view b) {
    const bool na = is_numeric(a);
    const bool nb = is_numeric(b);
    if (na && nb) {
        const auto sa = strip_zeros(a);
        const auto sb = strip_zeros(b);
        if (sa.size() != sb.size()) return sa.size() < sb.size() ? -1 : 1;
        const int c = sa.compare(sb);
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (na != nb) return na ? -1 : 1;
    const int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

int compare_lists(const std::vector<std::string_view>& a, const std::vector<std::string_view>& b) {
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        if (int c = compare_component(a[i], b[i]); c != 0) return c;
    }
    if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
    return 0;
}

} // anonymous namespace

bool Version::is_valid(std::string_view text) {
    if (text.empty()) return false;
    for (unsigned char c : text) {
        if (std::isspace(c) || !std::isprint(c)) return false;
    }
    if (const size_t at = text.find('@'); at != std::string_view::npos) {
        if (at == 0 || !is_numeric(text.substr(at + 1))) return false;
        text = text.substr(0, at);
    }
    const size_t n = text.size();
    for (size_t i = 0; i < n; ++i) {
        const bool sep = text[i] == '.' || text[i] == '-' || text[i] == '+';
        if (!sep) continue;
        if (i == 0 || i == n - 1) return false;
        const char prev = text[i - 1];
        if (prev == '.' || prev == '-' || prev == '+') return false;
    }
    return true;
}

Version Version::parse(std::string_view text) {
    if (!is_valid(text)) {
        throw GoogetException(string_format("error.invalid_version", std::string(text)), ErrorKind::MalformedIdentifier);
    }
    return Version(std::string(text));
}

int Version::compare(std::string_view a, std::string_view b) {
    const VersionParts pa = split_parts(a);
    const VersionParts pb = split_parts(b);

    if (int c = compare_lists(components(pa.release), components(pb.release)); c != 0) return c;

    // A pre-release sorts before the plain release it precedes.
    if (pa.has_pre != pb.has_pre) return pa.has_pre ? -1 : 1;
    if (int c = compare_lists(components(pa.pre), components(pb.pre)); c != 0) return c;

    // A missing release number counts as @0.
    const std::string_view ra = pa.release_number.empty() ? std::string_view("0") : pa.release_number;
    const std::string_view rb = pb.release_number.empty() ? std::string_view("0") : pb.release_number;
    if (int c = compare_component(ra, rb); c != 0) return c;

    if (int c = compare_lists(components(pa.build), components(pb.build)); c != 0) return c;

    const int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

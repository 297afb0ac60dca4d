/// @file iri.cpp
/// @brief RFC 3986 reference resolution, relativization and blank node labels

#include <jsonld_engine/syntax/iri.hpp>

#include <cctype>
#include <vector>

namespace jsonld_syntax {

namespace {

/// Length of the scheme (excluding ':'), or 0 if none
std::size_t scheme_length(std::string_view str) noexcept {
    if (str.empty() || !std::isalpha(static_cast<unsigned char>(str[0]))) {
        return 0;
    }
    for (std::size_t i = 1; i < str.size(); ++i) {
        char c = str[i];
        if (c == ':') {
            return i;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return 0;
        }
    }
    return 0;
}

std::vector<std::string> split_segments(const std::string& path) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (true) {
        std::size_t pos = path.find('/', start);
        if (pos == std::string::npos) {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, pos - start));
        start = pos + 1;
    }
    return segments;
}

} // anonymous namespace

// =============================================================================
// IriRef
// =============================================================================

IriRef IriRef::parse(std::string_view str) {
    IriRef ref;

    std::size_t scheme_len = scheme_length(str);
    if (scheme_len > 0) {
        ref.scheme = std::string(str.substr(0, scheme_len));
        str.remove_prefix(scheme_len + 1);
    }

    std::size_t hash = str.find('#');
    if (hash != std::string_view::npos) {
        ref.fragment = std::string(str.substr(hash + 1));
        str = str.substr(0, hash);
    }

    std::size_t question = str.find('?');
    if (question != std::string_view::npos) {
        ref.query = std::string(str.substr(question + 1));
        str = str.substr(0, question);
    }

    if (str.size() >= 2 && str[0] == '/' && str[1] == '/') {
        str.remove_prefix(2);
        std::size_t slash = str.find('/');
        ref.authority = std::string(str.substr(0, slash));
        str = slash == std::string_view::npos ? std::string_view{} : str.substr(slash);
    }

    ref.path = std::string(str);
    return ref;
}

std::string IriRef::to_string() const {
    std::string result;
    if (scheme) {
        result += *scheme;
        result += ':';
    }
    if (authority) {
        result += "//";
        result += *authority;
    }
    result += path;
    if (query) {
        result += '?';
        result += *query;
    }
    if (fragment) {
        result += '#';
        result += *fragment;
    }
    return result;
}

// =============================================================================
// Classification
// =============================================================================

bool is_absolute_iri(std::string_view str) noexcept {
    return scheme_length(str) > 0;
}

bool ends_with_gen_delim(std::string_view str) noexcept {
    if (str.empty()) {
        return false;
    }
    switch (str.back()) {
        case ':': case '/': case '?': case '#': case '[': case ']': case '@':
            return true;
        default:
            return false;
    }
}

std::optional<std::pair<std::string, std::string>> compact_iri_split(std::string_view str) {
    std::size_t colon = str.find(':', 1);
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    return std::make_pair(std::string(str.substr(0, colon)), std::string(str.substr(colon + 1)));
}

// =============================================================================
// Resolution
// =============================================================================

std::string remove_dot_segments(std::string_view path) {
    std::string input(path);
    std::string output;

    auto drop_last_segment = [&output]() {
        std::size_t pos = output.rfind('/');
        output.erase(pos == std::string::npos ? 0 : pos);
    };

    while (!input.empty()) {
        if (input.rfind("../", 0) == 0) {
            input.erase(0, 3);
        } else if (input.rfind("./", 0) == 0) {
            input.erase(0, 2);
        } else if (input.rfind("/./", 0) == 0) {
            input.replace(0, 3, "/");
        } else if (input == "/.") {
            input = "/";
        } else if (input.rfind("/../", 0) == 0) {
            input.replace(0, 4, "/");
            drop_last_segment();
        } else if (input == "/..") {
            input = "/";
            drop_last_segment();
        } else if (input == "." || input == "..") {
            input.clear();
        } else {
            std::size_t next = input.find('/', input[0] == '/' ? 1 : 0);
            output += input.substr(0, next);
            input.erase(0, next);
        }
    }

    return output;
}

std::optional<std::string> resolve_iri(std::string_view base, std::string_view reference) {
    IriRef r = IriRef::parse(reference);
    IriRef t;

    if (r.scheme) {
        t = r;
        t.path = remove_dot_segments(r.path);
        return t.to_string();
    }

    IriRef b = IriRef::parse(base);
    if (!b.scheme) {
        return std::nullopt;
    }

    if (r.authority) {
        t.authority = r.authority;
        t.path = remove_dot_segments(r.path);
        t.query = r.query;
    } else {
        if (r.path.empty()) {
            t.path = b.path;
            t.query = r.query ? r.query : b.query;
        } else {
            if (r.path[0] == '/') {
                t.path = remove_dot_segments(r.path);
            } else {
                // Merge (section 5.2.3)
                std::string merged;
                if (b.authority && b.path.empty()) {
                    merged = "/" + r.path;
                } else {
                    std::size_t slash = b.path.rfind('/');
                    merged = slash == std::string::npos ? r.path : b.path.substr(0, slash + 1) + r.path;
                }
                t.path = remove_dot_segments(merged);
            }
            t.query = r.query;
        }
        t.authority = b.authority;
    }

    t.scheme = b.scheme;
    t.fragment = r.fragment;
    return t.to_string();
}

std::string relativize_iri(std::string_view base, std::string_view iri) {
    IriRef b = IriRef::parse(base);
    IriRef i = IriRef::parse(iri);

    if (!b.scheme || b.scheme != i.scheme || b.authority != i.authority
        || i.path.empty() || i.path[0] != '/') {
        return std::string(iri);
    }

    // Same document and query: the fragment alone is enough
    if (i.path == b.path && i.query == b.query && i.fragment) {
        return "#" + *i.fragment;
    }

    std::vector<std::string> base_dir = split_segments(b.path.empty() ? "/" : remove_dot_segments(b.path));
    std::vector<std::string> segments = split_segments(remove_dot_segments(i.path));

    // The last base segment is a document name, not a directory
    base_dir.pop_back();

    std::size_t common = 0;
    while (common < base_dir.size() && common + 1 < segments.size()
           && base_dir[common] == segments[common]) {
        ++common;
    }

    std::string result;
    for (std::size_t n = common; n < base_dir.size(); ++n) {
        result += "../";
    }
    for (std::size_t n = common; n < segments.size(); ++n) {
        result += segments[n];
        if (n + 1 < segments.size()) {
            result += '/';
        }
    }

    // A leading segment holding ':' would be read as a scheme
    std::size_t colon = result.find(':');
    if (result.empty() || (colon != std::string::npos && colon < result.find('/'))) {
        result = "./" + result;
    }

    if (i.query) {
        result += "?" + *i.query;
    }
    if (i.fragment) {
        result += "#" + *i.fragment;
    }
    return result;
}

std::string lowercase(std::string_view str) {
    std::string result(str);
    for (auto& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

bool is_well_formed_language_tag(std::string_view tag) {
    bool first = true;
    std::size_t start = 0;
    while (start <= tag.size()) {
        std::size_t end = tag.find('-', start);
        if (end == std::string_view::npos) {
            end = tag.size();
        }
        const std::string_view subtag = tag.substr(start, end - start);
        if (subtag.empty() || subtag.size() > 8) {
            return false;
        }
        for (char c : subtag) {
            const auto uc = static_cast<unsigned char>(c);
            if (first ? !std::isalpha(uc) : !std::isalnum(uc)) {
                return false;
            }
        }
        first = false;
        start = end + 1;
    }
    return true;
}

// =============================================================================
// BlankNodeIssuer
// =============================================================================

std::string BlankNodeIssuer::issue(const std::string& existing) {
    auto it = m_issued.find(existing);
    if (it != m_issued.end()) {
        return it->second;
    }
    std::string label = issue_fresh();
    m_issued.emplace(existing, label);
    return label;
}

std::string BlankNodeIssuer::issue_fresh() {
    return m_prefix + std::to_string(m_counter++);
}

} // namespace jsonld_syntax

#pragma once

/// @file inverse_context.hpp
/// @brief Inverse context used for term selection during compaction

#include "fwd.hpp"

#include <map>
#include <string>
#include <vector>

namespace jsonld_context {

/// Per-container preferences of one IRI
struct InverseEntry {
    std::map<std::string, std::string> language;
    std::map<std::string, std::string> type;
    std::map<std::string, std::string> any;
};

/// Map from IRI to container key to type/language preference to term.
///
/// Terms are inserted shortest first, then lexicographically, and the first
/// term inserted for a slot wins.
class InverseContext {
public:
    /// Build from a context's terms and defaults
    [[nodiscard]] static InverseContext build(const ContextData& data);

    /// True if some term maps to the IRI
    [[nodiscard]] bool contains(const std::string& iri) const {
        return m_entries.find(iri) != m_entries.end();
    }

    /// Term selection.
    /// @param containers candidate container keys in order of preference
    /// @param type_language "@language", "@type" or "@any"
    /// @param preferred candidate values in order of preference
    /// @return the selected term or nullptr
    [[nodiscard]] const std::string* select_term(
        const std::string& iri,
        const std::vector<std::string>& containers,
        const std::string& type_language,
        const std::vector<std::string>& preferred) const;

    /// Number of IRIs with at least one term
    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }

private:
    std::map<std::string, std::map<std::string, InverseEntry>> m_entries;
};

} // namespace jsonld_context

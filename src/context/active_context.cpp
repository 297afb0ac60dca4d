/// @file active_context.cpp
/// @brief Active context snapshots

#include <jsonld_engine/context/active_context.hpp>

namespace jsonld_context {

bool ContextData::has_protected_terms() const {
    for (const auto& [name, term] : terms) {
        if (term && term->is_protected) {
            return true;
        }
    }
    return false;
}

ContextPtr ActiveContext::create(std::optional<std::string> base_iri) {
    ContextData data;
    data.original_base_url = base_iri;
    data.base_iri = std::move(base_iri);
    return freeze(std::move(data));
}

ContextPtr ActiveContext::freeze(ContextData data) {
    return std::make_shared<const ActiveContext>(std::move(data));
}

TermPtr ActiveContext::get(const std::string& term) const {
    auto it = m_data.terms.find(term);
    return it != m_data.terms.end() ? it->second : nullptr;
}

const InverseContext& ActiveContext::inverse() const {
    std::call_once(m_inverse_once, [this]() {
        m_inverse = std::make_unique<InverseContext>(InverseContext::build(m_data));
    });
    return *m_inverse;
}

} // namespace jsonld_context

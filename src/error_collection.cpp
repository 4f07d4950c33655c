#include "stanza/error_collection.hpp"

#include <stdexcept>

namespace Stanza {

    std::string_view to_string(ModelError::code c) noexcept {
        switch (c) {
        case ModelError::code::invalid_json: return "invalid_json";
        case ModelError::code::conversion_failed: return "conversion_failed";
        case ModelError::code::value_out_of_range: return "value_out_of_range";
        case ModelError::code::null_not_allowed: return "null_not_allowed";
        case ModelError::code::length_mismatch: return "length_mismatch";
        case ModelError::code::required_member_missing: return "required_member_missing";
        case ModelError::code::validation_failed: return "validation_failed";
        case ModelError::code::unsupported_content_type: return "unsupported_content_type";
        case ModelError::code::too_many_errors: return "too_many_errors";
        case ModelError::code::custom: return "custom";
        }
        return "N/A";
    }

    bool ErrorCollection::try_add(std::string_view key, ModelError error) {
        if (m_Count >= m_MaxAllowed - 1) {
            if (!m_HasReachedMax) {
                append("", ModelError{ ModelError::code::too_many_errors,
                                       "The maximum number of allowed model errors has been reached.", std::nullopt });
                m_HasReachedMax = true;
                m_Count++;
            }
            return false;
        }

        m_Count++;
        append(key, std::move(error));
        return true;
    }

    bool ErrorCollection::try_add(std::string_view key, std::string_view msg) {
        return try_add(key, ModelError{ ModelError::code::custom, std::string{ msg }, std::nullopt });
    }

    void ErrorCollection::set_max_allowed_errors(std::size_t max) {
        if (max == 0) throw std::invalid_argument("max_allowed_errors must be at least 1");
        m_MaxAllowed = max;
    }

    bool ErrorCollection::contains(std::string_view key) const {
        return m_Index.find(key) != m_Index.end();
    }

    const std::vector<ModelError>& ErrorCollection::errors(std::string_view key) const {
        static const std::vector<ModelError> none;
        auto it = m_Index.find(key);
        return it == m_Index.end() ? none : m_Entries[it->second].errors;
    }

    std::vector<std::string> ErrorCollection::keys() const {
        std::vector<std::string> out;
        out.reserve(m_Entries.size());
        for (const auto& e : m_Entries) out.push_back(e.key);
        return out;
    }

    void ErrorCollection::clear() noexcept {
        m_Entries.clear();
        m_Index.clear();
        m_Count = 0;
        m_HasReachedMax = false;
    }

    void ErrorCollection::append(std::string_view key, ModelError error) {
        auto it = m_Index.find(key);
        if (it == m_Index.end()) {
            it = m_Index.emplace(std::string{ key }, m_Entries.size()).first;
            m_Entries.push_back(Entry{ std::string{ key }, {} });
        }
        m_Entries[it->second].errors.push_back(std::move(error));
    }

    value to_value(const ErrorCollection& errors, std::pmr::memory_resource* res) {
        value out{ res };
        auto& obj = out.as_object();
        for (const auto& entry : errors.entries()) {
            value messages{ res };
            auto& arr = messages.as_array();
            for (const auto& e : entry.errors) arr.emplace_back(std::string_view{ e.msg }, res);
            obj.emplace_back(string{ entry.key, res }, std::move(messages));
        }
        return out;
    }

} // namespace Stanza

#include "stanza/metadata.hpp"

#include <spdlog/fmt/fmt.h>

namespace Stanza {

    TypeDescriptorPtr DescriptorCache::find(std::type_index type) const {
        std::shared_lock lock{ m_Mutex };
        auto it = m_Descriptors.find(type);
        return it == m_Descriptors.end() ? nullptr : it->second;
    }

    TypeDescriptorPtr DescriptorCache::insert(std::type_index type, TypeDescriptorPtr descriptor) {
        std::unique_lock lock{ m_Mutex };
        return m_Descriptors.try_emplace(type, std::move(descriptor)).first->second;
    }

    std::size_t DescriptorCache::size() const {
        std::shared_lock lock{ m_Mutex };
        return m_Descriptors.size();
    }

    DescriptorCache& default_descriptor_cache() {
        static DescriptorCache cache;
        return cache;
    }

    namespace {
        std::optional<double> numeric(const Model& m) {
            switch (m.kind()) {
            case model_kind::signed_integer: return static_cast<double>(m.as_int64());
            case model_kind::unsigned_integer: return static_cast<double>(m.as_uint64());
            case model_kind::floating: return m.as_double();
            case model_kind::decimal: return m.as_decimal().to_double();
            default: return std::nullopt;
            }
        }

        std::size_t code_points(std::string_view s) noexcept {
            std::size_t n = 0;
            for (unsigned char c : s) {
                if ((c & 0xC0) != 0x80) n++;
            }
            return n;
        }

        std::optional<std::size_t> length_of(const Model& m) {
            switch (m.kind()) {
            case model_kind::string: return code_points(m.as_string());
            case model_kind::sequence: return m.as_sequence().size();
            case model_kind::map: return m.as_map().entries.size();
            default: return std::nullopt;
            }
        }
    } // namespace

    DefaultModelMetadataProvider::DefaultModelMetadataProvider() : m_Cache{ default_descriptor_cache() } {}

    DefaultModelMetadataProvider::DefaultModelMetadataProvider(DescriptorCache& cache) : m_Cache{ cache } {}

    TypeDescriptorPtr DefaultModelMetadataProvider::get_type_descriptor(std::type_index type) const {
        return m_Cache.find(type);
    }

    std::vector<ValidationFailure> DefaultModelMetadataProvider::validate(const FieldDescriptor& field, const Model& value) const {
        std::vector<ValidationFailure> failures;
        if (value.is_null()) return failures;

        for (const auto& c : field.constraints) {
            if (const auto* range = std::get_if<RangeConstraint>(&c)) {
                auto v = numeric(value);
                if (v && (*v < range->min || *v > range->max)) {
                    failures.push_back({ "", fmt::format("The field {} must be between {} and {}.", field.name, range->min, range->max) });
                }
            } else if (const auto* length = std::get_if<LengthConstraint>(&c)) {
                auto n = length_of(value);
                if (n && (*n < length->min || *n > length->max)) {
                    failures.push_back({ "", fmt::format("The field {} must be a string or collection with a minimum length of {} and a maximum length of {}.",
                                                         field.name, length->min, length->max) });
                }
            } else if (const auto* custom = std::get_if<CustomConstraint>(&c)) {
                if (!custom->check) continue;
                if (auto msg = custom->check(value)) failures.push_back({ "", std::move(*msg) });
            }
        }
        return failures;
    }

} // namespace Stanza

#include "stanza/type_descriptor.hpp"

#include <stdexcept>

namespace Stanza {

    namespace {
        std::string fold(std::string_view s) {
            std::string out{ s };
            for (char& c : out) {
                if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
            }
            return out;
        }

        bool nullable_by_default(type_kind k) noexcept {
            switch (k) {
            case type_kind::string:
            case type_kind::sequence:
            case type_kind::map:
            case type_kind::object:
                return true;
            default:
                return false;
            }
        }
    } // namespace

    std::string_view to_string(type_kind k) noexcept {
        switch (k) {
        case type_kind::boolean: return "bool";
        case type_kind::int8: return "int8";
        case type_kind::uint8: return "uint8";
        case type_kind::int16: return "int16";
        case type_kind::uint16: return "uint16";
        case type_kind::int32: return "int32";
        case type_kind::uint32: return "uint32";
        case type_kind::int64: return "int64";
        case type_kind::uint64: return "uint64";
        case type_kind::float32: return "float";
        case type_kind::float64: return "double";
        case type_kind::decimal: return "decimal";
        case type_kind::string: return "string";
        case type_kind::date_time: return "date-time";
        case type_kind::sequence: return "sequence";
        case type_kind::map: return "map";
        case type_kind::object: return "object";
        }
        return "N/A";
    }

    TypeDescriptorPtr TypeDescriptor::primitive(type_kind k) {
        if (k == type_kind::sequence || k == type_kind::map || k == type_kind::object)
            throw std::invalid_argument("TypeDescriptor::primitive called with a composite kind");

        auto d = std::make_shared<TypeDescriptor>(private_tag{});
        d->m_Kind = k;
        d->m_Nullable = nullable_by_default(k);
        d->m_Name = std::string{ to_string(k) };
        return d;
    }

    TypeDescriptorPtr TypeDescriptor::sequence_of(TypeDescriptorPtr element, sequence_flavor flavor, std::optional<std::size_t> fixed_length) {
        if (!element) throw std::invalid_argument("Sequence element type must not be null");

        auto d = std::make_shared<TypeDescriptor>(private_tag{});
        d->m_Kind = type_kind::sequence;
        d->m_Nullable = true;
        d->m_Name = "sequence<" + element->name() + ">";
        d->m_Element = std::move(element);
        d->m_Flavor = flavor;
        d->m_FixedLength = fixed_length;
        return d;
    }

    TypeDescriptorPtr TypeDescriptor::map_of(TypeDescriptorPtr element) {
        if (!element) throw std::invalid_argument("Map value type must not be null");

        auto d = std::make_shared<TypeDescriptor>(private_tag{});
        d->m_Kind = type_kind::map;
        d->m_Nullable = true;
        d->m_Name = "map<string, " + element->name() + ">";
        d->m_Element = std::move(element);
        return d;
    }

    TypeDescriptorPtr TypeDescriptor::object(std::string name, std::vector<FieldDescriptor> fields) {
        auto d = std::make_shared<TypeDescriptor>(private_tag{});
        d->m_Kind = type_kind::object;
        d->m_Nullable = true;
        d->m_Name = std::move(name);
        d->m_Fields = std::move(fields);

        for (std::size_t i = 0; i < d->m_Fields.size(); i++) {
            const auto& f = d->m_Fields[i];
            if (!f.type) throw std::invalid_argument("Field '" + f.name + "' has no type");
            if (!d->m_ExactIndex.emplace(f.name, i).second)
                throw std::invalid_argument("Duplicate field '" + f.name + "' in " + d->m_Name);
            d->m_FoldedIndex.emplace(fold(f.name), i);
        }
        return d;
    }

    TypeDescriptorPtr TypeDescriptor::nullable(const TypeDescriptorPtr& inner, bool accepts_null) {
        if (!inner) throw std::invalid_argument("TypeDescriptor::nullable called with null");
        if (inner->m_Nullable == accepts_null) return inner;

        auto d = std::make_shared<TypeDescriptor>(private_tag{}, *inner);
        d->m_Nullable = accepts_null;
        return d;
    }

    const FieldDescriptor* TypeDescriptor::find_field(std::string_view name) const {
        if (auto it = m_ExactIndex.find(name); it != m_ExactIndex.end()) return &m_Fields[it->second];
        if (auto it = m_FoldedIndex.find(fold(name)); it != m_FoldedIndex.end()) return &m_Fields[it->second];
        return nullptr;
    }

    Model TypeDescriptor::default_model() const {
        if (m_Nullable) return Model{};

        switch (m_Kind) {
        case type_kind::boolean: return Model{ false };
        case type_kind::int8:
        case type_kind::int16:
        case type_kind::int32:
        case type_kind::int64:
            return Model{ std::int64_t{ 0 } };
        case type_kind::uint8:
        case type_kind::uint16:
        case type_kind::uint32:
        case type_kind::uint64:
            return Model{ std::uint64_t{ 0 } };
        case type_kind::float32:
        case type_kind::float64:
            return Model{ 0.0 };
        case type_kind::decimal: return Model{ Decimal{} };
        case type_kind::string: return Model{ std::string{} };
        case type_kind::date_time: return Model{ DateTime{} };
        case type_kind::sequence: {
            Model::sequence seq;
            if (m_FixedLength) seq.assign(*m_FixedLength, m_Element->default_model());
            return Model{ std::move(seq) };
        }
        case type_kind::map: return Model{ Model::map{} };
        case type_kind::object: {
            Model::object obj;
            obj.fields.reserve(m_Fields.size());
            for (const auto& f : m_Fields) obj.fields.emplace_back(f.name, f.default_value ? *f.default_value : f.type->default_model());
            return Model{ std::move(obj) };
        }
        }
        return Model{};
    }

} // namespace Stanza

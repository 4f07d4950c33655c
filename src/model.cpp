#include "stanza/model.hpp"

#include <stdexcept>

namespace Stanza {

    namespace {
        template<class... Ts>
        struct overloaded : Ts... { using Ts::operator()...; };
    } // namespace

    const Model* Model::object::find(std::string_view name) const noexcept {
        for (const auto& [k, v] : fields) {
            if (k == name) return &v;
        }
        return nullptr;
    }

    const Model& Model::at(std::string_view name) const {
        const member_list* members = nullptr;
        if (auto* o = std::get_if<object>(&m_Storage)) members = &o->fields;
        else if (auto* m = std::get_if<map>(&m_Storage)) members = &m->entries;
        else throw std::out_of_range("Model is neither an object nor a map");

        for (const auto& [k, v] : *members) {
            if (k == name) return v;
        }
        throw std::out_of_range("Model has no member named '" + std::string{ name } + "'");
    }

    const Model& Model::at(std::size_t idx) const {
        const auto* seq = std::get_if<sequence>(&m_Storage);
        if (!seq) throw std::out_of_range("Model is not a sequence");
        if (idx >= seq->size()) throw std::out_of_range("Sequence index out of range");
        return (*seq)[idx];
    }

    std::string_view to_string(model_kind k) noexcept {
        switch (k) {
        case model_kind::null: return "null";
        case model_kind::boolean: return "boolean";
        case model_kind::signed_integer: return "signed_integer";
        case model_kind::unsigned_integer: return "unsigned_integer";
        case model_kind::floating: return "floating";
        case model_kind::decimal: return "decimal";
        case model_kind::string: return "string";
        case model_kind::date_time: return "date_time";
        case model_kind::sequence: return "sequence";
        case model_kind::map: return "map";
        case model_kind::object: return "object";
        }
        return "N/A";
    }

    namespace {
        value members_to_value(const Model::member_list& members, std::pmr::memory_resource* res) {
            value out{ res };
            auto& obj = out.as_object();
            obj.reserve(members.size());
            for (const auto& [k, v] : members) obj.emplace_back(string{ k, res }, to_value(v, res));
            return out;
        }
    } // namespace

    value to_value(const Model& m, std::pmr::memory_resource* res) {
        return std::visit(overloaded{
            [&](std::monostate) { return value{ nullptr, res }; },
            [&](bool b) { return value{ b, res }; },
            [&](std::int64_t i) { return value{ i, res }; },
            [&](std::uint64_t u) { return value{ u, res }; },
            [&](double d) { return value{ d, res }; },
            [&](const Decimal& d) {
                const auto text = d.to_string();
                return value{ number{ d.to_double(), string{ text, res } }, res };
            },
            [&](const std::string& s) { return value{ std::string_view{ s }, res }; },
            [&](const DateTime& dt) {
                const auto text = dt.to_string();
                return value{ std::string_view{ text }, res };
            },
            [&](const Model::sequence& seq) {
                value out{ res };
                auto& arr = out.as_array();
                arr.reserve(seq.size());
                for (const auto& e : seq) arr.emplace_back(to_value(e, res));
                return out;
            },
            [&](const Model::map& mp) { return members_to_value(mp.entries, res); },
            [&](const Model::object& obj) { return members_to_value(obj.fields, res); },
        }, m.storage());
    }

} // namespace Stanza

#include "stanza/value.hpp"

#include <algorithm>
#include <charconv>
#include <memory>
#include <stdexcept>


namespace Stanza {

    bool number::is_integral() const noexcept {
        return std::none_of(lexeme.begin(), lexeme.end(), [](char c) { return c == '.' || c == 'e' || c == 'E'; });
    }

    value::value(std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    value::value(std::nullptr_t, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    value::value(bool b, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ b } {}

    value::value(double d, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ number{ d, string{ res } } } {}

    value::value(number n, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(n) } {}

    value::value(const char* s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ string{ s, res } } {}

    value::value(std::string_view sv, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ string{ sv.begin(), sv.end(), res } } {}

    value::value(string s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(s) } {}

    value::value(array a, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(a) } {}

    value::value(object o, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(o) } {}

    value::value(const value& other)
        : m_MemRes{ other.m_MemRes }, m_Storage{ clone_storage(other.m_Storage, other.m_MemRes) } {}

    value::value(value&& other) noexcept
        : m_MemRes{ other.m_MemRes }, m_Storage{ std::move(other.m_Storage) } {}

    value& value::operator=(const value& other) {
        if (this == &other) return *this;
        m_MemRes = other.m_MemRes;
        m_Storage = clone_storage(other.m_Storage, other.m_MemRes);
        return *this;
    }

    value& value::operator=(value&& other) noexcept {
        if (this == &other) return *this;
        m_MemRes = other.m_MemRes;
        m_Storage = std::move(other.m_Storage);
        return *this;
    }

    number value::make_number(std::int64_t i, std::pmr::memory_resource* res) {
        char buf[24];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), i);
        return number{ static_cast<double>(i), string{ buf, ptr, res } };
    }

    number value::make_number(std::uint64_t i, std::pmr::memory_resource* res) {
        char buf[24];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), i);
        return number{ static_cast<double>(i), string{ buf, ptr, res } };
    }

    kind value::type() const noexcept {
        switch (m_Storage.index()) {
        case 0: return kind::null;
        case 1: return kind::boolean;
        case 2: return kind::number;
        case 3: return kind::string;
        case 4: return kind::array;
        case 5: return kind::object;
        }
        return kind::null;
    }

    bool value::as_bool() const { return std::get<bool>(m_Storage); }
    double value::as_number() const { return std::get<number>(m_Storage).value; }
    const number& value::as_number_token() const { return std::get<number>(m_Storage); }
    string& value::as_string() { return std::get<string>(m_Storage); }
    const string& value::as_string() const { return std::get<string>(m_Storage); }
    array& value::as_array() { if (!is_array()) m_Storage = array{ allocator_type(m_MemRes) }; return std::get<array>(m_Storage); }
    const array& value::as_array() const { return std::get<array>(m_Storage); }
    object& value::as_object() { if (!is_object()) m_Storage = object{ allocator_type(m_MemRes) }; return std::get<object>(m_Storage); }
    const object& value::as_object() const { return std::get<object>(m_Storage); }

    size_t value::size() const noexcept {
        if (is_array()) return std::get<array>(m_Storage).size();
        if (is_object()) return std::get<object>(m_Storage).size();
        return 0;
    }

    value& value::operator[](std::size_t idx) {
        auto& arr = as_array();
        if (idx >= arr.size()) {
            arr.resize(idx + 1, value{ m_MemRes });
        }
        return arr[idx];
    }

    const value& value::operator[](std::size_t idx) const {
        static const value null_sentinel{};
        if (!is_array()) return null_sentinel;
        const auto& arr = as_array();
        if (idx >= arr.size()) return null_sentinel;
        return arr[idx];
    }

    value& value::operator[](std::string_view key) {
        auto& obj = as_object();
        auto it = std::find_if(obj.begin(), obj.end(), [&](const member& m) { return m.first == key; });
        if (it != obj.end()) return it->second;
        obj.emplace_back(string{ key.begin(), key.end(), m_MemRes }, value{ m_MemRes });
        return obj.back().second;
    }

    const value* value::find(std::string_view key) const {
        if (!is_object()) return nullptr;
        const auto& obj = as_object();
        auto it = std::find_if(obj.begin(), obj.end(), [&](const member& m) { return m.first == key; });
        if (it == obj.end()) return nullptr;
        return std::addressof(it->second);
    }

    const value& value::at(std::string_view key) const {
        if (auto* v = find(key)) return *v;
        throw std::out_of_range{ "Stanza::value::at: key not found" };
    }

    bool operator==(const value& lhs, const value& rhs) {
        return lhs.m_Storage == rhs.m_Storage;
    }

    storage_t value::clone_storage(const storage_t& s, std::pmr::memory_resource* res) {
        switch (s.index()) {
        case 0: return std::monostate{};
        case 1: return std::get<bool>(s);
        case 2: {
            const auto& num = std::get<number>(s);
            return number{ num.value, string{ num.lexeme, res } };
        }
        case 3: {
            const auto& str = std::get<string>(s);
            return string{ str, res };
        }
        case 4: {
            const auto& arr = std::get<array>(s);
            array copy(allocator_type{ res });
            copy.reserve(arr.size());
            for (const auto& v : arr) copy.emplace_back(v);
            return copy;
        }
        case 5: {
            const auto& obj = std::get<object>(s);
            object copy(allocator_type{ res });
            copy.reserve(obj.size());
            for (const auto& [k, v] : obj) copy.emplace_back(string{ k, res }, value{ v });
            return copy;
        }
        }
        return std::monostate{};
    }

} // namespace Stanza

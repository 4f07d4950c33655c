#include "stanza/decoder.hpp"

#include <charconv>
#include <cfloat>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "stanza/json.hpp"
#include "stanza/logging.hpp"
#include "stanza/metadata.hpp"
#include "stanza/model_path.hpp"

namespace Stanza {

    namespace {
        constexpr std::string_view k_ByteOrderMark = "\xEF\xBB\xBF";

        constexpr bool is_json_ws(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r';
        }

        bool is_blank(std::string_view text) noexcept {
            for (char c : text) {
                if (!is_json_ws(c)) return false;
            }
            return true;
        }

        struct IntegralBounds {
            std::int64_t min;
            std::uint64_t max;
        };

        constexpr IntegralBounds bounds_of(type_kind k) noexcept {
            switch (k) {
            case type_kind::int8: return { INT8_MIN, INT8_MAX };
            case type_kind::uint8: return { 0, UINT8_MAX };
            case type_kind::int16: return { INT16_MIN, INT16_MAX };
            case type_kind::uint16: return { 0, UINT16_MAX };
            case type_kind::int32: return { INT32_MIN, INT32_MAX };
            case type_kind::uint32: return { 0, UINT32_MAX };
            case type_kind::int64: return { INT64_MIN, INT64_MAX };
            default: return { 0, UINT64_MAX };
            }
        }

        constexpr bool is_signed_kind(type_kind k) noexcept {
            return k == type_kind::int8 || k == type_kind::int16 || k == type_kind::int32 || k == type_kind::int64;
        }

        // Text of a number token; numbers built in code carry no lexeme.
        std::string number_text(const number& n) {
            if (!n.lexeme.empty()) return std::string{ n.lexeme };
            if (!std::isfinite(n.value)) return {};
            if (std::trunc(n.value) == n.value && std::fabs(n.value) < 9.2e18) return fmt::format("{:.0f}", n.value);
            return fmt::format("{}", n.value);
        }

        /// Walks a parsed body against a descriptor, collecting errors on the way.
        class Decoder {
        public:
            Decoder(ErrorCollection& errors, std::string_view root, const DecodeOptions& opts, LoggerPtr log)
                : m_Errors{ errors }, m_Path{ root }, m_Opts{ opts }, m_Log{ std::move(log) } {}

            Model decode(const value& v, const TypeDescriptor& t) {
                // Nothing recorded past this point; the model will be discarded.
                if (m_Attempts > 0 && m_Errors.has_reached_max_errors()) return t.default_model();

                if (v.is_null()) {
                    if (t.is_nullable()) return Model{};
                    report(ModelError::code::null_not_allowed, fmt::format("The JSON value 'null' is not valid for {}.", t.name()));
                    return t.default_model();
                }

                switch (t.kind()) {
                case type_kind::boolean: return boolean(v, t);
                case type_kind::int8:
                case type_kind::uint8:
                case type_kind::int16:
                case type_kind::uint16:
                case type_kind::int32:
                case type_kind::uint32:
                case type_kind::int64:
                case type_kind::uint64: return integral(v, t);
                case type_kind::float32:
                case type_kind::float64: return floating(v, t);
                case type_kind::decimal: return decimal(v, t);
                case type_kind::string: return string(v, t);
                case type_kind::date_time: return date_time(v, t);
                case type_kind::sequence: return sequence(v, t);
                case type_kind::map: return map(v, t);
                case type_kind::object: return object(v, t);
                }
                return t.default_model();
            }

            [[nodiscard]] bool failed() const noexcept { return m_Attempts > 0; }
            [[nodiscard]] std::size_t attempts() const noexcept { return m_Attempts; }

        private:
            ErrorCollection& m_Errors;
            ModelPath m_Path;
            const DecodeOptions& m_Opts;
            LoggerPtr m_Log;
            std::size_t m_Attempts = 0;
            bool m_WarnedBudget = false;

            void report_at(std::string_view key, ModelError::code c, std::string msg) {
                m_Attempts++;
                m_Log->debug("{} at '{}': {}", to_string(c), key, msg);
                if (!m_Errors.try_add(key, ModelError{ c, std::move(msg), std::nullopt }) && !m_WarnedBudget) {
                    m_WarnedBudget = true;
                    m_Log->warn("Error budget of {} exhausted; further errors are dropped", m_Errors.max_allowed_errors());
                }
            }

            void report(ModelError::code c, std::string msg) { report_at(m_Path.str(), c, std::move(msg)); }

            Model conversion_failed(const TypeDescriptor& t) {
                report(ModelError::code::conversion_failed, fmt::format("The JSON value could not be converted to {}.", t.name()));
                return t.default_model();
            }

            Model out_of_range(const TypeDescriptor& t, std::string_view text) {
                report(ModelError::code::value_out_of_range,
                       fmt::format("The JSON value '{}' is outside the range of {}.", text, t.name()));
                return t.default_model();
            }

            #pragma region Leaves

            Model boolean(const value& v, const TypeDescriptor& t) {
                if (!v.is_bool()) return conversion_failed(t);
                return Model{ v.as_bool() };
            }

            Model integral(const value& v, const TypeDescriptor& t) {
                if (!v.is_number()) return conversion_failed(t);
                const auto& n = v.as_number_token();
                if (!n.lexeme.empty() && !n.is_integral()) return conversion_failed(t);

                const std::string text = number_text(n);
                if (text.empty() || text.find_first_of(".eE") != std::string::npos) return conversion_failed(t);

                const auto bounds = bounds_of(t.kind());
                const char* first = text.data();
                const char* last = text.data() + text.size();

                if (text.front() == '-') {
                    std::int64_t i = 0;
                    auto [ptr, ec] = std::from_chars(first, last, i);
                    if (ec == std::errc::result_out_of_range || (ec == std::errc{} && i < bounds.min)) return out_of_range(t, text);
                    if (ec != std::errc{} || ptr != last) return conversion_failed(t);
                    return is_signed_kind(t.kind()) ? Model{ i } : Model{ std::uint64_t{ 0 } };
                }

                std::uint64_t u = 0;
                auto [ptr, ec] = std::from_chars(first, last, u);
                if (ec == std::errc::result_out_of_range || (ec == std::errc{} && u > bounds.max)) return out_of_range(t, text);
                if (ec != std::errc{} || ptr != last) return conversion_failed(t);
                if (is_signed_kind(t.kind())) return Model{ static_cast<std::int64_t>(u) };
                return Model{ u };
            }

            Model floating(const value& v, const TypeDescriptor& t) {
                if (!v.is_number()) return conversion_failed(t);
                const auto& n = v.as_number_token();
                if (!std::isfinite(n.value)) return out_of_range(t, std::string_view{ n.lexeme.data(), n.lexeme.size() });
                if (t.kind() == type_kind::float32) {
                    if (std::fabs(n.value) > FLT_MAX) return out_of_range(t, number_text(n));
                    return Model{ static_cast<double>(static_cast<float>(n.value)) };
                }
                return Model{ n.value };
            }

            Model decimal(const value& v, const TypeDescriptor& t) {
                if (!v.is_number()) return conversion_failed(t);
                const std::string text = number_text(v.as_number_token());
                auto d = Decimal::parse(text);
                if (!d) {
                    if (d.error() == std::errc::result_out_of_range) return out_of_range(t, text);
                    return conversion_failed(t);
                }
                return Model{ *d };
            }

            Model string(const value& v, const TypeDescriptor& t) {
                if (!v.is_string()) return conversion_failed(t);
                const auto& s = v.as_string();
                return Model{ std::string{ s.data(), s.size() } };
            }

            Model date_time(const value& v, const TypeDescriptor& t) {
                if (!v.is_string()) return conversion_failed(t);
                const auto& s = v.as_string();
                auto dt = DateTime::parse_iso8601(std::string_view{ s.data(), s.size() });
                if (!dt) return conversion_failed(t);
                return Model{ *dt };
            }

            #pragma endregion

            #pragma region Composites

            Model sequence(const value& v, const TypeDescriptor& t) {
                if (!v.is_array()) return conversion_failed(t);
                const auto& arr = v.as_array();
                const auto& element = *t.element();

                Model::sequence items;
                items.reserve(arr.size());
                for (std::size_t i = 0; i < arr.size(); i++) {
                    PathScope scope{ m_Path, i };
                    items.push_back(decode(arr[i], element));
                }

                if (auto fixed = t.fixed_length(); fixed && items.size() != *fixed) {
                    report(ModelError::code::length_mismatch,
                           fmt::format("The JSON array has {} elements but {} requires exactly {}.", items.size(), t.name(), *fixed));
                    items.resize(*fixed, element.default_model());
                }
                return Model{ std::move(items) };
            }

            Model map(const value& v, const TypeDescriptor& t) {
                if (!v.is_object()) return conversion_failed(t);
                const auto& element = *t.element();

                Model::map out;
                out.entries.reserve(v.as_object().size());
                for (const auto& [key, child] : v.as_object()) {
                    const std::string_view name{ key.data(), key.size() };
                    PathScope scope{ m_Path, name };
                    out.entries.emplace_back(std::string{ name }, decode(child, element));
                }
                return Model{ std::move(out) };
            }

            Model object(const value& v, const TypeDescriptor& t) {
                if (!v.is_object()) return conversion_failed(t);

                const auto fields = t.fields();
                const std::size_t before = m_Attempts;
                std::vector<std::optional<Model>> slots(fields.size());

                for (const auto& [key, child] : v.as_object()) {
                    const std::string_view name{ key.data(), key.size() };
                    const FieldDescriptor* field = t.find_field(name);
                    if (!field) continue;

                    PathScope scope{ m_Path, name };
                    slots[static_cast<std::size_t>(field - fields.data())] = decode(child, *field->type);
                }

                Model::object out;
                out.fields.reserve(fields.size());
                for (std::size_t i = 0; i < fields.size(); i++) {
                    const auto& field = fields[i];
                    if (slots[i]) {
                        out.fields.emplace_back(field.name, std::move(*slots[i]));
                        continue;
                    }
                    if (field.required) {
                        PathScope scope{ m_Path, std::string_view{ field.name } };
                        report(ModelError::code::required_member_missing, fmt::format("The {} field is required.", field.name));
                    }
                    out.fields.emplace_back(field.name, field.default_value ? *field.default_value : field.type->default_model());
                }

                if (m_Attempts == before && m_Opts.metadata) validate(fields, out);
                return Model{ std::move(out) };
            }

            void validate(std::span<const FieldDescriptor> fields, const Model::object& out) {
                for (std::size_t i = 0; i < fields.size(); i++) {
                    auto failures = m_Opts.metadata->validate(fields[i], out.fields[i].second);
                    if (failures.empty()) continue;

                    PathScope scope{ m_Path, std::string_view{ fields[i].name } };
                    for (auto& failure : failures) {
                        report_at(combine_paths(m_Path.str(), failure.member), ModelError::code::validation_failed,
                                  std::move(failure.message));
                    }
                }
            }

            #pragma endregion
        };
    } // namespace

    DecodeResult decode(std::string_view body, const TypeDescriptor& type, std::string_view root_path,
                        ErrorCollection& errors, const DecodeOptions& options) {
        auto log = get_logger("stanza.decoder");

        if (body.starts_with(k_ByteOrderMark)) body.remove_prefix(k_ByteOrderMark.size());

        if (is_blank(body)) {
            if (options.treat_empty_input_as_default_value) return DecodeResult::success(type.default_model());
            return DecodeResult::no_value();
        }

        std::pmr::monotonic_buffer_resource arena;
        auto parsed = parse(body, options.parse, &arena);
        if (!parsed) {
            const auto& e = parsed.error();
            log->debug("Malformed body for '{}': {} at {}:{}", root_path, e.msg, e.line, e.column);
            std::string msg = fmt::format("The request body is not valid JSON: {} (line {}, column {}).", e.msg, e.line, e.column);
            if (!errors.try_add(root_path, ModelError{ ModelError::code::invalid_json, std::move(msg), e }))
                log->warn("Error budget of {} exhausted; further errors are dropped", errors.max_allowed_errors());
            return DecodeResult::failure();
        }

        if (parsed->is_null() && type.is_nullable()) {
            if (options.treat_empty_input_as_default_value) return DecodeResult::success(Model{});
            return DecodeResult::no_value();
        }

        Decoder decoder{ errors, root_path, options, log };
        Model model = decoder.decode(*parsed, type);
        if (decoder.failed()) {
            log->debug("Decoding {} into '{}' reported {} error(s)", type.name(), root_path, decoder.attempts());
            return DecodeResult::failure();
        }
        return DecodeResult::success(std::move(model));
    }

} // namespace Stanza

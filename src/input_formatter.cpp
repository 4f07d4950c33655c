#include "stanza/input_formatter.hpp"

#include <istream>
#include <iterator>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

#include "stanza/logging.hpp"

namespace Stanza {

    JsonInputFormatter::JsonInputFormatter(FormatterOptions options, std::shared_ptr<const ModelMetadataProvider> metadata)
        : m_Options{ std::move(options) }, m_Metadata{ std::move(metadata) } {
        if (m_Options.supported_media_types.empty()) throw std::invalid_argument("JsonInputFormatter: no supported media types");

        m_MediaTypes.reserve(m_Options.supported_media_types.size());
        for (const auto& text : m_Options.supported_media_types) {
            auto mt = MediaType::parse(text);
            if (!mt) throw std::invalid_argument(fmt::format("JsonInputFormatter: invalid media type '{}'", text));
            m_MediaTypes.push_back(std::move(*mt));
        }
    }

    bool JsonInputFormatter::can_read(std::string_view content_type) const {
        auto requested = MediaType::parse(content_type);
        if (!requested) return false;
        for (const auto& supported : m_MediaTypes) {
            if (requested->is_subset_of(supported)) return true;
        }
        return false;
    }

    bool JsonInputFormatter::is_supported_encoding(std::string_view charset) const noexcept {
        for (const auto& enc : m_Options.supported_encodings) {
            if (iequals(enc, charset)) return true;
        }
        return false;
    }

    DecodeResult JsonInputFormatter::read(const InputFormatterContext& ctx, std::string_view body) const {
        if (!ctx.model_type) throw std::invalid_argument("JsonInputFormatter::read: context has no model type");

        if (auto mt = MediaType::parse(ctx.content_type)) {
            if (auto charset = mt->charset(); charset && !is_supported_encoding(*charset)) {
                get_logger("stanza.formatter")->debug("Rejected charset '{}' for '{}'", *charset, ctx.model_name);
                ctx.model_state.try_add(ctx.model_name,
                                        ModelError{ ModelError::code::unsupported_content_type,
                                                    fmt::format("Unsupported charset '{}'.", *charset), std::nullopt });
                return DecodeResult::failure();
            }
        }

        DecodeOptions options;
        options.treat_empty_input_as_default_value = ctx.treat_empty_input_as_default_value;
        options.parse = m_Options.parse;
        options.metadata = m_Metadata.get();
        return decode(body, *ctx.model_type, ctx.model_name, ctx.model_state, options);
    }

    DecodeResult JsonInputFormatter::read(const InputFormatterContext& ctx, std::istream& body) const {
        const std::string text{ std::istreambuf_iterator<char>{ body }, std::istreambuf_iterator<char>{} };
        return read(ctx, std::string_view{ text });
    }

} // namespace Stanza

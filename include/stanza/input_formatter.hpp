#pragma once


/*
    ------------------------------------------------------------
    Stanza::JsonInputFormatter - Request bodies in, models out
    ------------------------------------------------------------
    Front door for a web layer: decides from the Content-Type whether a body
    is JSON it reads, checks the charset, and decodes the body into the
    context's model type, recording errors in the context's collection under
    the context's model name.

        Stanza::JsonInputFormatter formatter;
        if (formatter.can_read(request.content_type)) {
            Stanza::ErrorCollection errors;
            Stanza::InputFormatterContext ctx{ request.content_type, "", errors, Stanza::describe<Order>() };
            auto result = formatter.read(ctx, request.body);
        }

    Accepted media types come from `FormatterOptions::supported_media_types`
    (`application/json`, `text/json`, `application/*+json` by default), and
    a request matches when its media type is a subset of one of them.
    Charsets other than the supported encodings are reported as an
    `unsupported_content_type` error; a request without one is read as UTF-8.

    Once constructed, a formatter is immutable and may be shared by
    concurrent requests.
*/

/// @defgroup StanzaFormatter Input Formatter
/// @ingroup Stanza

#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/decoder.hpp"
#include "stanza/error_collection.hpp"
#include "stanza/media_type.hpp"
#include "stanza/metadata.hpp"
#include "stanza/options.hpp"
#include "stanza/type_descriptor.hpp"

namespace Stanza {

    /// @ingroup StanzaFormatter
    /// @brief Everything one read needs besides the body
    struct InputFormatterContext {
        std::string content_type;
        std::string model_name;
        ErrorCollection& model_state;
        TypeDescriptorPtr model_type;
        bool treat_empty_input_as_default_value = false;
    };

    /// @ingroup StanzaFormatter
    /// @brief Reads JSON request bodies into Models
    class JsonInputFormatter {
    public:
        /// @throws std::invalid_argument if a supported media type does not parse
        STANZA_API explicit JsonInputFormatter(FormatterOptions options = {},
                                               std::shared_ptr<const ModelMetadataProvider> metadata =
                                                   std::make_shared<DefaultModelMetadataProvider>());

        /// @brief Accepted media types, default first
        [[nodiscard]] const std::vector<MediaType>& supported_media_types() const noexcept { return m_MediaTypes; }

        [[nodiscard]] const std::vector<std::string>& supported_encodings() const noexcept { return m_Options.supported_encodings; }

        [[nodiscard]] const MediaType& default_media_type() const noexcept { return m_MediaTypes.front(); }

        /// @brief True if a body of @p content_type is one this formatter reads
        [[nodiscard]] STANZA_API bool can_read(std::string_view content_type) const;

        /// @brief Decodes @p body as `ctx.model_type`
        /// @throws std::invalid_argument if `ctx.model_type` is null
        [[nodiscard]] STANZA_API DecodeResult read(const InputFormatterContext& ctx, std::string_view body) const;

        /// @brief Reads @p body to the end and decodes it
        [[nodiscard]] STANZA_API DecodeResult read(const InputFormatterContext& ctx, std::istream& body) const;

    private:
        FormatterOptions m_Options;
        std::vector<MediaType> m_MediaTypes;
        std::shared_ptr<const ModelMetadataProvider> m_Metadata;

        bool is_supported_encoding(std::string_view charset) const noexcept;
    };

} // namespace Stanza

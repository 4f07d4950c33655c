#pragma once


/*
    ------------------------------------------------------
    Stanza::decode - Type-directed request body decoding
    ------------------------------------------------------
    Reads a JSON body against a TypeDescriptor and produces a Model, reporting
    every data problem into an ErrorCollection under the model path where it
    occurred. Data errors never throw and never stop the walk: a bad leaf
    gets its default value and decoding continues with its siblings, so a
    single call reports every problem in the body.

        Stanza::ErrorCollection errors;
        auto result = Stanza::decode<std::vector<Person>>(body, "", errors);
        if (result.has_error()) {
            // errors.errors("[2].Age") ...
        }

    --------
    Outcomes
    --------
    - `success(model)`: the body decoded without error
    - `no_value()`: nothing to decode (empty body, or `null` when
      `treat_empty_input_as_default_value` is off); no error
    - `failure()`: at least one error was reported, even when the error
      budget swallowed it; no model

    -------------------
    Conversion rules
    -------------------
    - Integer leaves take integral JSON numbers only (`1.0` and `1e2` are
      conversion errors) and report `value_out_of_range` past their width
    - float32 leaves report `value_out_of_range` past FLT_MAX
    - Decimal leaves take any JSON number that fits `Decimal`
    - Strings are never coerced from other tokens, nor numbers from strings
    - Date-time leaves take ISO 8601 strings
    - Object members match declared fields exactly, then case-insensitively;
      unknown members are ignored, absent fields get their default
    - Malformed JSON is a single `invalid_json` error at the root path

    A UTF-8 byte-order mark in front of the body is skipped.
*/

/// @defgroup StanzaDecoder Decoder
/// @ingroup Stanza

#include <string_view>
#include <utility>

#include "stanza/binding.hpp"
#include "stanza/config.hpp"
#include "stanza/describe.hpp"
#include "stanza/error_collection.hpp"
#include "stanza/model.hpp"
#include "stanza/options.hpp"
#include "stanza/type_descriptor.hpp"

namespace Stanza {

    /// @ingroup StanzaDecoder
    /// @brief Outcome of one decode
    class DecodeResult {
    public:
        [[nodiscard]] static DecodeResult success(Model model) { return DecodeResult{ std::move(model), true, false }; }
        [[nodiscard]] static DecodeResult no_value() { return DecodeResult{ Model{}, false, false }; }
        [[nodiscard]] static DecodeResult failure() { return DecodeResult{ Model{}, false, true }; }

        [[nodiscard]] bool has_error() const noexcept { return m_HasError; }
        [[nodiscard]] bool is_model_set() const noexcept { return m_IsModelSet; }

        /// @brief The decoded model; null unless the decode succeeded
        [[nodiscard]] const Model& model() const noexcept { return m_Model; }

        /// @brief The model bound into `T`
        /// @throws std::bad_variant_access if the model does not have the shape of `T`
        template<class T>
        [[nodiscard]] T model_as() const { return model_cast<T>(m_Model); }

    private:
        DecodeResult(Model model, bool set, bool error) : m_Model{ std::move(model) }, m_IsModelSet{ set }, m_HasError{ error } {}

        Model m_Model;
        bool m_IsModelSet;
        bool m_HasError;
    };

    /// @ingroup StanzaDecoder
    /// @brief Decodes @p body as @p type, reporting errors under @p root_path
    ///
    /// @param body Request body, UTF-8
    /// @param type Decode target
    /// @param root_path Model name errors are prefixed with (`""` for the root)
    /// @param errors Collection that receives the errors; may already hold some
    /// @param options Empty-input semantics, reader options, validator
    [[nodiscard]] STANZA_API DecodeResult decode(std::string_view body, const TypeDescriptor& type, std::string_view root_path,
                                                 ErrorCollection& errors, const DecodeOptions& options = {});

    /// @ingroup StanzaDecoder
    /// @brief Decodes @p body as `describe<T>()`
    template<Describable T>
    [[nodiscard]] DecodeResult decode(std::string_view body, std::string_view root_path, ErrorCollection& errors,
                                      const DecodeOptions& options = {}) {
        return decode(body, *describe<T>(), root_path, errors, options);
    }

} // namespace Stanza

#pragma once


/*
    ----------------------------------------------------------------
    Stanza - Typed JSON request bodies with path-addressed errors
    ----------------------------------------------------------------

    This is the main public header for Stanza

    It brings together:
        - The JSON DOM, reader and writer:   `Stanza::value`, `Stanza::parse`,
                                             `Stanza::dump`
        - Decode targets:                    `Stanza::TypeDescriptor`,
                                             `Stanza::describe<T>()`
        - The decoder and its result:        `Stanza::decode`,
                                             `Stanza::DecodeResult`
        - Error accumulation:                `Stanza::ErrorCollection`,
                                             `Stanza::ModelPath`
        - Validation:                        `Stanza::ModelMetadataProvider`
        - The input formatter:               `Stanza::JsonInputFormatter`,
                                             `Stanza::MediaType`

    -------------------
    High-Level Overview
    -------------------
    - A body is parsed into an arena-backed DOM, then walked against a
      TypeDescriptor. Every value that does not fit its target is recorded
      under its model path (`Person.Numbers[2]`) and decoding carries on, so
      one call reports every problem in the body
    - The result is a `Model`, a dynamic value shaped like the descriptor,
      which binds into the C++ type the descriptor was built from
    - An ErrorCollection caps how many errors it accepts; past the cap a
      single root error says so and the rest are dropped
    - The formatter adds the HTTP-facing pieces: media-type matching and
      charset checks

    -----
    Usage
    -----
        #include <stanza/stanza.hpp>

        struct Person {
            std::string name;
            std::vector<int> numbers;
        };

        void describe(Stanza::type_tag<Person>, Stanza::ObjectBuilder<Person>& b) {
            b.named("Person");
            b.field("Name", &Person::name).required();
            b.field("Numbers", &Person::numbers);
        }

        Stanza::ErrorCollection errors;
        auto result = Stanza::decode<Person>(body, "", errors);
        if (result.has_error()) {
            std::cout << Stanza::dump(Stanza::to_value(errors), {.pretty = true});
        } else {
            Person p = result.model_as<Person>();
        }

    Include this header if you want the full Stanza API. For finer-grained
    control or faster build times, include the individual headers directly
*/

/// @defgroup Stanza Stanza
/// @brief Core types and functions for Stanza

#include "stanza/value.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/json.hpp"
#include "stanza/model_path.hpp"
#include "stanza/error_collection.hpp"
#include "stanza/decimal.hpp"
#include "stanza/date_time.hpp"
#include "stanza/model.hpp"
#include "stanza/type_descriptor.hpp"
#include "stanza/metadata.hpp"
#include "stanza/describe.hpp"
#include "stanza/binding.hpp"
#include "stanza/decoder.hpp"
#include "stanza/media_type.hpp"
#include "stanza/input_formatter.hpp"
#include "stanza/logging.hpp"

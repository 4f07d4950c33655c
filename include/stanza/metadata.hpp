#pragma once


/*
    ------------------------------------------------
    Stanza metadata - descriptor cache and validation
    ------------------------------------------------
    - `DescriptorCache`: process-wide store of TypeDescriptors keyed by C++
      type identity. Descriptors are built on first use and shared by every
      later decode; readers never block each other.
    - `ModelMetadataProvider`: collaborator the decoder consults after an
      object decoded cleanly. It can look descriptors up by type and
      validates one field value at a time.
    - `DefaultModelMetadataProvider`: evaluates the `Range`, `Length` and
      custom constraints recorded on each FieldDescriptor.
*/

/// @defgroup StanzaMetadata Metadata
/// @ingroup Stanza
/// @brief Descriptor caching and post-decode validation

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/model.hpp"
#include "stanza/type_descriptor.hpp"

namespace Stanza {

    /// @ingroup StanzaMetadata
    /// @brief Thread-safe build-once map from `std::type_index` to descriptor
    class DescriptorCache {
    public:
        /// @brief Descriptor registered for @p type, or null
        [[nodiscard]] STANZA_API TypeDescriptorPtr find(std::type_index type) const;

        /// @brief Registers @p descriptor unless @p type already has one
        /// @returns The descriptor that ends up registered for @p type
        STANZA_API TypeDescriptorPtr insert(std::type_index type, TypeDescriptorPtr descriptor);

        /// @brief Cached descriptor for @p type, running @p build on a miss
        ///
        /// @details
        /// @p build runs without the lock held, so it may itself call into
        /// the cache for nested types. When two threads miss at once both
        /// build, and the first one to insert wins.
        template<class Build>
        TypeDescriptorPtr get_or_build(std::type_index type, Build&& build) {
            if (auto found = find(type)) return found;
            return insert(type, std::forward<Build>(build)());
        }

        [[nodiscard]] STANZA_API std::size_t size() const;

    private:
        mutable std::shared_mutex m_Mutex;
        std::unordered_map<std::type_index, TypeDescriptorPtr> m_Descriptors;
    };

    /// @ingroup StanzaMetadata
    /// @brief The cache `describe<T>()` uses
    [[nodiscard]] STANZA_API DescriptorCache& default_descriptor_cache();

    /// @ingroup StanzaMetadata
    /// @brief One rejected value reported by a validator
    struct ValidationFailure {
        std::string member;  ///< Path relative to the validated field; empty for the field itself
        std::string message;
    };

    /// @ingroup StanzaMetadata
    /// @brief Metadata and validation collaborator of the decoder
    class ModelMetadataProvider {
    public:
        virtual ~ModelMetadataProvider() = default;

        /// @brief Descriptor of @p type, or null when it is unknown
        [[nodiscard]] virtual TypeDescriptorPtr get_type_descriptor(std::type_index type) const = 0;

        /// @brief Checks @p value, decoded for @p field, against the field's rules
        [[nodiscard]] virtual std::vector<ValidationFailure> validate(const FieldDescriptor& field, const Model& value) const = 0;
    };

    /// @ingroup StanzaMetadata
    /// @brief Provider backed by a DescriptorCache and the constraints on each field
    ///
    /// @details
    /// Messages follow the usual annotation wording:
    /// - range: `The field Age must be between 0 and 150.`
    /// - length: `The field Name must be a string or collection with a minimum
    ///   length of 1 and a maximum length of 20.`
    /// - custom: whatever the predicate returned
    ///
    /// Null values pass every constraint.
    class DefaultModelMetadataProvider final : public ModelMetadataProvider {
    public:
        STANZA_API DefaultModelMetadataProvider();
        STANZA_API explicit DefaultModelMetadataProvider(DescriptorCache& cache);

        [[nodiscard]] STANZA_API TypeDescriptorPtr get_type_descriptor(std::type_index type) const override;
        [[nodiscard]] STANZA_API std::vector<ValidationFailure> validate(const FieldDescriptor& field, const Model& value) const override;

    private:
        DescriptorCache& m_Cache;
    };

} // namespace Stanza

#pragma once
#include "vaultline/core/result.hpp"
#include "vaultline/core/failures.hpp"
#include "vaultline/resolution/entity.hpp"
#include "vaultline/resolution/identifier_encoding.hpp"
#include "vaultline/resolution/identifier_query.hpp"
#include <vector>
namespace vaultline::interfaces {

/// Reports how an entity type's identifier column is physically stored.
class IIdentifierIntrospector {
public:
    virtual ~IIdentifierIntrospector() = default;

    [[nodiscard]] virtual Result<IdentifierEncoding, ResolverFailure> IdentifierEncodingOf(
        const EntityType& entity_type) = 0;
};

/**
 * Read-only identifier lookups. The key variant passed in always matches the
 * encoding reported by IIdentifierIntrospector for the same entity type.
 * Implementations report their own errors as ResolverFailure::StorageFailure.
 */
class IEntityQuery {
public:
    virtual ~IEntityQuery() = default;

    [[nodiscard]] virtual Result<std::vector<EntityReference>, ResolverFailure> QueryExact(
        const EntityType& entity_type,
        const resolution::ExactIdentifier& identifier) = 0;

    [[nodiscard]] virtual Result<std::vector<EntityReference>, ResolverFailure> QueryPrefix(
        const EntityType& entity_type,
        const resolution::IdentifierPrefix& prefix) = 0;
};

}

#pragma once
#include <string>
namespace vaultline {

/// Opaque handle naming a storage-backed record type.
struct EntityType {
    std::string name;

    bool operator==(const EntityType&) const = default;
};

/// A persisted entity as returned by the storage collaborator.
struct EntityReference {
    std::string entity_type;
    /// Stored identifier in lower-case canonical hyphenated form.
    std::string identifier;

    bool operator==(const EntityReference&) const = default;
};

}

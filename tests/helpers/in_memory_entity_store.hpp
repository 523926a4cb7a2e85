#pragma once
#include "vaultline/interfaces/i_entity_storage.hpp"
#include "vaultline/resolution/uuid.hpp"
#include <atomic>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace vaultline::test_helpers {

using interfaces::IEntityQuery;
using interfaces::IIdentifierIntrospector;
using resolution::BinaryExact;
using resolution::BinaryPrefix;
using resolution::ExactIdentifier;
using resolution::IdentifierPrefix;
using resolution::TextExact;
using resolution::TextPrefix;
using resolution::UuidBytes;

/**
 * Table-per-entity-type store. BINARY_UUID tables keep 16 raw bytes per row,
 * TEXT_UUID tables keep the string as inserted. Queries are answered with the
 * Matches helpers, so the store behaves like the SQL a real adapter would run.
 */
class InMemoryEntityStore : public IIdentifierIntrospector, public IEntityQuery {
public:
    void DefineType(const std::string& name, const IdentifierEncoding encoding) {
        tables_[name].encoding = encoding;
    }

    /// Inserts without uniqueness checks so duplicate rows can be simulated.
    void Insert(const std::string& type_name, const std::string& identifier) {
        auto& table = tables_[type_name];
        if (table.encoding == IdentifierEncoding::BinaryUuid) {
            table.binary_rows.push_back(resolution::ParseUuid(identifier).value_or(UuidBytes{}));
        } else {
            table.text_rows.push_back(identifier);
        }
    }

    void FailIntrospection(std::string message) { introspection_failure_ = std::move(message); }

    void FailQueries(std::string message) { query_failure_ = std::move(message); }

    [[nodiscard]] size_t IntrospectionCount() const noexcept { return introspections_.load(); }
    [[nodiscard]] size_t ExactQueryCount() const noexcept { return exact_queries_.load(); }
    [[nodiscard]] size_t PrefixQueryCount() const noexcept { return prefix_queries_.load(); }

    [[nodiscard]] Result<IdentifierEncoding, ResolverFailure> IdentifierEncodingOf(
        const EntityType& entity_type) override {
        ++introspections_;
        if (introspection_failure_.has_value()) {
            return Result<IdentifierEncoding, ResolverFailure>::Err(
                ResolverFailure::StorageFailure(*introspection_failure_));
        }
        const auto it = tables_.find(entity_type.name);
        if (it == tables_.end()) {
            return Result<IdentifierEncoding, ResolverFailure>::Err(
                ResolverFailure::StorageFailure("Unknown entity type " + entity_type.name));
        }
        return Result<IdentifierEncoding, ResolverFailure>::Ok(it->second.encoding);
    }

    [[nodiscard]] Result<std::vector<EntityReference>, ResolverFailure> QueryExact(
        const EntityType& entity_type,
        const ExactIdentifier& identifier) override {
        ++exact_queries_;
        return Collect(entity_type, [&identifier](const auto& row) {
            using Row = std::decay_t<decltype(row)>;
            if constexpr (std::is_same_v<Row, UuidBytes>) {
                const auto* key = std::get_if<BinaryExact>(&identifier);
                return key != nullptr && key->Matches(row);
            } else {
                const auto* key = std::get_if<TextExact>(&identifier);
                return key != nullptr && key->Matches(row);
            }
        });
    }

    [[nodiscard]] Result<std::vector<EntityReference>, ResolverFailure> QueryPrefix(
        const EntityType& entity_type,
        const IdentifierPrefix& prefix) override {
        ++prefix_queries_;
        return Collect(entity_type, [&prefix](const auto& row) {
            using Row = std::decay_t<decltype(row)>;
            if constexpr (std::is_same_v<Row, UuidBytes>) {
                const auto* key = std::get_if<BinaryPrefix>(&prefix);
                return key != nullptr && key->Matches(row);
            } else {
                const auto* key = std::get_if<TextPrefix>(&prefix);
                return key != nullptr && key->Matches(row);
            }
        });
    }

private:
    struct Table {
        IdentifierEncoding encoding = IdentifierEncoding::TextUuid;
        std::vector<UuidBytes> binary_rows;
        std::vector<std::string> text_rows;
    };

    template<typename Pred>
    Result<std::vector<EntityReference>, ResolverFailure> Collect(
        const EntityType& entity_type, Pred&& pred) const {
        if (query_failure_.has_value()) {
            return Result<std::vector<EntityReference>, ResolverFailure>::Err(
                ResolverFailure::StorageFailure(*query_failure_));
        }
        std::vector<EntityReference> rows;
        const auto it = tables_.find(entity_type.name);
        if (it == tables_.end()) {
            return Result<std::vector<EntityReference>, ResolverFailure>::Ok(std::move(rows));
        }
        for (const auto& row : it->second.binary_rows) {
            if (pred(row)) {
                rows.push_back({entity_type.name, resolution::FormatCanonicalUuid(row)});
            }
        }
        for (const auto& row : it->second.text_rows) {
            if (pred(row)) {
                rows.push_back({entity_type.name, row});
            }
        }
        return Result<std::vector<EntityReference>, ResolverFailure>::Ok(std::move(rows));
    }

    std::map<std::string, Table> tables_;
    std::optional<std::string> introspection_failure_;
    std::optional<std::string> query_failure_;
    std::atomic<size_t> introspections_{0};
    std::atomic<size_t> exact_queries_{0};
    std::atomic<size_t> prefix_queries_{0};
};

}

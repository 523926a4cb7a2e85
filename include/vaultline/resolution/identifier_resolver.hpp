#pragma once
#include "vaultline/core/result.hpp"
#include "vaultline/core/failures.hpp"
#include "vaultline/interfaces/i_entity_storage.hpp"
#include "vaultline/resolution/entity.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
namespace vaultline::resolution {

/// Found, NotFound or Ambiguous. Every caller must branch on all three.
class ResolutionOutcome {
public:
    enum class Kind : uint8_t {
        Found,
        NotFound,
        Ambiguous
    };

    [[nodiscard]] static ResolutionOutcome Found(EntityReference entity) {
        return ResolutionOutcome(Kind::Found, std::move(entity), 1);
    }
    [[nodiscard]] static ResolutionOutcome NotFound() {
        return ResolutionOutcome(Kind::NotFound, std::nullopt, 0);
    }
    [[nodiscard]] static ResolutionOutcome Ambiguous(const size_t match_count) {
        return ResolutionOutcome(Kind::Ambiguous, std::nullopt, match_count);
    }

    [[nodiscard]] Kind GetKind() const noexcept { return kind_; }
    [[nodiscard]] bool IsFound() const noexcept { return kind_ == Kind::Found; }
    [[nodiscard]] bool IsNotFound() const noexcept { return kind_ == Kind::NotFound; }
    [[nodiscard]] bool IsAmbiguous() const noexcept { return kind_ == Kind::Ambiguous; }

    /// Only meaningful when IsFound().
    [[nodiscard]] const std::optional<EntityReference>& Entity() const noexcept { return entity_; }

    [[nodiscard]] size_t MatchCount() const noexcept { return match_count_; }

private:
    ResolutionOutcome(const Kind kind, std::optional<EntityReference> entity, const size_t match_count)
        : kind_(kind), entity_(std::move(entity)), match_count_(match_count) {}

    Kind kind_;
    std::optional<EntityReference> entity_;
    size_t match_count_;
};

[[nodiscard]] constexpr std::string_view ToString(const ResolutionOutcome::Kind kind) noexcept {
    switch (kind) {
        case ResolutionOutcome::Kind::Found: return "Found";
        case ResolutionOutcome::Kind::NotFound: return "NotFound";
        case ResolutionOutcome::Kind::Ambiguous: return "Ambiguous";
    }
    return "Unknown";
}

/**
 * @brief Finds an entity by full or truncated UUID
 *
 * Per call: one encoding lookup, then exactly one exact or prefix query.
 * Holds only references to its collaborators, so it is safe to share across
 * threads when they are.
 */
class IdentifierResolver {
public:
    IdentifierResolver(
        interfaces::IIdentifierIntrospector& introspector,
        interfaces::IEntityQuery& query) noexcept
        : introspector_(introspector), query_(query) {}

    [[nodiscard]] Result<ResolutionOutcome, ResolverFailure> Resolve(
        const EntityType& entity_type,
        std::string_view candidate) const;

private:
    interfaces::IIdentifierIntrospector& introspector_;
    interfaces::IEntityQuery& query_;
};

}

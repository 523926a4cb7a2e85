#include "vaultline/resolution/identifier_resolver.hpp"
#include "vaultline/resolution/identifier_candidate.hpp"
#include "vaultline/debug/trace_logger.hpp"
#include <format>

namespace vaultline::resolution {
    namespace {
        Result<std::vector<EntityReference>, ResolverFailure> RunExact(
            interfaces::IEntityQuery &query,
            const EntityType &entity_type,
            const IdentifierEncoding encoding,
            const IdentifierCandidate &candidate) {
            // IdentifierCandidate guarantees 32 hex digits here
            const UuidBytes bytes = ParseUuid(candidate.NormalizedHex()).value_or(UuidBytes{});
            if (encoding == IdentifierEncoding::BinaryUuid) {
                return query.QueryExact(entity_type, ExactIdentifier{BinaryExact{bytes}});
            }
            return query.QueryExact(entity_type, ExactIdentifier{TextExact{FormatCanonicalUuid(bytes)}});
        }

        Result<std::vector<EntityReference>, ResolverFailure> RunPrefix(
            interfaces::IEntityQuery &query,
            const EntityType &entity_type,
            const IdentifierEncoding encoding,
            const IdentifierCandidate &candidate) {
            if (encoding == IdentifierEncoding::BinaryUuid) {
                auto prefix = BinaryPrefix::FromHex(candidate.NormalizedHex());
                if (prefix.IsErr()) {
                    return Result<std::vector<EntityReference>, ResolverFailure>::Err(
                        std::move(prefix).UnwrapErr());
                }
                return query.QueryPrefix(entity_type, IdentifierPrefix{std::move(prefix).Unwrap()});
            }
            auto prefix = TextPrefix::FromHex(candidate.NormalizedHex());
            if (prefix.IsErr()) {
                return Result<std::vector<EntityReference>, ResolverFailure>::Err(
                    std::move(prefix).UnwrapErr());
            }
            return query.QueryPrefix(entity_type, IdentifierPrefix{std::move(prefix).Unwrap()});
        }

        Result<ResolutionOutcome, ResolverFailure> Reject(ResolverFailure failure) {
            debug::LogResolutionRejected(failure.type);
            return Result<ResolutionOutcome, ResolverFailure>::Err(std::move(failure));
        }
    }

    Result<ResolutionOutcome, ResolverFailure> IdentifierResolver::Resolve(
        const EntityType &entity_type,
        std::string_view candidate) const {
        auto candidate_result = IdentifierCandidate::Parse(candidate);
        if (candidate_result.IsErr()) {
            return Reject(std::move(candidate_result).UnwrapErr());
        }
        const IdentifierCandidate parsed = std::move(candidate_result).Unwrap();

        auto encoding_result = introspector_.IdentifierEncodingOf(entity_type);
        if (encoding_result.IsErr()) {
            return Reject(std::move(encoding_result).UnwrapErr());
        }
        const IdentifierEncoding encoding = encoding_result.Unwrap();
        if (encoding != IdentifierEncoding::BinaryUuid && encoding != IdentifierEncoding::TextUuid) {
            return Reject(ResolverFailure::UnsupportedStorageEncoding(
                std::format("Entity type '{}' stores its identifier as {}",
                            entity_type.name, ToString(encoding))));
        }

        debug::LogResolutionStart(entity_type.name, ToString(encoding), parsed.Length(), parsed.IsFull());

        auto rows_result = parsed.IsFull()
                               ? RunExact(query_, entity_type, encoding, parsed)
                               : RunPrefix(query_, entity_type, encoding, parsed);
        if (rows_result.IsErr()) {
            return Reject(std::move(rows_result).UnwrapErr());
        }
        std::vector<EntityReference> rows = std::move(rows_result).Unwrap();

        if (parsed.IsFull() && rows.size() > 1) {
            return Reject(ResolverFailure::StorageIntegrityViolation(
                std::format("Exact identifier lookup on '{}' returned {} rows",
                            entity_type.name, rows.size())));
        }

        ResolutionOutcome outcome = ResolutionOutcome::NotFound();
        if (rows.size() == 1) {
            outcome = ResolutionOutcome::Found(std::move(rows.front()));
        } else if (rows.size() > 1) {
            outcome = ResolutionOutcome::Ambiguous(rows.size());
        }
        debug::LogResolution(ToString(outcome.GetKind()), rows.size());
        return Result<ResolutionOutcome, ResolverFailure>::Ok(std::move(outcome));
    }
}

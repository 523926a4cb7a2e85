#include "vaultline/configuration/environment_key_provider.hpp"
#include "vaultline/crypto/sodium_interop.hpp"
#include "vaultline/crypto/sodium_secure_memory_handle.hpp"
#include <cstdlib>
#include <format>

namespace vaultline::configuration {
    using crypto::SodiumInterop;
    using crypto::SecureMemoryHandle;

    Result<Unit, CipherFailure> EnvironmentKeyProvider::ExecuteWithKey(
        std::function<Result<Unit, CipherFailure>(std::span<const uint8_t>)> operation) {
        auto init_result = SodiumInterop::Initialize();
        if (init_result.IsErr()) {
            return Result<Unit, CipherFailure>::Err(
                CipherFailure::FromSodiumFailure(init_result.UnwrapErr()));
        }

        const char *encoded = std::getenv(variable_name_.c_str());
        if (encoded == nullptr || *encoded == '\0') {
            return Result<Unit, CipherFailure>::Err(
                CipherFailure::KeyUnavailable(
                    std::format("Environment variable {} is not set", variable_name_)));
        }

        auto key_result = SodiumInterop::FromBase64Secure(encoded).MapErr(
            [this](const SodiumFailure& failure) {
                return CipherFailure::KeyUnavailable(
                    std::format("Environment variable {} does not hold a base64 key: {}",
                                variable_name_, failure.message));
            });
        if (key_result.IsErr()) {
            return Result<Unit, CipherFailure>::Err(std::move(key_result).UnwrapErr());
        }
        const SecureMemoryHandle key = std::move(key_result).Unwrap();
        if (key.Size() != kCipherKeyBytes) {
            return Result<Unit, CipherFailure>::Err(
                CipherFailure::InvalidKeyLength(
                    std::format("Environment variable {} decodes to {} bytes, expected {}",
                                variable_name_, key.Size(), kCipherKeyBytes)));
        }

        auto run_result = key.WithReadAccess(operation);
        if (run_result.IsErr()) {
            return Result<Unit, CipherFailure>::Err(
                CipherFailure::FromSodiumFailure(run_result.UnwrapErr()));
        }
        return std::move(run_result).Unwrap();
    }
}

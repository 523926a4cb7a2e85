#pragma once
#include "vaultline/core/result.hpp"
#include "vaultline/core/failures.hpp"
#include <cstdint>
#include <functional>
#include <span>
namespace vaultline::interfaces {

/**
 * Hands cipher key bytes to an operation for the duration of one call.
 * The span must not be retained; implementations wipe it afterwards.
 */
class IKeyMaterialProvider {
public:
    virtual ~IKeyMaterialProvider() = default;
    [[nodiscard]] virtual Result<Unit, CipherFailure> ExecuteWithKey(
        std::function<Result<Unit, CipherFailure>(std::span<const uint8_t>)> operation) = 0;
    template<typename T>
    [[nodiscard]] Result<T, CipherFailure> ExecuteWithKeyTyped(
        std::function<Result<T, CipherFailure>(std::span<const uint8_t>)> operation) {
        Result<T, CipherFailure> result_holder =
            Result<T, CipherFailure>::Err(
                CipherFailure::KeyUnavailable("Operation not executed"));
        bool executed = false;
        auto wrapper = [&operation, &result_holder, &executed](std::span<const uint8_t> key)
            -> Result<Unit, CipherFailure> {
            executed = true;
            result_holder = operation(key);
            return result_holder.IsOk()
                ? Result<Unit, CipherFailure>::Ok(unit)
                : Result<Unit, CipherFailure>::Err(result_holder.UnwrapErr());
        };
        auto exec_result = ExecuteWithKey(wrapper);
        if (exec_result.IsErr() && (!executed || result_holder.IsOk())) {
            return Result<T, CipherFailure>::Err(std::move(exec_result).UnwrapErr());
        }
        return result_holder;
    }
};
}

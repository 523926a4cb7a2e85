#pragma once
#include "vaultline/interfaces/i_key_material_provider.hpp"
#include "vaultline/core/constants.hpp"
#include <string>
#include <string_view>
namespace vaultline::configuration {

/**
 * @brief Reads the cipher key from a base64 environment variable
 *
 * The variable is read and decoded on every ExecuteWithKey call; decoded
 * bytes live in a SecureMemoryHandle that is released when the operation
 * returns. Nothing is cached between calls.
 */
class EnvironmentKeyProvider final : public interfaces::IKeyMaterialProvider {
public:
    explicit EnvironmentKeyProvider(
        std::string variable_name = std::string(kDefaultKeyEnvironmentVariable))
        : variable_name_(std::move(variable_name)) {}

    [[nodiscard]] Result<Unit, CipherFailure> ExecuteWithKey(
        std::function<Result<Unit, CipherFailure>(std::span<const uint8_t>)> operation) override;

    [[nodiscard]] const std::string& VariableName() const noexcept { return variable_name_; }

private:
    std::string variable_name_;
};

}

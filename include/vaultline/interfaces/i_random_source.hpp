#pragma once
#include <cstdint>
#include <span>
namespace vaultline::interfaces {
class IRandomSource {
public:
    virtual ~IRandomSource() = default;
    virtual void Fill(std::span<uint8_t> buffer) = 0;
};
}

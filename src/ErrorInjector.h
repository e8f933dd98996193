#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

// Simulates channel noise: with probability p, one byte of a copy of the
// payload is replaced by (byte + 1) mod 256. The caller's buffer is never
// touched. The generator is supplied by the owner so runs can be replayed.
class ErrorInjector {
public:
    ErrorInjector(double probability, std::mt19937 rng);
    ErrorInjector(double probability, uint32_t seed);

    std::vector<uint8_t> maybe_corrupt(const std::vector<uint8_t>& data, bool* corrupted = nullptr);

    double probability() const { return p; }
    uint64_t corruptions() const { return injected; }

private:
    double p;
    std::mt19937 rng;
    uint64_t injected = 0;
};

#include "ErrorInjector.h"

#include <cmath>
#include <stdexcept>
#include <utility>

ErrorInjector::ErrorInjector(double probability, std::mt19937 generator)
    : p(probability), rng(std::move(generator)) {
    if (std::isnan(p) || p < 0.0 || p > 1.0) {
        throw std::invalid_argument("ErrorInjector: probability must be within [0, 1]");
    }
}

ErrorInjector::ErrorInjector(double probability, uint32_t seed)
    : ErrorInjector(probability, std::mt19937(seed)) {}

std::vector<uint8_t> ErrorInjector::maybe_corrupt(const std::vector<uint8_t>& data, bool* corrupted) {
    if (corrupted) *corrupted = false;

    std::vector<uint8_t> out(data);
    if (out.empty()) return out;

    std::bernoulli_distribution roll(p);
    if (!roll(rng)) return out;

    std::uniform_int_distribution<size_t> pick(0, out.size() - 1);
    size_t pos = pick(rng);
    out[pos] = static_cast<uint8_t>(out[pos] + 1);

    ++injected;
    if (corrupted) *corrupted = true;
    return out;
}

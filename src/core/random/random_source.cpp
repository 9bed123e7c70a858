#include "random_source.hpp"
#include <algorithm>
#include <cctype>

namespace prism {

RandomSource::RandomSource(uint64_t seed, RandomAlgorithm algorithm)
    : m_algorithm(algorithm) {
    reseed(seed);
}

RandomSource::RandomSource(const RandomSource& other)
    : m_algorithm(other.m_algorithm)
    , m_seed(other.m_seed)
    , m_state(other.m_state)
    , m_mt(other.m_mt ? std::make_unique<std::mt19937_64>(*other.m_mt) : nullptr) {
}

RandomSource& RandomSource::operator=(const RandomSource& other) {
    if (this != &other) {
        m_algorithm = other.m_algorithm;
        m_seed = other.m_seed;
        m_state = other.m_state;
        m_mt = other.m_mt ? std::make_unique<std::mt19937_64>(*other.m_mt) : nullptr;
    }
    return *this;
}

RandomSource RandomSource::forStream(uint64_t seed, uint64_t stream, RandomAlgorithm algorithm) {
    uint64_t mix = seed ^ 0xD1B54A32D192ED03ULL;
    uint64_t streamState = stream;
    uint64_t derived = splitMix64(mix) ^ splitMix64(streamState);
    return RandomSource(derived, algorithm);
}

uint64_t RandomSource::entropySeed() {
    std::random_device device;
    uint64_t high = static_cast<uint64_t>(device());
    uint64_t low = static_cast<uint64_t>(device());
    return (high << 32) ^ low;
}

void RandomSource::reseed(uint64_t seed) {
    m_seed = seed;

    uint64_t expand = seed;
    for (auto& word : m_state) {
        word = splitMix64(expand);
    }

    // xoshiro must never run from the all-zero state
    if (m_state[0] == 0 && m_state[1] == 0 && m_state[2] == 0 && m_state[3] == 0) {
        m_state[0] = 0x9E3779B97F4A7C15ULL;
    }

    if (m_algorithm != RandomAlgorithm::Mt19937) {
        m_mt.reset();
    } else if (m_mt) {
        m_mt->seed(seed);
    } else {
        m_mt = std::make_unique<std::mt19937_64>(seed);
    }
}

int RandomSource::uniformInt(int lo, int hi) {
    if (hi < lo) {
        std::swap(lo, hi);
    }
    int value = static_cast<int>(uniformBetween(static_cast<double>(lo), static_cast<double>(hi) + 1.0));
    return std::min(value, hi);
}

const char* RandomSource::algorithmName(RandomAlgorithm algorithm) {
    switch (algorithm) {
        case RandomAlgorithm::Xoshiro256StarStar: return "xoshiro";
        case RandomAlgorithm::SplitMix64:         return "splitmix";
        case RandomAlgorithm::Lcg64:              return "lcg";
        case RandomAlgorithm::Mt19937:            return "mt19937";
    }
    return "unknown";
}

std::optional<RandomAlgorithm> RandomSource::parseAlgorithm(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "xoshiro" || lower == "xoshiro256**" || lower == "xoshiro256starstar") {
        return RandomAlgorithm::Xoshiro256StarStar;
    }
    if (lower == "splitmix" || lower == "splitmix64") {
        return RandomAlgorithm::SplitMix64;
    }
    if (lower == "lcg" || lower == "lcg64") {
        return RandomAlgorithm::Lcg64;
    }
    if (lower == "mt19937" || lower == "mt") {
        return RandomAlgorithm::Mt19937;
    }
    return std::nullopt;
}

} // namespace prism

#pragma once
/**
 * random_source.hpp - Uniform sampling for the path tracer
 *
 * Every draw in the renderer goes through RandomSource: camera lens jitter,
 * anti-aliasing offsets, diffuse/fuzz perturbation and the dielectric
 * reflect-or-refract decision. It is the hottest code path in a render, so the
 * small generators keep their state inline (no virtual dispatch) and the
 * algorithm is selected with an enum. Only Mt19937 allocates its state.
 *
 * Instances are NOT thread-safe. Each render worker owns its own instance,
 * usually derived with forStream() so results do not depend on scheduling.
 */

#include "core/math/render_math.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>

namespace prism {

enum class RandomAlgorithm {
    Xoshiro256StarStar,
    SplitMix64,
    Lcg64,
    Mt19937
};

class RandomSource {
public:
    static constexpr uint64_t kDefaultSeed = 0x5EED5EED2024ULL;

    explicit RandomSource(uint64_t seed = kDefaultSeed,
                          RandomAlgorithm algorithm = RandomAlgorithm::Xoshiro256StarStar);

    // Copies carry on from the same point in the sequence, independently
    RandomSource(const RandomSource& other);
    RandomSource& operator=(const RandomSource& other);
    RandomSource(RandomSource&&) noexcept = default;
    RandomSource& operator=(RandomSource&&) noexcept = default;

    /**
     * @brief Derive an independent generator for one stream (row, worker, ...)
     *
     * The same (seed, stream, algorithm) triple always yields the same sequence.
     */
    static RandomSource forStream(uint64_t seed, uint64_t stream,
                                  RandomAlgorithm algorithm = RandomAlgorithm::Xoshiro256StarStar);

    // Non-deterministic seed from std::random_device
    static uint64_t entropySeed();

    void reseed(uint64_t seed);

    uint64_t nextU64() {
        switch (m_algorithm) {
            case RandomAlgorithm::Xoshiro256StarStar: return nextXoshiro();
            case RandomAlgorithm::SplitMix64:         return splitMix64(m_state[0]);
            case RandomAlgorithm::Lcg64:              return nextLcg();
            case RandomAlgorithm::Mt19937:            return (*m_mt)();
        }
        return nextXoshiro();
    }

    // Uniform double in [0, 1) built from the top 53 bits
    double uniform() {
        return static_cast<double>(nextU64() >> 11) * 0x1.0p-53;
    }

    double uniformBetween(double lo, double hi) {
        return lo + uniform() * (hi - lo);
    }

    // Uniform integer in [lo, hi]
    int uniformInt(int lo, int hi);

    // Each component in [0, 1)
    Vec3 vector() {
        double x = uniform();
        double y = uniform();
        double z = uniform();
        return Vec3(x, y, z);
    }

    Vec3 vectorBetween(double lo, double hi) {
        double x = uniformBetween(lo, hi);
        double y = uniformBetween(lo, hi);
        double z = uniformBetween(lo, hi);
        return Vec3(x, y, z);
    }

    // Rejection sampled; about 1.9 candidates per accepted point on average
    Vec3 vectorInUnitSphere() {
        while (true) {
            Vec3 p = vectorBetween(-1.0, 1.0);
            if (math::lengthSquared(p) < 1.0) {
                return p;
            }
        }
    }

    Vec3 vectorInUnitDisk() {
        while (true) {
            double x = uniformBetween(-1.0, 1.0);
            double y = uniformBetween(-1.0, 1.0);
            Vec3 p(x, y, 0.0);
            if (math::lengthSquared(p) < 1.0) {
                return p;
            }
        }
    }

    // Uniformly distributed direction on the unit sphere
    Vec3 unitVector() {
        while (true) {
            Vec3 p = vectorInUnitSphere();
            double lenSq = math::lengthSquared(p);
            if (lenSq > 1e-24) {
                return p / std::sqrt(lenSq);
            }
        }
    }

    RandomAlgorithm getAlgorithm() const { return m_algorithm; }
    uint64_t getSeed() const { return m_seed; }

    static const char* algorithmName(RandomAlgorithm algorithm);
    static std::optional<RandomAlgorithm> parseAlgorithm(const std::string& name);

    // SplitMix64 step; also used to expand seeds into full generator state
    static uint64_t splitMix64(uint64_t& state) {
        uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }

private:
    static uint64_t rotl(uint64_t x, int k) {
        return (x << k) | (x >> (64 - k));
    }

    uint64_t nextXoshiro() {
        const uint64_t result = rotl(m_state[1] * 5, 7) * 9;
        const uint64_t t = m_state[1] << 17;

        m_state[2] ^= m_state[0];
        m_state[3] ^= m_state[1];
        m_state[1] ^= m_state[2];
        m_state[0] ^= m_state[3];
        m_state[2] ^= t;
        m_state[3] = rotl(m_state[3], 45);

        return result;
    }

    // Knuth MMIX constants; uniform() only consumes the high bits
    uint64_t nextLcg() {
        m_state[0] = m_state[0] * 6364136223846793005ULL + 1442695040888963407ULL;
        return m_state[0];
    }

    RandomAlgorithm m_algorithm;
    uint64_t m_seed{0};
    std::array<uint64_t, 4> m_state{};
    std::unique_ptr<std::mt19937_64> m_mt;  // Mt19937 only; its state is ~2.5 KB
};

} // namespace prism

/**
 * @file Random.hpp
 * @brief Source d'aléa injectable pour le générateur d'événements et la personnalité
 * @version 1.0
 * @date 2026-10-19
 */

#ifndef SOUL_RANDOM_HPP
#define SOUL_RANDOM_HPP

#include <cstddef>
#include <cstdint>
#include <random>
#include <stdexcept>

namespace soul {

/**
 * @class RandomSource
 * @brief Interface de tirage aléatoire
 *
 * Toutes les décisions stochastiques du noyau (catégorie, bruit de
 * signification, nouveauté, impact éthique, mutation) passent par cette
 * interface, ce qui permet aux tests de rejouer des tirages scriptés.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * @brief Tirage uniforme dans [lo, hi]
     */
    virtual double uniform(double lo, double hi) = 0;

    /**
     * @brief Tirage uniforme dans [0, 1)
     */
    virtual double chance() = 0;

    /**
     * @brief Index uniforme dans [0, n)
     * @throws std::invalid_argument si n == 0
     */
    virtual size_t index(size_t n) = 0;
};

/**
 * @class MersenneRandom
 * @brief Implémentation par défaut basée sur std::mt19937
 */
class MersenneRandom : public RandomSource {
public:
    /**
     * @brief Constructeur
     * @param seed Graine (0 = graine issue de std::random_device)
     */
    explicit MersenneRandom(uint32_t seed = 0)
        : rng_(seed == 0 ? std::random_device{}() : seed) {}

    double uniform(double lo, double hi) override {
        std::uniform_real_distribution<double> dist(lo, hi);
        return dist(rng_);
    }

    double chance() override {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(rng_);
    }

    size_t index(size_t n) override {
        if (n == 0) {
            throw std::invalid_argument("MersenneRandom::index: ensemble vide");
        }
        std::uniform_int_distribution<size_t> dist(0, n - 1);
        return dist(rng_);
    }

private:
    std::mt19937 rng_;
};

} // namespace soul

#endif // SOUL_RANDOM_HPP

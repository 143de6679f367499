#pragma once
#include <cmath>
#include <cstdint>
#include <random>

/**
 * @brief Random source for the simulated hardware
 *
 * Supplies the random timing used by the host simulation: when the next
 * remote button press happens and how much the receiver's mark/space
 * edges jitter.
 */
class NoiseSimulator {
private:
    mutable std::mt19937_64 rng_;                    ///< Random number generator
    mutable std::normal_distribution<double> normal_; ///< Gaussian distribution
    mutable std::uniform_real_distribution<double> uniform_; ///< Uniform distribution

public:
    /**
     * @param seed Random seed (0 = use random device)
     */
    explicit NoiseSimulator(uint64_t seed = 0)
        : rng_(seed == 0 ? std::random_device{}() : seed)
        , normal_(0.0, 1.0)
        , uniform_(0.0, 1.0)
    {}

    double gaussian(double mean = 0.0, double std_dev = 1.0) const {
        return mean + std_dev * normal_(rng_);
    }

    /**
     * @brief Exponentially distributed interval (Poisson arrivals)
     * @param rate Rate parameter (1/mean)
     */
    double exponential(double rate = 1.0) const {
        double u = uniform_(rng_);
        if (u <= 0.0) u = 1e-12;
        return -std::log(u) / rate;
    }
};

/**
 * @brief Noise sources specific to the IR press rig
 */
namespace IrSimNoise {

    /**
     * @brief Timing of a person using the remote
     *
     * Button presses arrive as a Poisson process. Each mark/space edge of the
     * received frame is shifted by a small gaussian error, as the AGC and
     * demodulator of a real receiver do.
     */
    class RemoteTiming {
    private:
        NoiseSimulator noise_;
        double mean_press_interval_s_{15.0};   ///< Mean time between presses
        double edge_jitter_us_{20.0};          ///< Edge timing error (1 sigma)

    public:
        explicit RemoteTiming(uint64_t seed = 0) : noise_(seed) {}

        /**
         * @brief Seconds until the next button press
         */
        double next_press_interval_s() const {
            return noise_.exponential(1.0 / mean_press_interval_s_);
        }

        /**
         * @brief Jittered duration of one mark or space
         * @param nominal_us Protocol duration in microseconds
         */
        double jitter_us(double nominal_us) const {
            double d = noise_.gaussian(nominal_us, edge_jitter_us_);
            return d < 1.0 ? 1.0 : d;
        }

        void set_mean_press_interval(double seconds) { mean_press_interval_s_ = seconds; }
        double get_mean_press_interval() const { return mean_press_interval_s_; }
        void set_edge_jitter(double us) { edge_jitter_us_ = us < 0.0 ? 0.0 : us; }
    };
}

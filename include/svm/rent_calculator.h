#pragma once

#include "common/types.h"

namespace altprog {
namespace svm {

using namespace altprog::common;

/**
 * Rent-exemption calculation
 * Equivalent to the runtime's Rent sysvar minimum_balance()
 */
class RentCalculator {
public:
    // Default rent configuration based on Solana mainnet
    static constexpr Lamports DEFAULT_LAMPORTS_PER_BYTE_YEAR = 3480;
    static constexpr double DEFAULT_EXEMPTION_THRESHOLD = 2.0;

    /// Bytes of account metadata charged on top of the data length
    static constexpr size_t ACCOUNT_STORAGE_OVERHEAD = 128;

    struct RentConfig {
        Lamports lamports_per_byte_year = DEFAULT_LAMPORTS_PER_BYTE_YEAR;
        double exemption_threshold = DEFAULT_EXEMPTION_THRESHOLD;

        RentConfig() = default;
        RentConfig(Lamports per_byte, double threshold)
            : lamports_per_byte_year(per_byte), exemption_threshold(threshold) {}
    };

    explicit RentCalculator(const RentConfig& config);
    RentCalculator();
    ~RentCalculator() = default;

    /**
     * Minimum balance for an account holding data_size bytes to be rent exempt
     */
    Lamports minimum_balance(size_t data_size) const;

    /**
     * Check if balance covers the exemption minimum for data_size
     */
    bool is_rent_exempt(Lamports balance, size_t data_size) const;

    const RentConfig& get_config() const { return config_; }
    void update_config(const RentConfig& config) { config_ = config; }

private:
    RentConfig config_;
};

} // namespace svm
} // namespace altprog

// CaveGen Analysis
// connectivity_validator.hpp - Region connectivity scoring with corridor-carving fallback

#pragma once

#include "region_detector.hpp"

#include <cavegen/core/random.hpp>
#include <cavegen/level/grid.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace cavegen::analysis {

// ============================================================================
// Configuration and Reports
// ============================================================================

struct ConnectivityConfig {
    int32_t max_fallback_attempts = 3;
    double fallback_timeout_ms = 5000.0;
    double min_connectivity_score = 1.0;  // 1.0 effectively demands a single region
};

struct ConnectivityReport {
    double score = 1.0;  // largest_area / total_floor, 1.0 with no floor
    size_t region_count = 0;
    size_t total_floor = 0;
    size_t largest_area = 0;
    bool connected = true;
};

struct FallbackResult {
    bool success = false;
    bool connected = false;
    double score = 0.0;
    size_t region_count = 0;
    ConnectivityReport initial_report;
    int32_t attempts = 0;
    std::string method;
    bool fallback_applied = false;
    bool timed_out = false;
    std::string error;
    level::Grid grid;
};

struct ConnectivityStats {
    size_t validations = 0;
    double total_time_ms = 0.0;
    double peak_time_ms = 0.0;

    [[nodiscard]] double average_time_ms() const {
        return validations == 0 ? 0.0 : total_time_ms / static_cast<double>(validations);
    }
};

// ============================================================================
// Connectivity Validator
// ============================================================================

class ConnectivityValidator {
public:
    /// Throws std::invalid_argument on negative attempts, a non-positive timeout or a score outside [0, 1]
    explicit ConnectivityValidator(const ConnectivityConfig& config = {});

    [[nodiscard]] ConnectivityReport validate_connectivity(const level::Grid& grid);

    /// Report from an existing detection without re-scanning the grid
    [[nodiscard]] ConnectivityReport evaluate(const RegionDetection& detection) const;

    /// Carve corridors until connected, out of attempts, or out of time. Never throws for exhaustion.
    [[nodiscard]] FallbackResult validate_connectivity_with_fallback(const level::Grid& grid, core::RandomSource& rng);

    [[nodiscard]] const ConnectivityConfig& get_config() const { return config_; }
    [[nodiscard]] const ConnectivityStats& stats() const { return stats_; }
    void reset_stats() { stats_ = {}; }

private:
    ConnectivityConfig config_;
    ConnectivityStats stats_;
};

}  // namespace cavegen::analysis

// CaveGen Analysis
// connectivity_validator.cpp - Region connectivity scoring with corridor-carving fallback

#include <cavegen/analysis/connectivity_validator.hpp>
#include <cavegen/analysis/corridor_carver.hpp>
#include <cavegen/core/logger.hpp>
#include <cavegen/platform/timer.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace cavegen::analysis {

ConnectivityValidator::ConnectivityValidator(const ConnectivityConfig& config) : config_(config) {
    if (config_.max_fallback_attempts < 0) {
        throw std::invalid_argument(
            fmt::format("max_fallback_attempts must be non-negative, got {}", config_.max_fallback_attempts));
    }
    if (!(config_.fallback_timeout_ms > 0.0)) {
        throw std::invalid_argument(
            fmt::format("fallback_timeout_ms must be positive, got {}", config_.fallback_timeout_ms));
    }
    if (std::isnan(config_.min_connectivity_score) || config_.min_connectivity_score < 0.0 ||
        config_.min_connectivity_score > 1.0) {
        throw std::invalid_argument(
            fmt::format("min_connectivity_score must be within [0, 1], got {}", config_.min_connectivity_score));
    }
}

ConnectivityReport ConnectivityValidator::evaluate(const RegionDetection& detection) const {
    ConnectivityReport report;
    report.region_count = detection.region_count();
    report.total_floor = detection.total_area();
    if (!detection.regions.empty()) {
        report.largest_area = largest_region(detection).area;
    }
    report.score = report.total_floor == 0
                       ? 1.0
                       : static_cast<double>(report.largest_area) / static_cast<double>(report.total_floor);
    report.connected = report.region_count <= 1 || report.score >= config_.min_connectivity_score;
    return report;
}

ConnectivityReport ConnectivityValidator::validate_connectivity(const level::Grid& grid) {
    platform::Timer timer;
    const ConnectivityReport report = evaluate(RegionDetector::detect_regions(grid));

    const double elapsed = timer.elapsed_milliseconds();
    ++stats_.validations;
    stats_.total_time_ms += elapsed;
    stats_.peak_time_ms = std::max(stats_.peak_time_ms, elapsed);

    CAVEGEN_LOG_DEBUG(core::log_category::ANALYSIS, "Connectivity: {} regions, score {:.3f}, connected={}",
                      report.region_count, report.score, report.connected);
    return report;
}

FallbackResult ConnectivityValidator::validate_connectivity_with_fallback(const level::Grid& grid,
                                                                          core::RandomSource& rng) {
    FallbackResult result;
    result.grid = grid;
    result.initial_report = validate_connectivity(grid);

    if (result.initial_report.connected) {
        result.success = true;
        result.connected = true;
        result.score = result.initial_report.score;
        result.region_count = result.initial_report.region_count;
        return result;
    }

    result.fallback_applied = true;
    result.method = "corridor_carving";
    result.score = result.initial_report.score;
    result.region_count = result.initial_report.region_count;

    platform::Timer budget;
    while (result.attempts < config_.max_fallback_attempts) {
        if (budget.has_exceeded(config_.fallback_timeout_ms)) {
            result.timed_out = true;
            result.error = "Fallback operation timed out";
            CAVEGEN_LOG_WARN(core::log_category::ANALYSIS, "Connectivity fallback timed out after {} attempts",
                             result.attempts);
            return result;
        }

        ++result.attempts;
        const RegionDetection detection = RegionDetector::detect_regions(result.grid);
        result.grid = CorridorCarver::carve_corridors(result.grid, detection, rng);

        const ConnectivityReport report = validate_connectivity(result.grid);
        result.score = report.score;
        result.region_count = report.region_count;
        if (report.connected) {
            result.success = true;
            result.connected = true;
            CAVEGEN_LOG_INFO(core::log_category::ANALYSIS, "Connectivity restored after {} corridor attempt(s)",
                             result.attempts);
            return result;
        }
    }

    result.error = fmt::format("Failed to connect regions after {} fallback attempts", result.attempts);
    CAVEGEN_LOG_WARN(core::log_category::ANALYSIS, "{}", result.error);
    return result;
}

}  // namespace cavegen::analysis

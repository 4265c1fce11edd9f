#pragma once

#include <algorithm>

namespace pathviz {

/// Pacing settings for SearchPlayback
///
/// Presets:
/// - slow(): 800 ms per path segment
/// - normal(): 200 ms (default)
/// - fast(): 50 ms
///
/// Usage:
/// @code
/// auto options = PlaybackOptions::normal().withInterval(350);
/// SearchPlayback playback(result, options);
/// @endcode
struct PlaybackOptions {
    static constexpr int MIN_INTERVAL_MS = 50;
    static constexpr int MAX_INTERVAL_MS = 800;
    static constexpr int DEFAULT_INTERVAL_MS = 200;

    /// Delay between path segments in milliseconds.
    /// Visitation steps run twice as fast (never below MIN_INTERVAL_MS).
    int intervalMs = DEFAULT_INTERVAL_MS;

    /// Interval clamped to [MIN_INTERVAL_MS, MAX_INTERVAL_MS]
    int pathIntervalMs() const {
        return std::clamp(intervalMs, MIN_INTERVAL_MS, MAX_INTERVAL_MS);
    }

    /// Interval used when stepping through visited nodes
    int visitIntervalMs() const {
        return std::max(MIN_INTERVAL_MS, pathIntervalMs() / 2);
    }

    // === Named Presets ===

    static PlaybackOptions slow() { return PlaybackOptions{}.withInterval(MAX_INTERVAL_MS); }
    static PlaybackOptions normal() { return PlaybackOptions{}; }
    static PlaybackOptions fast() { return PlaybackOptions{}.withInterval(MIN_INTERVAL_MS); }

    // === Convenience Methods ===

    /// Set interval (clamped)
    PlaybackOptions& withInterval(int ms) {
        intervalMs = std::clamp(ms, MIN_INTERVAL_MS, MAX_INTERVAL_MS);
        return *this;
    }
};

}  // namespace pathviz

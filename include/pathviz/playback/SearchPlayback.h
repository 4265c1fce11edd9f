#pragma once

#include "PlaybackOptions.h"
#include "../search/SearchTypes.h"

#include <optional>
#include <utility>
#include <vector>

namespace pathviz {

/// Which sequence advance() steps through
enum class PlaybackMode {
    Visits,  ///< visitedOrder, one node per step
    Path     ///< path, one segment per step, then endpoints
};

/// Snapshot of what a renderer should highlight
struct PlaybackFrame {
    using Segment = std::pair<NodeKey, NodeKey>;

    std::vector<NodeKey> visited;       ///< Visited nodes stepped so far, in order
    std::vector<Segment> pathSegments;  ///< Revealed path segments
    std::vector<NodeKey> pathNodes;     ///< First node of each revealed segment
    std::optional<NodeKey> start;       ///< Set once the whole path is revealed
    std::optional<NodeKey> goal;        ///< Set once the whole path is revealed
};

/**
 * @brief Paces the presentation of a finished SearchResult
 *
 * The search has already run; this class only decides how much of its
 * visitation order and path is shown. Visitation stepping and path reveal
 * keep independent cursors so a viewer can run both at once.
 *
 * Timer-driven use:
 * @code
 * SearchPlayback playback(result, PlaybackOptions::normal());
 * playback.setMode(PlaybackMode::Path);
 * // each frame:
 * playback.advance(deltaMs);
 * renderer.draw(graph, playback.frame());
 * @endcode
 */
class SearchPlayback {
public:
    SearchPlayback() = default;
    explicit SearchPlayback(SearchResult result, PlaybackOptions options = {});

    /// Replace the result and rewind both cursors
    void load(SearchResult result);

    const SearchResult& result() const { return result_; }

    const PlaybackOptions& options() const { return options_; }
    void setOptions(const PlaybackOptions& options) { options_ = options; }

    // === Visitation stepping ===

    /// Highlight the next node of visitedOrder
    /// @return false when every visited node is already highlighted
    bool stepVisit();

    void resetVisits();

    /// Prefix of visitedOrder highlighted so far
    std::vector<NodeKey> visitedSoFar() const;

    size_t visitCursor() const { return visitCursor_; }
    bool visitsFinished() const { return visitCursor_ >= result_.visitedOrder.size(); }

    // === Path reveal ===

    /// Reveal the next path segment; after the last one, mark start and goal
    /// @return false when there is nothing left to reveal
    bool stepPath();

    void resetPath();

    size_t revealedSegments() const { return revealedSegments_; }
    size_t totalSegments() const;
    bool endpointsMarked() const { return endpointsMarked_; }

    /// All segments revealed and endpoints marked (true for an empty path)
    bool pathFinished() const;

    // === Timer pacing ===

    PlaybackMode mode() const { return mode_; }

    /// Switch mode and drop any partially elapsed interval
    void setMode(PlaybackMode mode);

    /// Accumulate elapsed time and perform the steps that became due
    /// @return Number of steps performed
    int advance(int elapsedMs);

    /// Rewind both cursors and the timer
    void reset();

    PlaybackFrame frame() const;

private:
    int activeIntervalMs() const;
    bool activeFinished() const;
    size_t remainingSteps() const;

    SearchResult result_;
    PlaybackOptions options_;
    PlaybackMode mode_ = PlaybackMode::Path;

    size_t visitCursor_ = 0;
    size_t revealedSegments_ = 0;
    bool endpointsMarked_ = false;
    int pendingMs_ = 0;
};

}  // namespace pathviz

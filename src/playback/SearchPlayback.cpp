#include "pathviz/playback/SearchPlayback.h"
#include "pathviz/common/Logger.h"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace pathviz {

SearchPlayback::SearchPlayback(SearchResult result, PlaybackOptions options)
    : result_(std::move(result)), options_(options) {}

void SearchPlayback::load(SearchResult result) {
    result_ = std::move(result);
    reset();
}

bool SearchPlayback::stepVisit() {
    if (visitsFinished()) {
        return false;
    }
    LOG_TRACE("visit step {}: {}", visitCursor_, toString(result_.visitedOrder[visitCursor_]));
    ++visitCursor_;
    return true;
}

void SearchPlayback::resetVisits() {
    visitCursor_ = 0;
}

std::vector<NodeKey> SearchPlayback::visitedSoFar() const {
    return {result_.visitedOrder.begin(),
            result_.visitedOrder.begin() + static_cast<std::ptrdiff_t>(visitCursor_)};
}

size_t SearchPlayback::totalSegments() const {
    return result_.path.empty() ? 0 : result_.path.size() - 1;
}

bool SearchPlayback::stepPath() {
    if (revealedSegments_ < totalSegments()) {
        ++revealedSegments_;
        return true;
    }
    if (!result_.path.empty() && !endpointsMarked_) {
        endpointsMarked_ = true;
        return true;
    }
    return false;
}

void SearchPlayback::resetPath() {
    revealedSegments_ = 0;
    endpointsMarked_ = false;
}

bool SearchPlayback::pathFinished() const {
    return result_.path.empty() || endpointsMarked_;
}

void SearchPlayback::setMode(PlaybackMode mode) {
    mode_ = mode;
    pendingMs_ = 0;
}

int SearchPlayback::activeIntervalMs() const {
    return mode_ == PlaybackMode::Visits ? options_.visitIntervalMs()
                                         : options_.pathIntervalMs();
}

bool SearchPlayback::activeFinished() const {
    return mode_ == PlaybackMode::Visits ? visitsFinished() : pathFinished();
}

size_t SearchPlayback::remainingSteps() const {
    if (mode_ == PlaybackMode::Visits) {
        return result_.visitedOrder.size() - visitCursor_;
    }
    return totalSegments() - revealedSegments_ + (endpointsMarked_ ? 0 : 1);
}

int SearchPlayback::advance(int elapsedMs) {
    if (elapsedMs <= 0 || activeFinished()) {
        return 0;
    }

    const int interval = activeIntervalMs();

    // Never bank more time than the remaining steps can consume
    const std::int64_t budget = static_cast<std::int64_t>(interval) *
                                static_cast<std::int64_t>(remainingSteps());
    const std::int64_t pending = std::min<std::int64_t>(
        {static_cast<std::int64_t>(pendingMs_) + elapsedMs, budget,
         std::numeric_limits<int>::max()});
    pendingMs_ = static_cast<int>(pending);
    int steps = 0;

    while (pendingMs_ >= interval && !activeFinished()) {
        pendingMs_ -= interval;
        bool stepped = mode_ == PlaybackMode::Visits ? stepVisit() : stepPath();
        if (!stepped) {
            break;
        }
        ++steps;
    }

    if (activeFinished()) {
        pendingMs_ = 0;
    }
    return steps;
}

void SearchPlayback::reset() {
    resetVisits();
    resetPath();
    pendingMs_ = 0;
}

PlaybackFrame SearchPlayback::frame() const {
    PlaybackFrame out;
    out.visited = visitedSoFar();

    const auto& path = result_.path;
    out.pathSegments.reserve(revealedSegments_);
    out.pathNodes.reserve(revealedSegments_);
    for (size_t i = 0; i < revealedSegments_; ++i) {
        out.pathSegments.emplace_back(path[i], path[i + 1]);
        out.pathNodes.push_back(path[i]);
    }

    if (endpointsMarked_) {
        out.start = path.front();
        out.goal = path.back();
    }
    return out;
}

}  // namespace pathviz

#pragma once

#include <ostream>
#include <string>

namespace pathviz {

// Forward declarations
class Graph;
struct PlaybackFrame;

/// Abstract interface for graph exporters
///
/// Exporters render a graph plus the overlays of one playback frame
/// (visited nodes, revealed path, endpoints). Pass a default-constructed
/// frame to render the bare graph.
class IExporter {
public:
    virtual ~IExporter() = default;

    /// Export to string
    virtual std::string exportToString(const Graph& graph, const PlaybackFrame& frame) = 0;

    /// Export to an output stream
    virtual void exportToStream(const Graph& graph, const PlaybackFrame& frame, std::ostream& out) = 0;

    /// Export to a file
    /// @return false if the file could not be written
    virtual bool exportToFile(const Graph& graph, const PlaybackFrame& frame, const std::string& filename) = 0;

    /// Get the file extension for this export format (e.g., "svg")
    virtual std::string fileExtension() const = 0;

    /// Get the MIME type for this export format (e.g., "image/svg+xml")
    virtual std::string mimeType() const = 0;
};

}  // namespace pathviz

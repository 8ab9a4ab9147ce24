// =================================================================
// include/RepoLens/ReportWriter.hpp
// =================================================================
// Renders a relationship graph as JSON, plain text or Graphviz DOT.

#pragma once

#include "RepoLens/FileIndex.hpp"
#include "RepoLens/Relationship.hpp"
#include "nlohmann/json.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace RepoLens {

enum class ReportFormat {
    Json,
    Text,
    Dot
};

/**
 * @brief Parse "json", "text" or "dot"
 * @throws std::invalid_argument for anything else
 */
ReportFormat reportFormatFromName(const std::string& name);

/**
 * @brief Serializes an analysis result
 *
 * The JSON document has the shape
 * {"files": [...], "relationships": [{"from", "to", "type", "line", "identifier"}],
 *  "stats": {"total", "byType"}}.
 * "line" and "identifier" are null when the relationship carries none.
 */
class ReportWriter {
public:
    ReportWriter(const FileIndex& index, const RelationshipGraph& graph);

    /**
     * @brief Only report relationships of these kinds (all kinds when empty)
     */
    void setKindFilter(std::vector<RelationshipKind> kinds);

    nlohmann::json toJson() const;
    std::string toText() const;
    std::string toDot() const;

    void write(std::ostream& out, ReportFormat format) const;

    /**
     * @brief Write a report to a file
     * @return false if the file could not be written
     */
    bool writeToFile(const std::string& path, ReportFormat format) const;

    /**
     * @brief Relationships that pass the kind filter, in graph order
     */
    std::vector<Relationship> selectedRelationships() const;

private:
    bool isSelected(RelationshipKind kind) const;

    const FileIndex& m_index;
    const RelationshipGraph& m_graph;
    std::vector<RelationshipKind> m_kinds;
};

} // namespace RepoLens

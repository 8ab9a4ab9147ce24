// =================================================================
// include/RepoLens/Relationship.hpp
// =================================================================
// Directed, typed edges between indexed files and the graph holding them.

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace RepoLens {

enum class RelationshipKind {
    Import,
    Export,
    FunctionCall,
    VariableRef
};

/**
 * @brief Wire name of a kind ("import", "export", "function-call", "variable-ref")
 */
std::string relationshipKindName(RelationshipKind kind);

/**
 * @brief Parse a wire name back into a kind
 * @return The kind, or std::nullopt for unknown names
 */
std::optional<RelationshipKind> relationshipKindFromName(const std::string& name);

/**
 * @brief RGB colour used to draw connections of a kind
 */
uint32_t relationshipKindColor(RelationshipKind kind);

/**
 * @brief One resolved edge; both endpoints are index keys
 */
struct Relationship {
    std::string from_file;
    std::string to_file;
    RelationshipKind kind = RelationshipKind::Import;
    std::optional<int> line_number;
    std::optional<std::string> identifier;
};

struct Vector3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

/**
 * @brief Drawable connection between two positioned files
 *
 * The control point is the midpoint of the endpoints raised above the
 * higher one, giving the arc a quadratic curve passes through.
 */
struct Connection {
    Vector3 from;
    Vector3 to;
    Vector3 control;
    RelationshipKind kind = RelationshipKind::Import;
    uint32_t color = 0;
    const Relationship* relationship = nullptr;
};

struct GraphStats {
    size_t total = 0;
    std::map<RelationshipKind, size_t> by_kind;
    size_t source_files = 0;
    size_t target_files = 0;
};

/**
 * @brief Insertion-ordered edge list of a directed multigraph over file paths
 *
 * Purely additive: relationships are appended and never modified or removed.
 * Duplicate edges and cycles are kept as produced.
 */
class RelationshipGraph {
public:
    void add(Relationship relationship);
    void append(std::vector<Relationship> relationships);

    const std::vector<Relationship>& relationships() const { return m_relationships; }
    size_t size() const { return m_relationships.size(); }
    bool empty() const { return m_relationships.empty(); }

    std::vector<Relationship> outgoing(const std::string& path) const;
    std::vector<Relationship> incoming(const std::string& path) const;
    std::vector<Relationship> ofKind(RelationshipKind kind) const;

    /**
     * @brief Edges merged by (from, to, kind), first occurrence kept
     */
    std::vector<Relationship> distinctEdges() const;

    /**
     * @brief Files ordered by number of incoming edges, most referenced first
     * @param limit Maximum number of entries
     */
    std::vector<std::pair<std::string, size_t>> mostReferenced(size_t limit) const;

    GraphStats stats() const;

    /**
     * @brief Resolve relationships against a path → position map
     *
     * Relationships with an endpoint missing from the map are skipped.
     * Returned connections point into this graph and must not outlive it.
     */
    std::vector<Connection> connections(const std::unordered_map<std::string, Vector3>& positions) const;

private:
    std::vector<Relationship> m_relationships;
};

} // namespace RepoLens

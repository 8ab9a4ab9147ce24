// =================================================================
// src/RepoLens/Relationship.cpp
// =================================================================
// Implementation for relationship kinds and the relationship graph.

#include "RepoLens/Relationship.hpp"
#include <algorithm>
#include <iterator>
#include <set>
#include <tuple>
#include <unordered_set>

namespace RepoLens {

std::string relationshipKindName(RelationshipKind kind) {
    switch (kind) {
        case RelationshipKind::Import: return "import";
        case RelationshipKind::Export: return "export";
        case RelationshipKind::FunctionCall: return "function-call";
        case RelationshipKind::VariableRef: return "variable-ref";
    }
    return "import";
}

std::optional<RelationshipKind> relationshipKindFromName(const std::string& name) {
    if (name == "import") return RelationshipKind::Import;
    if (name == "export") return RelationshipKind::Export;
    if (name == "function-call") return RelationshipKind::FunctionCall;
    if (name == "variable-ref") return RelationshipKind::VariableRef;
    return std::nullopt;
}

uint32_t relationshipKindColor(RelationshipKind kind) {
    switch (kind) {
        case RelationshipKind::Import: return 0x00ff00;       // Green
        case RelationshipKind::Export: return 0x0000ff;       // Blue
        case RelationshipKind::FunctionCall: return 0xff9900; // Orange
        case RelationshipKind::VariableRef: return 0xff00ff;  // Magenta
    }
    return 0xffffff;
}

void RelationshipGraph::add(Relationship relationship) {
    m_relationships.push_back(std::move(relationship));
}

void RelationshipGraph::append(std::vector<Relationship> relationships) {
    m_relationships.reserve(m_relationships.size() + relationships.size());
    for (auto& relationship : relationships) {
        m_relationships.push_back(std::move(relationship));
    }
}

std::vector<Relationship> RelationshipGraph::outgoing(const std::string& path) const {
    std::vector<Relationship> result;
    std::copy_if(m_relationships.begin(), m_relationships.end(), std::back_inserter(result),
                 [&path](const Relationship& r) { return r.from_file == path; });
    return result;
}

std::vector<Relationship> RelationshipGraph::incoming(const std::string& path) const {
    std::vector<Relationship> result;
    std::copy_if(m_relationships.begin(), m_relationships.end(), std::back_inserter(result),
                 [&path](const Relationship& r) { return r.to_file == path; });
    return result;
}

std::vector<Relationship> RelationshipGraph::ofKind(RelationshipKind kind) const {
    std::vector<Relationship> result;
    std::copy_if(m_relationships.begin(), m_relationships.end(), std::back_inserter(result),
                 [kind](const Relationship& r) { return r.kind == kind; });
    return result;
}

std::vector<Relationship> RelationshipGraph::distinctEdges() const {
    std::set<std::tuple<std::string, std::string, RelationshipKind>> seen;
    std::vector<Relationship> result;
    for (const auto& relationship : m_relationships) {
        if (seen.emplace(relationship.from_file, relationship.to_file, relationship.kind).second) {
            result.push_back(relationship);
        }
    }
    return result;
}

std::vector<std::pair<std::string, size_t>> RelationshipGraph::mostReferenced(size_t limit) const {
    std::vector<std::pair<std::string, size_t>> counts;
    std::unordered_map<std::string, size_t> positions;

    // Counts keep first-seen order so ties stay deterministic after the stable sort
    for (const auto& relationship : m_relationships) {
        auto it = positions.find(relationship.to_file);
        if (it == positions.end()) {
            positions.emplace(relationship.to_file, counts.size());
            counts.emplace_back(relationship.to_file, 1);
        } else {
            counts[it->second].second++;
        }
    }

    std::stable_sort(counts.begin(), counts.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    if (counts.size() > limit) {
        counts.resize(limit);
    }
    return counts;
}

GraphStats RelationshipGraph::stats() const {
    GraphStats stats;
    stats.total = m_relationships.size();

    std::unordered_set<std::string> sources;
    std::unordered_set<std::string> targets;
    for (const auto& relationship : m_relationships) {
        stats.by_kind[relationship.kind]++;
        sources.insert(relationship.from_file);
        targets.insert(relationship.to_file);
    }

    stats.source_files = sources.size();
    stats.target_files = targets.size();
    return stats;
}

std::vector<Connection> RelationshipGraph::connections(
    const std::unordered_map<std::string, Vector3>& positions) const {
    std::vector<Connection> result;

    for (const auto& relationship : m_relationships) {
        auto from = positions.find(relationship.from_file);
        auto to = positions.find(relationship.to_file);
        if (from == positions.end() || to == positions.end()) {
            continue;
        }

        Connection connection;
        connection.from = from->second;
        connection.to = to->second;
        connection.control.x = (from->second.x + to->second.x) / 2.0;
        connection.control.y = std::max(from->second.y, to->second.y) + 2.0;
        connection.control.z = (from->second.z + to->second.z) / 2.0;
        connection.kind = relationship.kind;
        connection.color = relationshipKindColor(relationship.kind);
        connection.relationship = &relationship;
        result.push_back(connection);
    }

    return result;
}

} // namespace RepoLens

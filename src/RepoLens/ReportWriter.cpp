// =================================================================
// src/RepoLens/ReportWriter.cpp
// =================================================================
// Implementation for the relationship report writers.

#include "RepoLens/ReportWriter.hpp"
#include "RepoLens/Logger.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>
#include <stdexcept>

namespace RepoLens {

namespace {

const RelationshipKind kAllKinds[] = {
    RelationshipKind::Import,
    RelationshipKind::Export,
    RelationshipKind::FunctionCall,
    RelationshipKind::VariableRef
};

std::string dotQuote(const std::string& text) {
    std::string quoted = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string hexColor(uint32_t rgb) {
    std::ostringstream oss;
    oss << '#' << std::hex << std::setw(6) << std::setfill('0') << (rgb & 0xffffff);
    return oss.str();
}

} // namespace

ReportFormat reportFormatFromName(const std::string& name) {
    if (name == "json") return ReportFormat::Json;
    if (name == "text") return ReportFormat::Text;
    if (name == "dot") return ReportFormat::Dot;
    throw std::invalid_argument("Unknown report format: " + name);
}

ReportWriter::ReportWriter(const FileIndex& index, const RelationshipGraph& graph)
    : m_index(index)
    , m_graph(graph)
{
}

void ReportWriter::setKindFilter(std::vector<RelationshipKind> kinds) {
    m_kinds = std::move(kinds);
}

bool ReportWriter::isSelected(RelationshipKind kind) const {
    return m_kinds.empty() || std::find(m_kinds.begin(), m_kinds.end(), kind) != m_kinds.end();
}

std::vector<Relationship> ReportWriter::selectedRelationships() const {
    std::vector<Relationship> selected;
    for (const auto& relationship : m_graph.relationships()) {
        if (isSelected(relationship.kind)) {
            selected.push_back(relationship);
        }
    }
    return selected;
}

nlohmann::json ReportWriter::toJson() const {
    nlohmann::json files = nlohmann::json::array();
    for (const auto& file : m_index.files()) {
        files.push_back({
            {"path", file.path},
            {"language", languageName(file.language)}
        });
    }

    nlohmann::json relationships = nlohmann::json::array();
    nlohmann::json by_type = nlohmann::json::object();
    for (RelationshipKind kind : kAllKinds) {
        if (isSelected(kind)) {
            by_type[relationshipKindName(kind)] = 0;
        }
    }

    for (const auto& relationship : selectedRelationships()) {
        nlohmann::json entry = {
            {"from", relationship.from_file},
            {"to", relationship.to_file},
            {"type", relationshipKindName(relationship.kind)},
            {"line", nullptr},
            {"identifier", nullptr}
        };
        if (relationship.line_number) {
            entry["line"] = *relationship.line_number;
        }
        if (relationship.identifier) {
            entry["identifier"] = *relationship.identifier;
        }
        relationships.push_back(std::move(entry));

        auto& count = by_type[relationshipKindName(relationship.kind)];
        count = count.get<size_t>() + 1;
    }

    nlohmann::json report;
    report["files"] = std::move(files);
    report["stats"] = {
        {"total", relationships.size()},
        {"byType", std::move(by_type)}
    };
    report["relationships"] = std::move(relationships);
    return report;
}

std::string ReportWriter::toText() const {
    std::vector<Relationship> selected = selectedRelationships();
    std::ostringstream oss;

    for (const auto& relationship : selected) {
        oss << relationship.from_file;
        if (relationship.line_number) {
            oss << ':' << *relationship.line_number;
        }
        oss << " -> " << relationship.to_file
            << " [" << relationshipKindName(relationship.kind) << ']';
        if (relationship.identifier) {
            oss << ' ' << *relationship.identifier;
        }
        oss << '\n';
    }

    std::set<std::string> sources;
    for (const auto& relationship : selected) {
        sources.insert(relationship.from_file);
    }

    oss << '\n' << selected.size() << " relationships from " << sources.size()
        << " of " << m_index.size() << " files\n";
    return oss.str();
}

std::string ReportWriter::toDot() const {
    std::ostringstream oss;
    oss << "digraph repolens {\n";
    oss << "  rankdir=LR;\n";
    oss << "  node [shape=box, fontname=\"Helvetica\"];\n";

    std::vector<Relationship> selected = selectedRelationships();
    std::set<std::string> nodes;
    for (const auto& relationship : selected) {
        nodes.insert(relationship.from_file);
        nodes.insert(relationship.to_file);
    }
    for (const auto& node : nodes) {
        oss << "  " << dotQuote(node) << ";\n";
    }

    for (const auto& relationship : selected) {
        oss << "  " << dotQuote(relationship.from_file) << " -> " << dotQuote(relationship.to_file)
            << " [label=" << dotQuote(relationshipKindName(relationship.kind))
            << ", color=" << dotQuote(hexColor(relationshipKindColor(relationship.kind))) << "];\n";
    }

    oss << "}\n";
    return oss.str();
}

void ReportWriter::write(std::ostream& out, ReportFormat format) const {
    switch (format) {
        case ReportFormat::Json:
            out << toJson().dump(2) << '\n';
            break;
        case ReportFormat::Text:
            out << toText();
            break;
        case ReportFormat::Dot:
            out << toDot();
            break;
    }
}

bool ReportWriter::writeToFile(const std::string& path, ReportFormat format) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("ReportWriter", "Cannot open " + path + " for writing");
        return false;
    }
    write(file, format);
    if (!file) {
        LOG_ERROR("ReportWriter", "Failed while writing " + path);
        return false;
    }
    LOG_INFO("ReportWriter", "Report written to " + path);
    return true;
}

} // namespace RepoLens

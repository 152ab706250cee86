#include "CausalGraph.h"
#include "SkewcycleExceptions.h"
#include <algorithm>

std::string Edge::toString() const {
    switch (type) {
        case EdgeType::Directed: return node1.name + " --> " + node2.name;
        case EdgeType::Bidirected: return node1.name + " <-> " + node2.name;
        case EdgeType::TwoCycle: return node1.name + " <=> " + node2.name;
        case EdgeType::Undirected: break;
    }
    return node1.name + " --- " + node2.name;
}

CausalGraph::CausalGraph(const std::vector<Variable>& initialNodes) {
    for (const auto& v : initialNodes) addNode(v);
}

CausalGraph CausalGraph::complete(const std::vector<Variable>& nodes) {
    CausalGraph g(nodes);
    for (size_t i = 0; i < nodes.size(); ++i) {
        for (size_t j = i + 1; j < nodes.size(); ++j) {
            g.setUndirected(nodes[i], nodes[j]);
        }
    }
    return g;
}

void CausalGraph::addNode(const Variable& v) {
    auto it = byColumn.find(v.column);
    if (it != byColumn.end()) {
        if (it->second.name != v.name) {
            throw Skewcycle::InvalidGraphException("Column " + std::to_string(v.column) + " already bound to '" +
                                                   it->second.name + "'");
        }
        return;
    }
    nodes.push_back(v);
    byColumn.emplace(v.column, v);
    adjacency[v.column];
}

bool CausalGraph::containsNode(const Variable& v) const {
    return byColumn.count(v.column) > 0;
}

const Variable* CausalGraph::findNode(const std::string& name) const {
    for (const auto& v : nodes) {
        if (v.name == name) return &v;
    }
    return nullptr;
}

void CausalGraph::put(const Variable& a, const Variable& b, EdgeRecord record) {
    if (!containsNode(a) || !containsNode(b)) {
        throw Skewcycle::InvalidGraphException("Edge " + a.name + " - " + b.name + " references a node outside the graph");
    }
    if (a == b) {
        throw Skewcycle::InvalidGraphException("Self loop on " + a.name);
    }
    edges[keyFor(a.column, b.column)] = record;
    adjacency[a.column].insert(b.column);
    adjacency[b.column].insert(a.column);
}

void CausalGraph::setUndirected(const Variable& a, const Variable& b) {
    put(a, b, {EdgeType::Undirected, std::min(a.column, b.column), std::max(a.column, b.column)});
}

void CausalGraph::setDirected(const Variable& tail, const Variable& head) {
    put(tail, head, {EdgeType::Directed, tail.column, head.column});
}

void CausalGraph::setBidirected(const Variable& a, const Variable& b) {
    put(a, b, {EdgeType::Bidirected, std::min(a.column, b.column), std::max(a.column, b.column)});
}

void CausalGraph::setTwoCycle(const Variable& a, const Variable& b) {
    put(a, b, {EdgeType::TwoCycle, std::min(a.column, b.column), std::max(a.column, b.column)});
}

bool CausalGraph::removeEdge(const Variable& a, const Variable& b) {
    if (edges.erase(keyFor(a.column, b.column)) == 0) return false;
    adjacency[a.column].erase(b.column);
    adjacency[b.column].erase(a.column);
    return true;
}

const CausalGraph::EdgeRecord* CausalGraph::find(const Variable& a, const Variable& b) const {
    auto it = edges.find(keyFor(a.column, b.column));
    return it == edges.end() ? nullptr : &it->second;
}

Edge CausalGraph::toEdge(const EdgeRecord& r) const {
    return Edge{byColumn.at(r.tail), byColumn.at(r.head), r.type};
}

bool CausalGraph::isAdjacent(const Variable& a, const Variable& b) const {
    return find(a, b) != nullptr;
}

std::optional<Edge> CausalGraph::getEdge(const Variable& a, const Variable& b) const {
    const EdgeRecord* r = find(a, b);
    if (!r) return std::nullopt;
    return toEdge(*r);
}

bool CausalGraph::isDirected(const Variable& tail, const Variable& head) const {
    const EdgeRecord* r = find(tail, head);
    return r && r->type == EdgeType::Directed && r->tail == tail.column && r->head == head.column;
}

bool CausalGraph::isUndirected(const Variable& a, const Variable& b) const {
    const EdgeRecord* r = find(a, b);
    return r && r->type == EdgeType::Undirected;
}

bool CausalGraph::isBidirected(const Variable& a, const Variable& b) const {
    const EdgeRecord* r = find(a, b);
    return r && r->type == EdgeType::Bidirected;
}

bool CausalGraph::isTwoCycle(const Variable& a, const Variable& b) const {
    const EdgeRecord* r = find(a, b);
    return r && r->type == EdgeType::TwoCycle;
}

size_t CausalGraph::getEdgeMultiplicity(const Variable& a, const Variable& b) const {
    const EdgeRecord* r = find(a, b);
    if (!r) return 0;
    return r->type == EdgeType::TwoCycle ? 2 : 1;
}

std::vector<Variable> CausalGraph::getAdjacentNodes(const Variable& v) const {
    std::vector<Variable> out;
    auto it = adjacency.find(v.column);
    if (it == adjacency.end()) return out;
    out.reserve(it->second.size());
    for (size_t c : it->second) out.push_back(byColumn.at(c));
    return out;
}

std::vector<Variable> CausalGraph::getParents(const Variable& v) const {
    std::vector<Variable> out;
    auto it = adjacency.find(v.column);
    if (it == adjacency.end()) return out;
    for (size_t c : it->second) {
        const EdgeRecord& r = edges.at(keyFor(v.column, c));
        if (r.type == EdgeType::TwoCycle || (r.type == EdgeType::Directed && r.head == v.column)) {
            out.push_back(byColumn.at(c));
        }
    }
    return out;
}

std::vector<Edge> CausalGraph::getEdges() const {
    std::vector<Edge> out;
    out.reserve(edges.size());
    for (const auto& [key, record] : edges) out.push_back(toEdge(record));
    return out;
}

void CausalGraph::makeUndirected() {
    for (auto& [key, record] : edges) {
        record = {EdgeType::Undirected, key.first, key.second};
    }
}

void CausalGraph::replaceNodes(const std::vector<Variable>& variables) {
    std::map<size_t, size_t> remap;
    CausalGraph rebound;
    for (const auto& node : nodes) {
        const Variable* match = nullptr;
        for (const auto& v : variables) {
            if (v.name == node.name) {
                match = &v;
                break;
            }
        }
        if (!match) {
            throw Skewcycle::InvalidGraphException("Graph node '" + node.name + "' is not a variable of the data set");
        }
        remap[node.column] = match->column;
        rebound.addNode(*match);
    }

    for (const auto& [key, record] : edges) {
        const Variable& tail = rebound.byColumn.at(remap.at(record.tail));
        const Variable& head = rebound.byColumn.at(remap.at(record.head));
        switch (record.type) {
            case EdgeType::Undirected: rebound.setUndirected(tail, head); break;
            case EdgeType::Directed: rebound.setDirected(tail, head); break;
            case EdgeType::Bidirected: rebound.setBidirected(tail, head); break;
            case EdgeType::TwoCycle: rebound.setTwoCycle(tail, head); break;
        }
    }
    *this = std::move(rebound);
}

#pragma once
#include "DataSet.h"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

enum class EdgeType { Undirected, Directed, Bidirected, TwoCycle };

// One classified adjacency. For Directed edges node1 is the tail and node2 the head;
// otherwise node1 is the endpoint with the lower column.
struct Edge {
    Variable node1;
    Variable node2;
    EdgeType type = EdgeType::Undirected;

    std::string toString() const;
};

/**
 * Mutable graph with at most one classified relation per unordered pair.
 * Setting a relation for a pair replaces whatever the pair held before.
 * A TwoCycle is the mutual pair X->Y plus Y->X; it has multiplicity 2 and each
 * endpoint is a parent of the other.
 */
class CausalGraph {
public:
    CausalGraph() = default;
    explicit CausalGraph(const std::vector<Variable>& nodes);

    /**
     * @brief Complete undirected graph over the given nodes.
     */
    static CausalGraph complete(const std::vector<Variable>& nodes);

    void addNode(const Variable& v);
    bool containsNode(const Variable& v) const;
    const Variable* findNode(const std::string& name) const;
    const std::vector<Variable>& getNodes() const { return nodes; }

    /**
     * @throws Skewcycle::InvalidGraphException if an endpoint is not a node or a == b.
     */
    void setUndirected(const Variable& a, const Variable& b);
    void setDirected(const Variable& tail, const Variable& head);
    void setBidirected(const Variable& a, const Variable& b);
    void setTwoCycle(const Variable& a, const Variable& b);
    bool removeEdge(const Variable& a, const Variable& b);

    bool isAdjacent(const Variable& a, const Variable& b) const;
    std::optional<Edge> getEdge(const Variable& a, const Variable& b) const;
    bool isDirected(const Variable& tail, const Variable& head) const;
    bool isUndirected(const Variable& a, const Variable& b) const;
    bool isBidirected(const Variable& a, const Variable& b) const;
    bool isTwoCycle(const Variable& a, const Variable& b) const;

    // 0 when absent, 2 for a TwoCycle, 1 otherwise.
    size_t getEdgeMultiplicity(const Variable& a, const Variable& b) const;

    std::vector<Variable> getAdjacentNodes(const Variable& v) const;
    std::vector<Variable> getParents(const Variable& v) const;

    // Edges ordered by (lower column, higher column).
    std::vector<Edge> getEdges() const;
    size_t getNumEdges() const { return edges.size(); }

    // Every existing adjacency becomes Undirected.
    void makeUndirected();

    /**
     * @brief Re-binds nodes by name to the given variables, keeping every adjacency and its type.
     * @throws Skewcycle::InvalidGraphException if a node name has no matching variable.
     */
    void replaceNodes(const std::vector<Variable>& variables);

private:
    struct EdgeRecord {
        EdgeType type;
        size_t tail;
        size_t head;
    };
    using Key = std::pair<size_t, size_t>;

    static Key keyFor(size_t a, size_t b) { return a < b ? Key{a, b} : Key{b, a}; }
    void put(const Variable& a, const Variable& b, EdgeRecord record);
    const EdgeRecord* find(const Variable& a, const Variable& b) const;
    Edge toEdge(const EdgeRecord& r) const;

    std::vector<Variable> nodes;
    std::map<size_t, Variable> byColumn;
    std::map<Key, EdgeRecord> edges;
    std::map<size_t, std::set<size_t>> adjacency;
};

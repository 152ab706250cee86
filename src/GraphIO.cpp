#include "GraphIO.h"
#include "CommonUtils.h"
#include "SkewcycleExceptions.h"
#include <fstream>
#include <sstream>

namespace {
const char* kNodesHeader = "Graph Nodes:";
const char* kEdgesHeader = "Graph Edges:";

std::vector<std::string> splitNodes(const std::string& line) {
    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ';')) {
        token = CommonUtils::trim(token);
        if (!token.empty()) out.push_back(token);
    }
    return out;
}

const Variable& requireNode(const CausalGraph& graph, const std::string& name, size_t lineNo) {
    const Variable* v = graph.findNode(name);
    if (!v) {
        throw Skewcycle::InvalidGraphException("Unknown node '" + name + "' on line " + std::to_string(lineNo));
    }
    return *v;
}
}

namespace GraphIO {
void write(const CausalGraph& graph, std::ostream& os) {
    std::vector<std::string> names;
    for (const auto& v : graph.getNodes()) names.push_back(v.name);

    os << kNodesHeader << "\n" << CommonUtils::join(names, ";") << "\n\n" << kEdgesHeader << "\n";
    size_t index = 1;
    for (const auto& e : graph.getEdges()) {
        if (e.type == EdgeType::TwoCycle) {
            os << index++ << ". " << e.node1.name << " --> " << e.node2.name << "\n";
            os << index++ << ". " << e.node2.name << " --> " << e.node1.name << "\n";
        } else {
            os << index++ << ". " << e.toString() << "\n";
        }
    }
}

std::string toString(const CausalGraph& graph) {
    std::ostringstream os;
    write(graph, os);
    return os.str();
}

void writeFile(const CausalGraph& graph, const std::string& path) {
    std::ofstream out(path);
    if (!out.is_open()) throw Skewcycle::IOException("Could not open " + path + " for writing");
    write(graph, out);
    if (!out) throw Skewcycle::IOException("Failed writing graph to " + path);
}

CausalGraph read(std::istream& is) {
    enum class Section { NONE, NODES, EDGES };
    Section section = Section::NONE;
    CausalGraph graph;
    bool nodesSeen = false;

    std::string raw;
    size_t lineNo = 0;
    while (std::getline(is, raw)) {
        ++lineNo;
        const std::string line = CommonUtils::trim(raw);
        if (line.empty()) continue;
        if (line == kNodesHeader) {
            section = Section::NODES;
            continue;
        }
        if (line == kEdgesHeader) {
            if (!nodesSeen) throw Skewcycle::InvalidGraphException("Edges listed before nodes on line " + std::to_string(lineNo));
            section = Section::EDGES;
            continue;
        }

        if (section == Section::NODES) {
            for (const auto& name : splitNodes(line)) {
                if (graph.findNode(name)) {
                    throw Skewcycle::InvalidGraphException("Duplicate node '" + name + "' on line " + std::to_string(lineNo));
                }
                graph.addNode(Variable{name, graph.getNodes().size()});
            }
            nodesSeen = true;
            continue;
        }
        if (section != Section::EDGES) {
            throw Skewcycle::InvalidGraphException("Unexpected content on line " + std::to_string(lineNo));
        }

        // "<index>. A <mark> B"; the index is optional.
        std::vector<std::string> tokens = CommonUtils::splitWhitespace(line);
        if (tokens.size() == 4 && tokens[0].back() == '.') tokens.erase(tokens.begin());
        if (tokens.size() != 3) {
            throw Skewcycle::InvalidGraphException("Malformed edge on line " + std::to_string(lineNo));
        }
        const Variable& a = requireNode(graph, tokens[0], lineNo);
        const Variable& b = requireNode(graph, tokens[2], lineNo);
        const std::string& mark = tokens[1];

        if (mark == "---") {
            graph.setUndirected(a, b);
        } else if (mark == "<->") {
            graph.setBidirected(a, b);
        } else if (mark == "-->" || mark == "<--") {
            const Variable& tail = mark == "-->" ? a : b;
            const Variable& head = mark == "-->" ? b : a;
            if (graph.isDirected(head, tail)) {
                graph.setTwoCycle(tail, head);
            } else {
                graph.setDirected(tail, head);
            }
        } else {
            throw Skewcycle::InvalidGraphException("Unknown edge mark '" + mark + "' on line " + std::to_string(lineNo));
        }
    }

    if (!nodesSeen) throw Skewcycle::InvalidGraphException("Missing '" + std::string(kNodesHeader) + "' section");
    return graph;
}

CausalGraph readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw Skewcycle::IOException("Could not open file " + path);
    return read(in);
}
}

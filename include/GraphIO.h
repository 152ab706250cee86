#pragma once
#include "CausalGraph.h"
#include <istream>
#include <ostream>
#include <string>

// Plain-text graph format:
//
//   Graph Nodes:
//   X;Y;Z
//
//   Graph Edges:
//   1. X --> Y
//   2. Y --- Z
//   3. X <-> Z
//
// A TwoCycle is written as two directed lines, one per direction.
namespace GraphIO {
void write(const CausalGraph& graph, std::ostream& os);
std::string toString(const CausalGraph& graph);

/**
 * @throws Skewcycle::IOException if the file cannot be written.
 */
void writeFile(const CausalGraph& graph, const std::string& path);

/**
 * @brief Parses the text format. Nodes get columns in listed order.
 * Edge marks accepted: "-->", "<--", "---", "<->". Opposite directed lines merge into a TwoCycle.
 * @throws Skewcycle::InvalidGraphException on malformed content or unknown node names.
 */
CausalGraph read(std::istream& is);

/**
 * @throws Skewcycle::IOException if the file cannot be opened.
 */
CausalGraph readFile(const std::string& path);
}

#pragma once
#include "DataSet.h"
#include <istream>
#include <set>
#include <string>
#include <utility>
#include <vector>

/**
 * Background knowledge keyed by variable name: forbidden and required directed
 * edges plus an ordered list of temporal tiers (tier 0 first).
 * A default-constructed Knowledge forbids and requires nothing and has a single tier.
 */
class Knowledge {
public:
    void setForbidden(const std::string& from, const std::string& to);
    void setRequired(const std::string& from, const std::string& to);

    /**
     * @brief Places a variable in a 0-based tier, growing the tier list as needed.
     * A variable already placed in another tier is moved.
     */
    void addToTier(size_t tier, const std::string& name);

    bool isForbidden(const std::string& from, const std::string& to) const;
    bool isRequired(const std::string& from, const std::string& to) const;
    bool isInTier(size_t tier, const std::string& name) const;
    size_t numTiers() const { return tiers.empty() ? 1 : tiers.size(); }
    bool isEmpty() const { return forbidden.empty() && required.empty() && tiers.empty(); }

    /**
     * @brief Loads the plain-text format:
     *   addtemporal     lines "<tier> name..." with 1-based tiers
     *   forbiddirect    lines "from to"
     *   requiredirect   lines "from to"
     * Blank lines and lines starting with '#' are ignored.
     * @throws Skewcycle::IOException if the file cannot be opened.
     * @throws Skewcycle::ConfigurationException with the line number for unknown sections or malformed lines.
     */
    static Knowledge fromFile(const std::string& path);
    static Knowledge fromStream(std::istream& is);

private:
    std::set<std::pair<std::string, std::string>> forbidden;
    std::set<std::pair<std::string, std::string>> required;
    std::vector<std::set<std::string>> tiers;
};

// Query view of Knowledge over Variables, shared by the search stages.
class KnowledgeFilter {
public:
    explicit KnowledgeFilter(const Knowledge& knowledge) : knowledge_(knowledge) {}

    // True if b -> a is forbidden or a -> b is required.
    bool orients(const Variable& a, const Variable& b) const;

    // True if both directions between a and b are forbidden.
    bool forbidden(const Variable& a, const Variable& b) const;

    // Protected conditioning variables: members of tier 1 when more than one tier exists.
    bool isProtected(const Variable& v) const;
    void removeProtected(std::vector<Variable>& vars) const;

private:
    const Knowledge& knowledge_;
};

#include "Knowledge.h"
#include "CommonUtils.h"
#include "SkewcycleExceptions.h"
#include <algorithm>
#include <fstream>

namespace {
enum class Section { NONE, TEMPORAL, FORBIDDEN, REQUIRED };

size_t parseTierIndex(const std::string& token, size_t lineNo) {
    size_t value = 0;
    size_t used = 0;
    try {
        value = std::stoul(token, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != token.size() || value == 0) {
        throw Skewcycle::ConfigurationException("Invalid tier '" + token + "' on knowledge line " + std::to_string(lineNo));
    }
    return value - 1;
}
}

void Knowledge::setForbidden(const std::string& from, const std::string& to) {
    forbidden.emplace(from, to);
}

void Knowledge::setRequired(const std::string& from, const std::string& to) {
    required.emplace(from, to);
}

void Knowledge::addToTier(size_t tier, const std::string& name) {
    for (auto& t : tiers) t.erase(name);
    if (tiers.size() <= tier) tiers.resize(tier + 1);
    tiers[tier].insert(name);
}

bool Knowledge::isForbidden(const std::string& from, const std::string& to) const {
    return forbidden.count({from, to}) > 0;
}

bool Knowledge::isRequired(const std::string& from, const std::string& to) const {
    return required.count({from, to}) > 0;
}

bool Knowledge::isInTier(size_t tier, const std::string& name) const {
    return tier < tiers.size() && tiers[tier].count(name) > 0;
}

Knowledge Knowledge::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw Skewcycle::IOException("Could not open knowledge file " + path);
    return fromStream(in);
}

Knowledge Knowledge::fromStream(std::istream& is) {
    Knowledge knowledge;
    Section section = Section::NONE;
    std::string raw;
    size_t lineNo = 0;

    while (std::getline(is, raw)) {
        ++lineNo;
        const std::string line = CommonUtils::trim(raw);
        if (line.empty() || line[0] == '#') continue;

        const std::string lower = CommonUtils::toLower(line);
        if (lower == "addtemporal") { section = Section::TEMPORAL; continue; }
        if (lower == "forbiddirect") { section = Section::FORBIDDEN; continue; }
        if (lower == "requiredirect") { section = Section::REQUIRED; continue; }

        const auto tokens = CommonUtils::splitWhitespace(line);
        switch (section) {
            case Section::NONE:
                throw Skewcycle::ConfigurationException("Unknown knowledge section '" + line + "' on line " + std::to_string(lineNo));
            case Section::TEMPORAL: {
                if (tokens.size() < 2) {
                    throw Skewcycle::ConfigurationException("Tier line needs an index and at least one variable on line " + std::to_string(lineNo));
                }
                const size_t tier = parseTierIndex(tokens[0], lineNo);
                for (size_t i = 1; i < tokens.size(); ++i) knowledge.addToTier(tier, tokens[i]);
                break;
            }
            case Section::FORBIDDEN:
            case Section::REQUIRED:
                if (tokens.size() != 2) {
                    throw Skewcycle::ConfigurationException("Expected 'from to' on knowledge line " + std::to_string(lineNo));
                }
                if (section == Section::FORBIDDEN) {
                    knowledge.setForbidden(tokens[0], tokens[1]);
                } else {
                    knowledge.setRequired(tokens[0], tokens[1]);
                }
                break;
        }
    }
    return knowledge;
}

bool KnowledgeFilter::orients(const Variable& a, const Variable& b) const {
    return knowledge_.isForbidden(b.name, a.name) || knowledge_.isRequired(a.name, b.name);
}

bool KnowledgeFilter::forbidden(const Variable& a, const Variable& b) const {
    return knowledge_.isForbidden(a.name, b.name) && knowledge_.isForbidden(b.name, a.name);
}

bool KnowledgeFilter::isProtected(const Variable& v) const {
    return knowledge_.numTiers() > 1 && knowledge_.isInTier(1, v.name);
}

void KnowledgeFilter::removeProtected(std::vector<Variable>& vars) const {
    vars.erase(std::remove_if(vars.begin(), vars.end(), [this](const Variable& v) { return isProtected(v); }),
               vars.end());
}

#include <gtest/gtest.h>
#include "Knowledge.h"
#include "SkewcycleExceptions.h"

#include <sstream>

TEST(KnowledgeTest, ParsesAllSections) {
    std::istringstream in(
        "# background knowledge\n"
        "addtemporal\n"
        "1 A B\n"
        "2 C\n"
        "\n"
        "ForbidDirect\n"
        "C A\n"
        "requiredirect\n"
        "B C\n");
    const Knowledge k = Knowledge::fromStream(in);
    EXPECT_EQ(k.numTiers(), 2u);
    EXPECT_TRUE(k.isInTier(0, "A"));
    EXPECT_TRUE(k.isInTier(0, "B"));
    EXPECT_TRUE(k.isInTier(1, "C"));
    EXPECT_TRUE(k.isForbidden("C", "A"));
    EXPECT_FALSE(k.isForbidden("A", "C"));
    EXPECT_TRUE(k.isRequired("B", "C"));
    EXPECT_FALSE(k.isEmpty());
}

TEST(KnowledgeTest, MalformedInputReportsLine) {
    std::istringstream noSection("A B\n");
    EXPECT_THROW(Knowledge::fromStream(noSection), Skewcycle::ConfigurationException);

    std::istringstream tierZero("addtemporal\n0 A\n");
    try {
        Knowledge::fromStream(tierZero);
        FAIL() << "expected ConfigurationException";
    } catch (const Skewcycle::ConfigurationException& e) {
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos);
    }

    std::istringstream badTier("addtemporal\nfirst A\n");
    EXPECT_THROW(Knowledge::fromStream(badTier), Skewcycle::ConfigurationException);

    std::istringstream badPair("forbiddirect\nA B C\n");
    EXPECT_THROW(Knowledge::fromStream(badPair), Skewcycle::ConfigurationException);

    EXPECT_THROW(Knowledge::fromFile(::testing::TempDir() + "missing_knowledge.txt"), Skewcycle::IOException);
}

TEST(KnowledgeTest, AddToTierMovesVariable) {
    Knowledge k;
    EXPECT_TRUE(k.isEmpty());
    EXPECT_EQ(k.numTiers(), 1u);
    k.addToTier(0, "A");
    k.addToTier(2, "A");
    EXPECT_FALSE(k.isInTier(0, "A"));
    EXPECT_TRUE(k.isInTier(2, "A"));
    EXPECT_EQ(k.numTiers(), 3u);
}

TEST(KnowledgeFilterTest, OrientationAndForbiddenPairs) {
    const Variable a{"A", 0}, b{"B", 1}, c{"C", 2};
    Knowledge k;
    k.setForbidden("B", "A");
    k.setRequired("C", "B");
    k.setForbidden("A", "C");
    k.setForbidden("C", "A");
    const KnowledgeFilter filter(k);

    EXPECT_TRUE(filter.orients(a, b));
    EXPECT_FALSE(filter.orients(b, a));
    EXPECT_TRUE(filter.orients(c, b));
    EXPECT_FALSE(filter.forbidden(a, b));
    EXPECT_TRUE(filter.forbidden(a, c));
    EXPECT_TRUE(filter.forbidden(c, a));
}

TEST(KnowledgeFilterTest, SecondTierIsProtectedOnlyWithSeveralTiers) {
    const Variable a{"A", 0}, b{"B", 1}, c{"C", 2};
    Knowledge single;
    single.addToTier(0, "A");
    EXPECT_FALSE(KnowledgeFilter(single).isProtected(a));

    Knowledge tiered;
    tiered.addToTier(0, "A");
    tiered.addToTier(1, "B");
    const KnowledgeFilter filter(tiered);
    EXPECT_FALSE(filter.isProtected(a));
    EXPECT_TRUE(filter.isProtected(b));

    std::vector<Variable> vars = {a, b, c};
    filter.removeProtected(vars);
    EXPECT_EQ(vars, (std::vector<Variable>{a, c}));
}

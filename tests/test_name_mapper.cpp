//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_name_mapper.cpp
// Purpose: GoogleTests for tool name derivation and the public-name map
//==========================================================================================================

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "pmtrelay/NameMapper.h"

using namespace pmtrelay;

namespace {
ToolDescriptor tool(const std::string& id, const std::string& description) {
    ToolDescriptor t;
    t.id = id;
    t.description = description;
    return t;
}
} // namespace

TEST(DeriveToolName, UsesTextBeforeSeparators) {
    EXPECT_EQ(DeriveToolName("Smart Math \xE2\x80\x94 does math"), "Smart-Math");
    EXPECT_EQ(DeriveToolName("Weather Lookup - current conditions"), "Weather-Lookup");
    EXPECT_EQ(DeriveToolName("Currency \xE2\x80\x93 convert"), "Currency");
    EXPECT_EQ(DeriveToolName("PDF Tools|merge and split"), "PDF-Tools");
}

TEST(DeriveToolName, SeparatorAtStartIsIgnored) {
    // "|" at position 0 does not count; the first sentence is used instead
    EXPECT_EQ(DeriveToolName("|Leading pipe. Rest"), "Leading-pipe");
}

TEST(DeriveToolName, FallsBackToFirstSentenceOrPrefix) {
    EXPECT_EQ(DeriveToolName("Translate text. Supports many languages"), "Translate-text");
    const std::string longText(120, 'a');
    EXPECT_EQ(DeriveToolName(longText), std::string(50, 'a'));
    EXPECT_EQ(DeriveToolName("short"), "short");
}

TEST(DeriveToolName, StripsInvalidCharactersAndTruncates) {
    EXPECT_EQ(DeriveToolName("  Hello,   World!  - x"), "Hello-World");
    EXPECT_EQ(DeriveToolName("caf\xC3\xA9 bar - x"), "caf-bar");
    const std::string words = "word word word word word word word word word word word word word word - x";
    const std::string name = DeriveToolName(words);
    EXPECT_LE(name.size(), kMaxToolNameLength);
    EXPECT_NE(name.back(), '-');
    EXPECT_EQ(DeriveToolName("!!! - x"), "");
}

TEST(NameMapper, EveryListedNameResolves) {
    NameMapper m;
    std::vector<ToolDescriptor> tools{
        tool("prod-1", "Smart Math \xE2\x80\x94 does math"),
        tool("prod-2", "Weather Lookup - current conditions"),
        tool("prod-3", "???"),
        tool("", "")};
    auto names = m.Refresh(tools);
    ASSERT_EQ(names.size(), tools.size());
    EXPECT_EQ(names[0], "Smart-Math");
    EXPECT_EQ(names[2], "prod-3");
    EXPECT_EQ(names[3], "tool");
    for (std::size_t i = 0; i < tools.size(); ++i) {
        auto id = m.Resolve(names[i]);
        ASSERT_TRUE(id.has_value()) << names[i];
        EXPECT_EQ(*id, tools[i].id);
    }
    EXPECT_FALSE(m.Resolve("unknown").has_value());
}

TEST(NameMapper, CollisionsGetNumericSuffixes) {
    NameMapper m;
    auto names = m.Refresh({tool("a", "Search - web"), tool("b", "Search - docs"), tool("c", "Search | code")});
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "Search");
    EXPECT_EQ(names[1], "Search-2");
    EXPECT_EQ(names[2], "Search-3");
    EXPECT_EQ(*m.Resolve("Search"), "a");
    EXPECT_EQ(*m.Resolve("Search-2"), "b");
    EXPECT_EQ(*m.Resolve("Search-3"), "c");
}

TEST(NameMapper, SuffixedNamesStayWithinLimit) {
    NameMapper m;
    const std::string desc = std::string(80, 'x') + " - first";
    auto names = m.Refresh({tool("a", desc), tool("b", desc)});
    EXPECT_EQ(names[0].size(), kMaxToolNameLength);
    EXPECT_EQ(names[1].size(), kMaxToolNameLength);
    EXPECT_EQ(names[1].substr(names[1].size() - 2), "-2");
}

TEST(NameMapper, LaterRefreshOverwritesAndKeepsOldEntries) {
    NameMapper m;
    m.Refresh({tool("old-id", "Search - web"), tool("x", "Extra - tool")});
    m.Refresh({tool("new-id", "Search - web")});
    EXPECT_EQ(*m.Resolve("Search"), "new-id");
    EXPECT_EQ(*m.Resolve("Extra"), "x");
    EXPECT_EQ(m.Size(), 2u);
}

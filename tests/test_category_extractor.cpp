//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_category_extractor.cpp
// Purpose: GoogleTests for category label parsing in prompt documentation
//==========================================================================================================

#include <gtest/gtest.h>

#include "scaffold/CategoryExtractor.h"

using namespace scaffold;

using Tags = std::vector<std::string>;

TEST(CategoryExtractor, LineLabels) {
    EXPECT_EQ(ExtractCategories("Generate a product prompt.\nCategories: math, calculation"),
              (Tags{"math", "calculation"}));
    EXPECT_EQ(ExtractCategories("   category:  Finance  "), (Tags{"finance"}));
}

TEST(CategoryExtractor, BracketLabelsAnywhere) {
    EXPECT_EQ(ExtractCategories("Summarize text [categories: NLP, Writing] for the user"),
              (Tags{"nlp", "writing"}));
    EXPECT_EQ(ExtractCategories("[Category: a] and [category: b]"), (Tags{"a", "b"}));
}

TEST(CategoryExtractor, MergesAndDeduplicatesInFirstSeenOrder) {
    const std::string doc =
        "Prompt doc.\n"
        "CATEGORIES: Math, Science, , math\n"
        "More text [category: science] [categories: art]\r\n"
        "Category: Art";
    EXPECT_EQ(ExtractCategories(doc), (Tags{"math", "science", "art"}));
}

TEST(CategoryExtractor, NoMatchYieldsEmpty) {
    EXPECT_TRUE(ExtractCategories("").empty());
    EXPECT_TRUE(ExtractCategories("Just a description.\nCategorize later.").empty());
    // Label must start the line
    EXPECT_TRUE(ExtractCategories("See Categories: hidden").empty());
}

TEST(CategoryExtractor, IdempotentOnNormalizedTags) {
    const Tags first = ExtractCategories("Categories: Alpha, beta ,GAMMA");
    std::string rebuilt = "Categories: ";
    for (std::size_t i = 0; i < first.size(); ++i) {
        if (i) rebuilt += ", ";
        rebuilt += first[i];
    }
    EXPECT_EQ(ExtractCategories(rebuilt), first);
}

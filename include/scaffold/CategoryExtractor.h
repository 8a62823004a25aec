//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CategoryExtractor.h
// Purpose: Category tags for prompts, parsed from handler documentation text
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

namespace scaffold {

//==========================================================================================================
// ExtractCategories
// Purpose: Collects category tags from documentation text.
//   Recognized forms (case-insensitive):
//     "Category: foo" / "Categories: foo, bar" as a whole line (leading whitespace allowed)
//     "[category: foo]" / "[categories: foo, bar]" anywhere in a line
//   Tags are trimmed, lowercased, and deduplicated in first-seen order; empty items are dropped.
// Args:
//   docText: Documentation text; may span multiple lines.
// Returns:
//   Ordered tag list; empty when nothing matched.
//==========================================================================================================
std::vector<std::string> ExtractCategories(const std::string& docText);

} // namespace scaffold

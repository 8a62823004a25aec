//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CategoryExtractor.cpp
// Purpose: Category label parsing for prompt documentation
//==========================================================================================================

#include "scaffold/CategoryExtractor.h"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace scaffold {

namespace {

const std::regex& linePattern() {
    static const std::regex re(R"(^\s*Categor(?:y|ies):\s*(.+)$)", std::regex::ECMAScript | std::regex::icase);
    return re;
}

const std::regex& bracketPattern() {
    static const std::regex re(R"(\[(?:categor(?:y|ies)):\s*([^\]]+)\])", std::regex::ECMAScript | std::regex::icase);
    return re;
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n\f\v");
    if (b == std::string::npos) return std::string();
    auto e = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(b, e - b + 1);
}

void splitInto(const std::string& list, std::vector<std::string>& out) {
    std::size_t start = 0;
    while (start <= list.size()) {
        std::size_t comma = list.find(',', start);
        if (comma == std::string::npos) comma = list.size();
        std::string item = trim(list.substr(start, comma - start));
        if (!item.empty()) {
            std::transform(item.begin(), item.end(), item.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            out.push_back(std::move(item));
        }
        start = comma + 1;
    }
}

} // namespace

std::vector<std::string> ExtractCategories(const std::string& docText) {
    std::vector<std::string> raw;
    if (docText.empty()) {
        return raw;
    }

    std::istringstream in(docText);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::smatch m;
        if (std::regex_search(line, m, linePattern())) {
            splitInto(m[1].str(), raw);
        }
        for (std::sregex_iterator it(line.begin(), line.end(), bracketPattern()), end; it != end; ++it) {
            splitInto((*it)[1].str(), raw);
        }
    }

    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (auto& c : raw) {
        if (seen.insert(c).second) {
            out.push_back(std::move(c));
        }
    }
    return out;
}

} // namespace scaffold

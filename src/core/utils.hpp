#pragma once

#include <string>
#include <vector>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Join with a separator: {"x","y"}, "," -> "x,y"
std::string join(const std::vector<std::string>& parts, const std::string& sep);

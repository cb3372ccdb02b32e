#pragma once

#include <initializer_list>
#include <string>
#include <vector>

namespace hwprov {

std::string trim(std::string s);
std::string to_lower(std::string s);
std::string to_upper(std::string s);
std::vector<std::string> split(const std::string& s, char sep);
std::vector<std::string> split_lines(const std::string& text);
std::string join(const std::vector<std::string>& parts, const std::string& sep);

bool contains_any(const std::string& haystack, std::initializer_list<const char*> needles);

// Lower-cased alphanumeric runs: "Advanced Micro Devices [AMD/ATI]" -> advanced, micro, devices, amd, ati.
std::vector<std::string> word_tokens(const std::string& s);

// True when one of the words appears as a whole token of s (case-insensitive).
bool has_any_word(const std::string& s, std::initializer_list<const char*> words);

} // namespace hwprov

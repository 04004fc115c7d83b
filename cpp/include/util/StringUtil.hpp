#pragma once

/*
 * Various string utilities
 */
#include <string>
#include <vector>

namespace util {

/*
 * Parses s as a base-10 int. The entire string must be consumed.
 *
 * Raises util::CleanException if the parse fails.
 */
int atoi_safe(const std::string& s);

/*
 * split(s) and split(s, t) behave just like s.split() and s.split(t), respectively, in python.
 */
std::vector<std::string> split(const std::string& s, const char* t = "");

// ASCII lower-casing.
std::string to_lower(std::string s);

}  // namespace util

#include "inline/util/StringUtil.inl"

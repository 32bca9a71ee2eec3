#pragma once

#include <cstddef>
#include <string>

std::string trim(const std::string& s);

// Trims and folds every run of whitespace into a single space.
std::string collapseWhitespace(const std::string& s);

// ASCII lower-casing; UTF-8 continuation bytes are left untouched.
std::string toLower(const std::string& s);

// Decodes the XML named entities and numeric character references.
std::string decodeEntities(const std::string& in);

// Appends the UTF-8 encoding of a Unicode code point.
void appendUtf8(std::string& out, unsigned int codePoint);

// Number of code points in a UTF-8 string.
size_t utf8Length(const std::string& s);

size_t countWords(const std::string& s);

bool startsWith(const std::string& s, const std::string& prefix);
bool endsWith(const std::string& s, const std::string& suffix);

bool containsLetter(const std::string& s);

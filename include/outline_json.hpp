#pragma once

#include "layout.hpp"

#include <string>

// {"title": ..., "outline": [{"level": "H1", "text": ..., "page": 1}, ...]}
// with a two-space indent; UTF-8 text is written as is.
std::string outlineToJson(const Outline& outline);

// Escapes quotes, backslashes and control characters for a JSON string body.
std::string jsonEscape(const std::string& text);

// Writes the JSON to `path`, creating missing parent directories.
// Throws std::runtime_error when the file cannot be written.
void writeOutlineJson(const Outline& outline, const std::string& path);

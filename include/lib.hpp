#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>

using str = std::string;
using strings = std::vector<std::string>;

// printf-style formatter that throws std::runtime_error prefixed with file:line.
// Arguments must be C types (pass std::string through .c_str()).
[[noreturn]] void error(const char* fmt, const char* file, int line, ...);
// A helper macro to automatically pass __FILE__ and __LINE__
#define THROW(msg, ...) error(msg, __FILE__, __LINE__, ##__VA_ARGS__)

// "a, b, c"
std::string join(const strings& items, const std::string& sep = ", ");

// Identifier quoting for names that end up inside generated SQL ("my""schema").
std::string quote_ident(const std::string& ident);

// Literal quoting ('it''s').
std::string quote_literal(const std::string& value);

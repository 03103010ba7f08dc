#include "lib.hpp"
#include <sstream>

// Two passes over the va_list: the first sizes the buffer, the second formats into it.
void error(const char* fmt, const char* file, int line, ...) {
    va_list args;
    va_start(args, line);

    va_list args_copy;
    va_copy(args_copy, args);
    int required_size = std::vsnprintf(nullptr, 0, fmt, args_copy);
    va_end(args_copy);

    if (required_size < 0) {
        va_end(args);
        throw std::runtime_error(std::string(file) + ":" + std::to_string(line) + ": " + fmt);
    }

    std::vector<char> buffer(required_size + 1);
    std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    va_end(args);

    std::stringstream ss;
    ss << file << ":" << line << ": " << buffer.data();
    throw std::runtime_error(ss.str());
}

std::string join(const strings& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

std::string quote_ident(const std::string& ident) {
    std::string out;
    out.reserve(ident.size() + 2);
    out += '"';
    for (char c : ident) out += (c == '"') ? std::string("\"\"") : std::string(1, c);
    out += '"';
    return out;
}

std::string quote_literal(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 4);
    out += '\'';
    for (char c : value) out += (c == '\'') ? std::string("''") : std::string(1, c);
    out += '\'';
    return out;
}

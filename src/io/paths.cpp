// src/io/paths.cpp
#include "paths.h"

#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace kermit {

namespace {

bool is_var_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

std::string expand_path(const std::string& path) {
    std::string in = path;

    if (!in.empty() && in[0] == '~' && (in.size() == 1 || in[1] == '/')) {
        const char* home = std::getenv("HOME");
        if (home) in = std::string(home) + in.substr(1);
    }

    std::string out;
    size_t i = 0;
    while (i < in.size()) {
        if (in[i] != '$' || i + 1 >= in.size()) {
            out += in[i++];
            continue;
        }

        size_t start = i + 1;
        size_t end;
        std::string name;
        if (in[start] == '{') {
            end = in.find('}', start);
            if (end == std::string::npos) {
                out += in.substr(i);
                break;
            }
            name = in.substr(start + 1, end - start - 1);
            end++;
        } else {
            end = start;
            while (end < in.size() && is_var_char(in[end])) end++;
            name = in.substr(start, end - start);
        }

        const char* value = name.empty() ? nullptr : std::getenv(name.c_str());
        if (value) {
            out += value;
        } else {
            out += in.substr(i, end - i);
        }
        i = end;
    }
    return out;
}

bool ensure_parent_directory(const std::string& path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) return true;
    std::error_code ec;
    if (std::filesystem::is_directory(parent, ec)) return true;
    return std::filesystem::create_directories(parent, ec);
}

} // namespace kermit

#pragma once

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string>
#include <unordered_map>
#include <vector>

namespace coop_ledger::apps {

using ArgMap = std::unordered_map<std::string, std::string>;

// `--key value`, `--key=value` and bare `--flag` (stored as "true").
// Tokens that do not start with "--" are positional and collected in order.
inline ArgMap ParseArgs(const std::vector<std::string>& tokens,
                        std::vector<std::string>* positional = nullptr) {
    ArgMap args;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        std::string token = tokens[i];
        if (token.rfind("--", 0) != 0) {
            if (positional != nullptr) {
                positional->push_back(token);
            }
            continue;
        }
        token = token.substr(2);
        const auto eq_pos = token.find('=');
        if (eq_pos != std::string::npos) {
            args[token.substr(0, eq_pos)] = token.substr(eq_pos + 1);
            continue;
        }
        if (i + 1 < tokens.size() && tokens[i + 1].rfind("--", 0) != 0) {
            args[token] = tokens[++i];
            continue;
        }
        args[token] = "true";
    }
    return args;
}

inline ArgMap ParseArgs(int argc, char** argv, std::vector<std::string>* positional = nullptr) {
    std::vector<std::string> tokens;
    for (int i = 1; i < argc; ++i) {
        tokens.emplace_back(argv[i]);
    }
    return ParseArgs(tokens, positional);
}

inline std::string GetArg(const ArgMap& args,
                          const std::string& key,
                          const std::string& fallback = "") {
    const auto it = args.find(key);
    if (it == args.end()) {
        return fallback;
    }
    return it->second;
}

inline bool HasArg(const ArgMap& args, const std::string& key) {
    return args.find(key) != args.end();
}

inline bool ParseDoubleText(const std::string& raw, double* out) {
    if (raw.empty() || out == nullptr) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(raw.c_str(), &end);
    if (errno != 0 || end == raw.c_str() || *end != '\0' || !std::isfinite(value)) {
        return false;
    }
    *out = value;
    return true;
}

// Whitespace-separated words; double quotes group words and backslash
// escapes the next character inside quotes.
inline bool SplitCommandLine(const std::string& line,
                             std::vector<std::string>* out,
                             std::string* error) {
    out->clear();
    std::string current;
    bool in_word = false;
    bool in_quotes = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (in_quotes) {
            if (ch == '\\' && i + 1 < line.size()) {
                current.push_back(line[++i]);
            } else if (ch == '"') {
                in_quotes = false;
            } else {
                current.push_back(ch);
            }
            continue;
        }
        if (ch == '"') {
            in_quotes = true;
            in_word = true;
        } else if (ch == ' ' || ch == '\t' || ch == '\r') {
            if (in_word) {
                out->push_back(current);
                current.clear();
                in_word = false;
            }
        } else {
            current.push_back(ch);
            in_word = true;
        }
    }
    if (in_quotes) {
        if (error != nullptr) {
            *error = "unterminated quote";
        }
        return false;
    }
    if (in_word) {
        out->push_back(current);
    }
    return true;
}

inline std::string QuoteOutputValue(const std::string& value) {
    bool needs_quotes = value.empty();
    for (const char ch : value) {
        if (ch == ' ' || ch == '"' || ch == '=' || ch == '\\') {
            needs_quotes = true;
            break;
        }
    }
    if (!needs_quotes) {
        return value;
    }
    std::string quoted = "\"";
    for (const char ch : value) {
        if (ch == '"' || ch == '\\') {
            quoted.push_back('\\');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}

}  // namespace coop_ledger::apps

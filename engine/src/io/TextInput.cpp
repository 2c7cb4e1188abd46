#include "io/TextInput.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace ventsizer {

std::string readTextFile(const std::string& filepath) {
    std::ifstream f(filepath);
    if (!f.is_open()) throw std::runtime_error("Cannot open file: " + filepath);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::vector<TextLine> tokenizeLines(const std::string& content) {
    std::vector<TextLine> lines;
    std::istringstream iss(content);
    std::string line;
    int lineNum = 0;

    while (std::getline(iss, line)) {
        ++lineNum;
        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);

        std::istringstream ls(line);
        TextLine tl{lineNum, {}};
        std::string tok;
        while (ls >> tok) tl.tokens.push_back(tok);
        if (!tl.tokens.empty()) lines.push_back(std::move(tl));
    }
    return lines;
}

std::string parseError(const std::string& source, int line, const std::string& message) {
    return source + " parse error at line " + std::to_string(line) + ": " + message;
}

double parseNumber(const std::string& text, const std::string& what, int line) {
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(text, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != text.size()) {
        throw std::runtime_error("line " + std::to_string(line) + ": invalid number for "
                                 + what + ": '" + text + "'");
    }
    return v;
}

int parseInteger(const std::string& text, const std::string& what, int line) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(text, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != text.size()) {
        throw std::runtime_error("line " + std::to_string(line) + ": invalid integer for "
                                 + what + ": '" + text + "'");
    }
    return v;
}

bool parseFlag(const std::string& text, const std::string& what, int line) {
    if (text == "1" || text == "true" || text == "yes") return true;
    if (text == "0" || text == "false" || text == "no") return false;
    throw std::runtime_error("line " + std::to_string(line) + ": invalid flag for "
                             + what + ": '" + text + "'");
}

// ── KeyValueArgs ─────────────────────────────────────────────────────

KeyValueArgs::KeyValueArgs(const TextLine& line, size_t first, const std::string& source)
    : line_(line.number), source_(source)
{
    for (size_t i = first; i < line.tokens.size(); ++i) {
        const std::string& tok = line.tokens[i];
        size_t eq = tok.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == tok.size()) {
            throw std::runtime_error(parseError(source_, line_, "expected key=value, got '" + tok + "'"));
        }
        std::string key = tok.substr(0, eq);
        if (!values_.emplace(key, tok.substr(eq + 1)).second) {
            throw std::runtime_error(parseError(source_, line_, "duplicate key '" + key + "'"));
        }
    }
}

std::string KeyValueArgs::take(const std::string& key) {
    auto it = values_.find(key);
    std::string v = it->second;
    values_.erase(it);
    return v;
}

std::string KeyValueArgs::text(const std::string& key) {
    if (!has(key)) {
        throw std::runtime_error(parseError(source_, line_, "missing '" + key + "'"));
    }
    return take(key);
}

std::string KeyValueArgs::text(const std::string& key, const std::string& fallback) {
    return has(key) ? take(key) : fallback;
}

double KeyValueArgs::number(const std::string& key) {
    return parseNumber(text(key), key, line_);
}

double KeyValueArgs::number(const std::string& key, double fallback) {
    return has(key) ? parseNumber(take(key), key, line_) : fallback;
}

int KeyValueArgs::integer(const std::string& key, int fallback) {
    return has(key) ? parseInteger(take(key), key, line_) : fallback;
}

bool KeyValueArgs::flag(const std::string& key, bool fallback) {
    return has(key) ? parseFlag(take(key), key, line_) : fallback;
}

void KeyValueArgs::finish() const {
    if (!values_.empty()) {
        throw std::runtime_error(parseError(source_, line_, "unknown key '" + values_.begin()->first + "'"));
    }
}

} // namespace ventsizer

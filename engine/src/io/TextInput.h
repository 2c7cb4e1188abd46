#pragma once

#include <map>
#include <string>
#include <vector>

namespace ventsizer {

// One non-blank, non-comment line of a text input file
struct TextLine {
    int number;                       // 1-based line number in the source
    std::vector<std::string> tokens;  // whitespace separated
};

// Whole-file read; throws std::runtime_error when the file cannot be opened
std::string readTextFile(const std::string& filepath);

// Split into tokenized lines, skipping blank lines and '#' comments
std::vector<TextLine> tokenizeLines(const std::string& content);

// Number parsing with the file/line in the error message
double parseNumber(const std::string& text, const std::string& what, int line);
int parseInteger(const std::string& text, const std::string& what, int line);
bool parseFlag(const std::string& text, const std::string& what, int line);

std::string parseError(const std::string& source, int line, const std::string& message);

// key=value tokens after a leading keyword
// Every key must be consumed; leftovers are reported by finish().
class KeyValueArgs {
public:
    KeyValueArgs(const TextLine& line, size_t first, const std::string& source);

    bool has(const std::string& key) const { return values_.count(key) > 0; }
    std::string text(const std::string& key);
    std::string text(const std::string& key, const std::string& fallback);
    double number(const std::string& key);
    double number(const std::string& key, double fallback);
    int integer(const std::string& key, int fallback);
    bool flag(const std::string& key, bool fallback);

    void finish() const;

private:
    std::map<std::string, std::string> values_;
    int line_;
    std::string source_;

    std::string take(const std::string& key);
};

} // namespace ventsizer

#include "common/shell_words.hpp"
#include <cctype>
#include <stdexcept>

namespace snapkeep {
namespace shell {

std::vector<std::string> split(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    bool inWord = false;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            if (inWord) {
                words.push_back(current);
                current.clear();
                inWord = false;
            }
            continue;
        }

        inWord = true;
        if (c == '\'') {
            size_t end = text.find('\'', i + 1);
            if (end == std::string::npos) {
                throw std::invalid_argument("No closing quotation in: " + text);
            }
            current += text.substr(i + 1, end - i - 1);
            i = end;
        } else if (c == '"') {
            ++i;
            while (i < text.size() && text[i] != '"') {
                if (text[i] == '\\' && i + 1 < text.size() &&
                    (text[i + 1] == '"' || text[i + 1] == '\\' || text[i + 1] == '$' || text[i + 1] == '`')) {
                    ++i;
                }
                current += text[i];
                ++i;
            }
            if (i >= text.size()) {
                throw std::invalid_argument("No closing quotation in: " + text);
            }
        } else if (c == '\\') {
            if (i + 1 >= text.size()) {
                throw std::invalid_argument("No escaped character in: " + text);
            }
            current += text[++i];
        } else {
            current += c;
        }
    }

    if (inWord) {
        words.push_back(current);
    }
    return words;
}

std::string quote(const std::string& word) {
    if (word.empty()) {
        return "''";
    }

    bool safe = true;
    for (char c : word) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            std::string("@%+=:,./-_").find(c) == std::string::npos) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return word;
    }

    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\"'\"'";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string join(const std::vector<std::string>& words) {
    std::string result;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) {
            result += ' ';
        }
        result += quote(words[i]);
    }
    return result;
}

} // namespace shell
} // namespace snapkeep

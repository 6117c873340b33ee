#include "strata/condition.hpp"
#include "strata/errors.hpp"
#include "strata/flattener.hpp"
#include "strata/log.hpp"
#include <cctype>
#include <cstdlib>

namespace strata {

namespace {

class condition_parser {
public:
    explicit condition_parser(const std::string& text) : text_(text) {}

    std::vector<condition_term> parse() {
        std::vector<condition_term> terms;
        skip_space();
        if (at_end()) {
            fail("condition is empty");
        }
        while (true) {
            terms.push_back(parse_term());
            skip_space();
            if (at_end()) break;
            expect_and();
        }
        return terms;
    }

private:
    const std::string& text_;
    size_t pos_ = 0;

    bool at_end() const { return pos_ >= text_.size(); }
    char peek() const { return text_[pos_]; }

    [[noreturn]] void fail(const std::string& what) const {
        throw invalid_condition_error("Invalid condition '" + text_ + "': " + what +
                                      " at offset " + std::to_string(pos_));
    }

    void skip_space() {
        while (!at_end() && std::isspace(static_cast<unsigned char>(peek()))) ++pos_;
    }

    static bool is_bare_char(char c) {
        return !std::isspace(static_cast<unsigned char>(c)) && c != '=' && c != '\'' && c != '"';
    }

    std::string parse_quoted(char quote) {
        ++pos_;  // opening quote
        std::string out;
        while (!at_end()) {
            char c = peek();
            ++pos_;
            if (c == quote) {
                if (!at_end() && peek() == quote) {
                    out += quote;
                    ++pos_;
                    continue;
                }
                return out;
            }
            out += c;
        }
        fail("unterminated quoted string");
    }

    std::string parse_bare() {
        size_t start = pos_;
        while (!at_end() && is_bare_char(peek())) ++pos_;
        return text_.substr(start, pos_ - start);
    }

    static bool is_number(const std::string& token) {
        if (token.empty()) return false;
        for (char c : token) {
            if (!(std::isdigit(static_cast<unsigned char>(c)) ||
                  c == '+' || c == '-' || c == '.' || c == 'e' || c == 'E')) {
                return false;
            }
        }
        char* end = nullptr;
        std::strtod(token.c_str(), &end);
        return end == token.c_str() + token.size();
    }

    condition_term parse_term() {
        condition_term term;

        if (peek() == '"') {
            term.key = parse_quoted('"');
        } else {
            term.key = parse_bare();
        }
        if (term.key.empty()) {
            fail("expected a key");
        }
        try {
            split_flat_key(term.key);
        } catch (const invalid_argument_error& e) {
            fail(e.what());
        }

        skip_space();
        if (at_end() || peek() != '=') {
            fail("expected '=' after key '" + term.key + "'");
        }
        ++pos_;
        skip_space();
        if (at_end()) {
            fail("expected a value for key '" + term.key + "'");
        }

        if (peek() == '\'') {
            term.value = parse_quoted('\'');
        } else if (peek() == '"') {
            fail("string values take single quotes");
        } else {
            std::string token = parse_bare();
            if (token == "true" || token == "false" || is_number(token)) {
                term.value = token;
            } else if (token.empty()) {
                fail("expected a value for key '" + term.key + "'");
            } else {
                fail("unquoted value '" + token + "'");
            }
        }
        return term;
    }

    void expect_and() {
        size_t start = pos_;
        std::string word = parse_bare();
        for (char& c : word) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        if (word != "AND") {
            pos_ = start;
            fail("expected AND");
        }
        skip_space();
        if (at_end()) {
            fail("expected a term after AND");
        }
    }
};

} // namespace

std::vector<condition_term> parse_condition(const std::string& condition) {
    auto terms = condition_parser(condition).parse();
    LOG_DEBUG("condition", "Parsed %zu terms from '%s'", terms.size(), condition.c_str());
    return terms;
}

} // namespace strata

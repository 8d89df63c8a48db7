#pragma once

#include <string>

// Helper to strip redundant outer parentheses from a condition expression
// This avoids output like: if ((x == 1)) -> if (x == 1)
inline std::string strip_outer_parens(const std::string& expr) {
    if (expr.size() >= 2 && expr.front() == '(' && expr.back() == ')') {
        // Check if the outer parens are actually matching
        int depth = 0;
        for (size_t i = 0; i < expr.size() - 1; i++) {
            if (expr[i] == '(') depth++;
            else if (expr[i] == ')') depth--;
            // If depth reaches 0 before the end, outer parens don't match
            if (depth == 0) return expr;
        }
        // The outer parens are matching, strip them
        return expr.substr(1, expr.size() - 2);
    }
    return expr;
}

// Escape text for a quoted string literal. Backslashes are escaped first so the
// escapes added afterwards are never doubled.
std::string escape_string(const std::string& text, char quote = '\'');

// Inverse of escape_string; also understands \xHH, \uHHHH and \u{...}
std::string unescape_string(const std::string& text);

// escape_string wrapped in the quote character
std::string quote_string(const std::string& text, char quote = '\'');

// Escape cooked text for a template literal chunk (backslash, backtick, "${")
std::string escape_template(const std::string& text);

bool is_valid_identifier(const std::string& name);

// Property key text: bare when it is an identifier, quoted otherwise
std::string property_key(const std::string& name);

// DOM property a JSX attribute maps to (class -> className, for -> htmlFor)
std::string dom_property_name(const std::string& attribute);
// aria-* and data-*, which are only reachable through setAttribute
bool is_markup_attribute(const std::string& attribute);

// onClick -> click, onDblClick -> dblclick
std::string event_name_from_attribute(const std::string& attribute);

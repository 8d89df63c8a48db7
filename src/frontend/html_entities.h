#pragma once

#include <string>

// Decode named (&amp;), decimal (&#169;) and hex (&#xA9;) character references.
// Unknown references are left as written.
std::string decode_html_entities(const std::string& text);

// Collapse JSX text the way JSX defines it: lines are trimmed, blank lines dropped,
// and the remaining lines joined with a single space. Returns "" for
// whitespace-only text that spans lines.
std::string normalize_jsx_text(const std::string& raw);

#include "codegen_utils.h"
#include <cctype>
#include <cstdio>
#include <unordered_set>

namespace {

void append_utf8(std::string& out, unsigned long code_point)
{
    if (code_point < 0x80)
    {
        out += static_cast<char>(code_point);
    }
    else if (code_point < 0x800)
    {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
    else if (code_point < 0x10000)
    {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
    else
    {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

bool read_hex(const std::string& text, size_t start, size_t count, unsigned long& value)
{
    if (start + count > text.size())
        return false;
    value = 0;
    for (size_t i = start; i < start + count; i++)
    {
        char c = text[i];
        if (!std::isxdigit(static_cast<unsigned char>(c)))
            return false;
        value = value * 16 + static_cast<unsigned long>(std::isdigit(static_cast<unsigned char>(c)) ? c - '0' : (std::tolower(c) - 'a' + 10));
    }
    return true;
}

}

std::string escape_string(const std::string& text, char quote)
{
    std::string result;
    result.reserve(text.size() + 8);
    for (char c : text)
    {
        switch (c)
        {
        case '\\':
            result += "\\\\";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            if (c == quote)
            {
                result += '\\';
                result += c;
            }
            else if (static_cast<unsigned char>(c) < 0x20)
            {
                char buffer[8];
                std::snprintf(buffer, sizeof(buffer), "\\x%02x", static_cast<unsigned char>(c));
                result += buffer;
            }
            else
            {
                result += c;
            }
        }
    }
    return result;
}

std::string unescape_string(const std::string& text)
{
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++)
    {
        char c = text[i];
        if (c != '\\' || i + 1 >= text.size())
        {
            result += c;
            continue;
        }

        char next = text[++i];
        unsigned long value = 0;
        switch (next)
        {
        case 'n':
            result += '\n';
            break;
        case 'r':
            result += '\r';
            break;
        case 't':
            result += '\t';
            break;
        case 'b':
            result += '\b';
            break;
        case 'f':
            result += '\f';
            break;
        case 'v':
            result += '\v';
            break;
        case '0':
            result += '\0';
            break;
        case 'x':
            if (read_hex(text, i + 1, 2, value))
            {
                append_utf8(result, value);
                i += 2;
            }
            else
            {
                result += next;
            }
            break;
        case 'u':
            if (i + 1 < text.size() && text[i + 1] == '{')
            {
                size_t close = text.find('}', i + 2);
                if (close != std::string::npos && read_hex(text, i + 2, close - i - 2, value))
                {
                    append_utf8(result, value);
                    i = close;
                    break;
                }
            }
            else if (read_hex(text, i + 1, 4, value))
            {
                append_utf8(result, value);
                i += 4;
                break;
            }
            result += next;
            break;
        default:
            // \\, \', \", \` and any other escaped character stand for themselves
            result += next;
        }
    }
    return result;
}

std::string quote_string(const std::string& text, char quote)
{
    return quote + escape_string(text, quote) + quote;
}

std::string escape_template(const std::string& text)
{
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++)
    {
        char c = text[i];
        if (c == '\\')
            result += "\\\\";
        else if (c == '`')
            result += "\\`";
        else if (c == '$' && i + 1 < text.size() && text[i + 1] == '{')
            result += "\\$";
        else
            result += c;
    }
    return result;
}

bool is_valid_identifier(const std::string& name)
{
    if (name.empty())
        return false;
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!(std::isalpha(first) || first == '_' || first == '$' || first >= 0x80))
        return false;
    for (char c : name)
    {
        unsigned char u = static_cast<unsigned char>(c);
        if (!(std::isalnum(u) || c == '_' || c == '$' || u >= 0x80))
            return false;
    }
    return true;
}

std::string property_key(const std::string& name)
{
    return is_valid_identifier(name) ? name : quote_string(name);
}

std::string dom_property_name(const std::string& attribute)
{
    if (attribute == "class")
        return "className";
    if (attribute == "for")
        return "htmlFor";
    return attribute;
}

bool is_markup_attribute(const std::string& attribute)
{
    return attribute.compare(0, 5, "aria-") == 0 || attribute.compare(0, 5, "data-") == 0;
}

std::string event_name_from_attribute(const std::string& attribute)
{
    std::string name = attribute.size() > 2 ? attribute.substr(2) : attribute;
    for (auto& c : name)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return name;
}

#include "html_entities.h"
#include <cctype>
#include <unordered_map>
#include <vector>

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

const std::unordered_map<std::string, unsigned long>& entity_table()
{
    static const std::unordered_map<std::string, unsigned long> table = {
        {"quot", 0x22}, {"amp", 0x26}, {"apos", 0x27}, {"lt", 0x3C}, {"gt", 0x3E},
        {"nbsp", 0xA0}, {"iexcl", 0xA1}, {"cent", 0xA2}, {"pound", 0xA3}, {"curren", 0xA4},
        {"yen", 0xA5}, {"brvbar", 0xA6}, {"sect", 0xA7}, {"uml", 0xA8}, {"copy", 0xA9},
        {"ordf", 0xAA}, {"laquo", 0xAB}, {"not", 0xAC}, {"shy", 0xAD}, {"reg", 0xAE},
        {"macr", 0xAF}, {"deg", 0xB0}, {"plusmn", 0xB1}, {"sup2", 0xB2}, {"sup3", 0xB3},
        {"acute", 0xB4}, {"micro", 0xB5}, {"para", 0xB6}, {"middot", 0xB7}, {"cedil", 0xB8},
        {"sup1", 0xB9}, {"ordm", 0xBA}, {"raquo", 0xBB}, {"frac14", 0xBC}, {"frac12", 0xBD},
        {"frac34", 0xBE}, {"iquest", 0xBF}, {"times", 0xD7}, {"divide", 0xF7},
        {"Agrave", 0xC0}, {"Aacute", 0xC1}, {"Auml", 0xC4}, {"Ccedil", 0xC7}, {"Eacute", 0xC9},
        {"Ntilde", 0xD1}, {"Ouml", 0xD6}, {"Uuml", 0xDC}, {"szlig", 0xDF}, {"agrave", 0xE0},
        {"aacute", 0xE1}, {"auml", 0xE4}, {"ccedil", 0xE7}, {"egrave", 0xE8}, {"eacute", 0xE9},
        {"ntilde", 0xF1}, {"ouml", 0xF6}, {"uuml", 0xFC},
        {"Alpha", 0x391}, {"Beta", 0x392}, {"Gamma", 0x393}, {"Delta", 0x394}, {"Theta", 0x398},
        {"Lambda", 0x39B}, {"Pi", 0x3A0}, {"Sigma", 0x3A3}, {"Phi", 0x3A6}, {"Omega", 0x3A9},
        {"alpha", 0x3B1}, {"beta", 0x3B2}, {"gamma", 0x3B3}, {"delta", 0x3B4}, {"epsilon", 0x3B5},
        {"theta", 0x3B8}, {"lambda", 0x3BB}, {"mu", 0x3BC}, {"pi", 0x3C0}, {"sigma", 0x3C3},
        {"tau", 0x3C4}, {"phi", 0x3C6}, {"omega", 0x3C9},
        {"ensp", 0x2002}, {"emsp", 0x2003}, {"thinsp", 0x2009}, {"zwnj", 0x200C}, {"zwj", 0x200D},
        {"ndash", 0x2013}, {"mdash", 0x2014}, {"lsquo", 0x2018}, {"rsquo", 0x2019}, {"sbquo", 0x201A},
        {"ldquo", 0x201C}, {"rdquo", 0x201D}, {"bdquo", 0x201E}, {"dagger", 0x2020}, {"Dagger", 0x2021},
        {"bull", 0x2022}, {"hellip", 0x2026}, {"permil", 0x2030}, {"prime", 0x2032}, {"Prime", 0x2033},
        {"lsaquo", 0x2039}, {"rsaquo", 0x203A}, {"euro", 0x20AC}, {"trade", 0x2122},
        {"larr", 0x2190}, {"uarr", 0x2191}, {"rarr", 0x2192}, {"darr", 0x2193}, {"harr", 0x2194},
        {"lArr", 0x21D0}, {"rArr", 0x21D2}, {"hArr", 0x21D4},
        {"forall", 0x2200}, {"part", 0x2202}, {"exist", 0x2203}, {"empty", 0x2205}, {"nabla", 0x2207},
        {"isin", 0x2208}, {"notin", 0x2209}, {"prod", 0x220F}, {"sum", 0x2211}, {"minus", 0x2212},
        {"radic", 0x221A}, {"infin", 0x221E}, {"and", 0x2227}, {"or", 0x2228}, {"cap", 0x2229},
        {"cup", 0x222A}, {"int", 0x222B}, {"asymp", 0x2248}, {"ne", 0x2260}, {"equiv", 0x2261},
        {"le", 0x2264}, {"ge", 0x2265}, {"sub", 0x2282}, {"sup", 0x2283},
        {"loz", 0x25CA}, {"spades", 0x2660}, {"clubs", 0x2663}, {"hearts", 0x2665}, {"diams", 0x2666},
    };
    return table;
}

bool is_jsx_whitespace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

}

std::string decode_html_entities(const std::string& text)
{
    if (text.find('&') == std::string::npos)
        return text;

    std::string result;
    result.reserve(text.size());
    size_t i = 0;
    while (i < text.size())
    {
        if (text[i] != '&')
        {
            result += text[i++];
            continue;
        }

        size_t semi = text.find(';', i + 1);
        // References are short; a distant ';' belongs to something else
        if (semi == std::string::npos || semi - i > 10)
        {
            result += text[i++];
            continue;
        }

        std::string name = text.substr(i + 1, semi - i - 1);
        bool decoded = false;
        if (name.size() > 1 && name[0] == '#')
        {
            bool hex = name[1] == 'x' || name[1] == 'X';
            std::string digits = name.substr(hex ? 2 : 1);
            bool valid = !digits.empty();
            for (char c : digits)
            {
                if (hex ? !std::isxdigit(static_cast<unsigned char>(c)) : !std::isdigit(static_cast<unsigned char>(c)))
                    valid = false;
            }
            if (valid)
            {
                unsigned long code_point = std::stoul(digits, nullptr, hex ? 16 : 10);
                if (code_point <= 0x10FFFF)
                {
                    append_utf8(result, code_point);
                    decoded = true;
                }
            }
        }
        else
        {
            auto it = entity_table().find(name);
            if (it != entity_table().end())
            {
                append_utf8(result, it->second);
                decoded = true;
            }
        }

        if (decoded)
        {
            i = semi + 1;
        }
        else
        {
            result += text[i++];
        }
    }
    return result;
}

std::string normalize_jsx_text(const std::string& raw)
{
    std::vector<std::string> lines;
    size_t start = 0;
    while (true)
    {
        size_t end = raw.find('\n', start);
        lines.push_back(raw.substr(start, end == std::string::npos ? std::string::npos : end - start));
        if (end == std::string::npos)
            break;
        start = end + 1;
    }

    if (lines.size() == 1)
        return raw;

    std::string result;
    for (size_t i = 0; i < lines.size(); i++)
    {
        const std::string& text = lines[i];
        size_t begin = 0;
        size_t finish = text.size();
        if (i != 0)
            while (begin < finish && is_jsx_whitespace(text[begin]))
                begin++;
        if (i != lines.size() - 1)
            while (finish > begin && is_jsx_whitespace(text[finish - 1]))
                finish--;

        if (begin == finish)
            continue;
        if (!result.empty())
            result += ' ';
        result += text.substr(begin, finish - begin);
    }
    return result;
}

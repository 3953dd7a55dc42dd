#include "svcagent/services/arguments.hpp"

#include "svcagent/exceptions.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <utility>

namespace svcagent::services
{

namespace
{
const Json* lookup(const Json& args, const std::string& key)
{
    if (!args.is_object())
        return nullptr;
    auto it = args.find(key);
    if (it == args.end() || it->is_null())
        return nullptr;
    return &*it;
}

// Two-byte UTF-8 sequences starting with 0xC3 cover the Latin-1 letters used in French.
char fold_latin1(unsigned char second)
{
    switch (second)
    {
    case 0xA0: case 0xA1: case 0xA2: case 0xA3: case 0xA4: case 0xA5:
    case 0x80: case 0x81: case 0x82: case 0x83: case 0x84: case 0x85:
        return 'a';
    case 0xA7: case 0x87:
        return 'c';
    case 0xA8: case 0xA9: case 0xAA: case 0xAB:
    case 0x88: case 0x89: case 0x8A: case 0x8B:
        return 'e';
    case 0xAC: case 0xAD: case 0xAE: case 0xAF:
    case 0x8C: case 0x8D: case 0x8E: case 0x8F:
        return 'i';
    case 0xB2: case 0xB3: case 0xB4: case 0xB5: case 0xB6:
    case 0x92: case 0x93: case 0x94: case 0x95: case 0x96:
        return 'o';
    case 0xB9: case 0xBA: case 0xBB: case 0xBC:
    case 0x99: case 0x9A: case 0x9B: case 0x9C:
        return 'u';
    default:
        return 0;
    }
}
} // namespace

std::optional<std::string> optional_string(const Json& args, const std::string& key)
{
    const Json* v = lookup(args, key);
    if (!v)
        return std::nullopt;
    if (!v->is_string())
        throw ValidationError("Le paramètre '" + key + "' doit être une chaîne de caractères");
    return v->get<std::string>();
}

std::string string_or(const Json& args, const std::string& key, const std::string& def)
{
    auto v = optional_string(args, key);
    return v ? *v : def;
}

int int_or(const Json& args, const std::string& key, int def)
{
    const Json* v = lookup(args, key);
    if (!v)
        return def;
    if (v->is_number_unsigned())
    {
        auto u = v->get<std::uint64_t>();
        if (u <= static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
            return static_cast<int>(u);
    }
    else if (v->is_number_integer())
    {
        auto i = v->get<std::int64_t>();
        if (i >= std::numeric_limits<int>::min() && i <= std::numeric_limits<int>::max())
            return static_cast<int>(i);
    }
    if (v->is_number_float())
    {
        double d = v->get<double>();
        if (std::floor(d) == d && d >= std::numeric_limits<int>::min() &&
            d <= std::numeric_limits<int>::max())
            return static_cast<int>(d);
    }
    if (v->is_string())
    {
        // Voice clients frequently send numbers as strings
        auto s = trim(v->get<std::string>());
        char* end = nullptr;
        errno = 0;
        long out = std::strtol(s.c_str(), &end, 10);
        if (!s.empty() && end == s.c_str() + s.size() && errno == 0 &&
            out >= std::numeric_limits<int>::min() && out <= std::numeric_limits<int>::max())
            return static_cast<int>(out);
    }
    throw ValidationError("Le paramètre '" + key + "' doit être un nombre entier");
}

bool bool_or(const Json& args, const std::string& key, bool def)
{
    const Json* v = lookup(args, key);
    if (!v)
        return def;
    if (v->is_boolean())
        return v->get<bool>();
    if (v->is_string())
    {
        auto s = fold(v->get<std::string>());
        if (s == "true" || s == "1" || s == "oui" || s == "yes")
            return true;
        if (s == "false" || s == "0" || s == "non" || s == "no")
            return false;
    }
    throw ValidationError("Le paramètre '" + key + "' doit être un booléen");
}

Json error_result(const std::string& message)
{
    return Json{{"status", "error"}, {"message", message}};
}

std::string fold(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i)
    {
        auto c = static_cast<unsigned char>(text[i]);
        if (c == 0xC3 && i + 1 < text.size())
        {
            char folded = fold_latin1(static_cast<unsigned char>(text[i + 1]));
            if (folded)
            {
                out.push_back(folded);
                ++i;
                continue;
            }
        }
        // Typographic apostrophe (U+2019) reads as '
        if (c == 0xE2 && i + 2 < text.size() && static_cast<unsigned char>(text[i + 1]) == 0x80 &&
            static_cast<unsigned char>(text[i + 2]) == 0x99)
        {
            out.push_back('\'');
            i += 2;
            continue;
        }
        out.push_back(c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c));
    }
    return out;
}

std::string trim(const std::string& text)
{
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin]))
        ++begin;
    while (end > begin && is_space(text[end - 1]))
        --end;
    return text.substr(begin, end - begin);
}

bool contains_folded(const std::string& haystack, const std::string& needle)
{
    return fold(haystack).find(needle) != std::string::npos;
}

} // namespace svcagent::services

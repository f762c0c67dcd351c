#include "json_util.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>

namespace kinema::json
{

std::string escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

namespace
{

size_t skip_ws(const std::string& json, size_t pos)
{
    while (pos < json.size()
           && (json[pos] == ' ' || json[pos] == '\t' || json[pos] == '\n' || json[pos] == '\r'))
        ++pos;
    return pos;
}

// Position just after the ':' following "key", or npos. Only keys of the
// outermost object match; nested objects and arrays are skipped.
size_t find_value(const std::string& json, const std::string& key)
{
    int depth = 0;
    for (size_t i = 0; i < json.size(); ++i)
    {
        const char c = json[i];
        if (c == '"')
        {
            size_t end = i + 1;
            while (end < json.size() && json[end] != '"')
                end += json[end] == '\\' ? 2 : 1;
            if (end >= json.size())
                return std::string::npos;

            if (depth == 1 && json.compare(i + 1, end - i - 1, key) == 0)
            {
                size_t colon = skip_ws(json, end + 1);
                if (colon < json.size() && json[colon] == ':')
                    return skip_ws(json, colon + 1);
            }
            i = end;
        }
        else if (c == '{' || c == '[')
        {
            ++depth;
        }
        else if (c == '}' || c == ']')
        {
            --depth;
        }
    }
    return std::string::npos;
}

// Index of the bracket closing the one at open, skipping string contents.
size_t find_closing(const std::string& json, size_t open)
{
    const char opener = json[open];
    const char closer = opener == '{' ? '}' : ']';
    int        depth  = 0;
    bool       in_str = false;
    for (size_t i = open; i < json.size(); ++i)
    {
        char c = json[i];
        if (in_str)
        {
            if (c == '\\')
                ++i;
            else if (c == '"')
                in_str = false;
            continue;
        }
        if (c == '"')
            in_str = true;
        else if (c == opener)
            ++depth;
        else if (c == closer && --depth == 0)
            return i;
    }
    return std::string::npos;
}

}   // anonymous namespace

std::optional<std::string> read_string(const std::string& json, const std::string& key)
{
    size_t pos = find_value(json, key);
    if (pos == std::string::npos || pos >= json.size() || json[pos] != '"')
        return std::nullopt;

    std::string out;
    for (size_t i = pos + 1; i < json.size(); ++i)
    {
        char c = json[i];
        if (c == '"')
            return out;
        if (c == '\\' && i + 1 < json.size())
        {
            char e = json[++i];
            switch (e)
            {
                case 'n':
                    out += '\n';
                    break;
                case 'r':
                    out += '\r';
                    break;
                case 't':
                    out += '\t';
                    break;
                default:
                    out += e;
                    break;
            }
            continue;
        }
        out += c;
    }
    return std::nullopt;
}

std::optional<double> read_number(const std::string& json, const std::string& key)
{
    size_t pos = find_value(json, key);
    if (pos == std::string::npos || pos >= json.size())
        return std::nullopt;

    const char* begin = json.c_str() + pos;
    char*       end   = nullptr;
    double      value = std::strtod(begin, &end);
    if (end == begin)
        return std::nullopt;
    return value;
}

std::optional<bool> read_bool(const std::string& json, const std::string& key)
{
    size_t pos = find_value(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    if (json.compare(pos, 4, "true") == 0)
        return true;
    if (json.compare(pos, 5, "false") == 0)
        return false;
    return std::nullopt;
}

bool has_key(const std::string& json, const std::string& key)
{
    return find_value(json, key) != std::string::npos;
}

std::optional<std::string> read_object(const std::string& json, const std::string& key)
{
    size_t pos = find_value(json, key);
    if (pos == std::string::npos || pos >= json.size() || json[pos] != '{')
        return std::nullopt;

    size_t close = find_closing(json, pos);
    if (close == std::string::npos)
        return std::nullopt;
    return json.substr(pos, close - pos + 1);
}

std::optional<std::vector<std::string>> read_object_array(const std::string& json,
                                                          const std::string& key)
{
    size_t pos = find_value(json, key);
    if (pos == std::string::npos || pos >= json.size() || json[pos] != '[')
        return std::nullopt;

    size_t close = find_closing(json, pos);
    if (close == std::string::npos)
        return std::nullopt;

    std::vector<std::string> objects;
    for (size_t i = pos + 1; i < close; ++i)
    {
        if (json[i] != '{')
            continue;
        size_t end = find_closing(json, i);
        if (end == std::string::npos || end > close)
            return std::nullopt;
        objects.push_back(json.substr(i, end - i + 1));
        i = end;
    }
    return objects;
}

std::string format_number(double value)
{
    if (!std::isfinite(value))
        return "0";

    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc())
        return "0";
    return std::string(buf, ptr);
}

}   // namespace kinema::json

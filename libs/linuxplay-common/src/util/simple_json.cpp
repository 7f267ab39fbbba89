///////////////////////////////////////////////////////////////////////////////
// simple_json.cpp -- Minimal flat JSON object codec implementation
///////////////////////////////////////////////////////////////////////////////

#include "lp/util/simple_json.h"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>

namespace lp {

namespace {

// Append a code point as UTF-8.
void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool parseNumber(const std::string& text, bool is_signed, int64_t& s, uint64_t& u) {
    if (text.empty()) return false;
    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    if (is_signed) {
        s = std::strtoll(begin, &end, 10);
    } else {
        if (text[0] == '-') return false;
        u = std::strtoull(begin, &end, 10);
    }
    return errno == 0 && end && *end == '\0';
}

} // anonymous namespace

size_t SimpleJson::skipWs(const std::string& s, size_t pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) {
        ++pos;
    }
    return pos;
}

std::string SimpleJson::parseString(const std::string& s, size_t& pos, bool& ok) {
    ok = false;
    // pos should point to the opening quote
    if (pos >= s.size() || s[pos] != '"') return "";
    ++pos;

    std::string result;
    result.reserve(64);

    while (pos < s.size()) {
        char c = s[pos++];
        if (c == '"') {
            ok = true;
            return result;
        }
        if (c == '\\' && pos < s.size()) {
            char esc = s[pos++];
            switch (esc) {
                case '"':  result += '"';  break;
                case '\\': result += '\\'; break;
                case '/':  result += '/';  break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    if (pos + 4 > s.size()) return result;
                    uint32_t cp = static_cast<uint32_t>(
                        std::strtoul(s.substr(pos, 4).c_str(), nullptr, 16));
                    appendUtf8(result, cp);
                    pos += 4;
                    break;
                }
                default:
                    result += esc;
                    break;
            }
        } else {
            result += c;
        }
    }
    return result; // unterminated string
}

bool SimpleJson::parseValue(const std::string& s, size_t& pos, Value& out) {
    pos = skipWs(s, pos);
    if (pos >= s.size()) return false;

    char c = s[pos];

    if (c == '"') {
        bool ok = false;
        out.text = parseString(s, pos, ok);
        out.kind = Kind::String;
        return ok;
    }

    out.kind = Kind::Literal;

    // Number (integer or float, possibly negative)
    if (c == '-' || (c >= '0' && c <= '9')) {
        size_t start = pos;
        ++pos;
        while (pos < s.size() && ((s[pos] >= '0' && s[pos] <= '9') ||
               s[pos] == '.' || s[pos] == 'e' || s[pos] == 'E' ||
               ((s[pos] == '+' || s[pos] == '-') &&
                (s[pos - 1] == 'e' || s[pos - 1] == 'E')))) {
            ++pos;
        }
        out.text = s.substr(start, pos - start);
        return true;
    }

    if (s.compare(pos, 4, "true") == 0)  { pos += 4; out.text = "true";  return true; }
    if (s.compare(pos, 5, "false") == 0) { pos += 5; out.text = "false"; return true; }
    if (s.compare(pos, 4, "null") == 0)  { pos += 4; out.text.clear();   return true; }

    // Nested objects and arrays are kept as raw text
    if (c == '{' || c == '[') {
        char open  = c;
        char close = (c == '{') ? '}' : ']';
        int depth = 1;
        size_t start = pos;
        ++pos;
        bool in_string = false;
        while (pos < s.size() && depth > 0) {
            char ch = s[pos];
            if (in_string) {
                if (ch == '\\') { ++pos; }
                else if (ch == '"') { in_string = false; }
            } else {
                if (ch == '"') { in_string = true; }
                else if (ch == open) { ++depth; }
                else if (ch == close) { --depth; }
            }
            ++pos;
        }
        if (depth != 0) return false;
        out.text = s.substr(start, pos - start);
        return true;
    }

    return false;
}

bool SimpleJson::parse(const std::string& json) {
    entries_.clear();
    kinds_.clear();

    size_t pos = skipWs(json, 0);
    if (pos >= json.size() || json[pos] != '{') return false;
    ++pos;

    bool expect_entry = true;
    while (pos < json.size()) {
        pos = skipWs(json, pos);
        if (pos >= json.size()) return false;

        if (json[pos] == '}') {
            return true;
        }
        if (!expect_entry) {
            if (json[pos] != ',') return false;
            ++pos;
            pos = skipWs(json, pos);
        }

        bool ok = false;
        std::string key = parseString(json, pos, ok);
        if (!ok) return false;

        pos = skipWs(json, pos);
        if (pos >= json.size() || json[pos] != ':') return false;
        ++pos;

        Value value;
        if (!parseValue(json, pos, value)) return false;

        entries_[key] = value.text;
        kinds_[key]   = value.kind;
        expect_entry  = false;
    }

    return false; // unterminated object
}

bool SimpleJson::hasKey(const std::string& key) const {
    return entries_.find(key) != entries_.end();
}

std::string SimpleJson::getString(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) return "";
    return it->second;
}

int64_t SimpleJson::getInt(const std::string& key, int64_t fallback) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) return fallback;
    int64_t s = 0;
    uint64_t u = 0;
    return parseNumber(it->second, true, s, u) ? s : fallback;
}

uint64_t SimpleJson::getUint(const std::string& key, uint64_t fallback) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) return fallback;
    int64_t s = 0;
    uint64_t u = 0;
    return parseNumber(it->second, false, s, u) ? u : fallback;
}

bool SimpleJson::getBool(const std::string& key, bool fallback) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) return fallback;
    const std::string& v = it->second;
    if (v == "true" || v == "1" || v == "yes")  return true;
    if (v == "false" || v == "0" || v == "no")  return false;
    return fallback;
}

void SimpleJson::setString(const std::string& key, const std::string& value) {
    entries_[key] = value;
    kinds_[key]   = Kind::String;
}

void SimpleJson::setInt(const std::string& key, int64_t value) {
    entries_[key] = std::to_string(value);
    kinds_[key]   = Kind::Literal;
}

void SimpleJson::setUint(const std::string& key, uint64_t value) {
    entries_[key] = std::to_string(value);
    kinds_[key]   = Kind::Literal;
}

void SimpleJson::setFloat(const std::string& key, double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    entries_[key] = buf;
    kinds_[key]   = Kind::Literal;
}

void SimpleJson::setBool(const std::string& key, bool value) {
    entries_[key] = value ? "true" : "false";
    kinds_[key]   = Kind::Literal;
}

void SimpleJson::setRaw(const std::string& key, const std::string& json) {
    entries_[key] = json;
    kinds_[key]   = Kind::Literal;
}

std::string SimpleJson::escapeString(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string SimpleJson::serialize() const {
    std::string out = "{";
    bool first = true;
    for (auto& [key, value] : entries_) {
        if (!first) out += ",";
        first = false;
        out += "\"" + escapeString(key) + "\":";

        auto kind_it = kinds_.find(key);
        Kind kind = (kind_it != kinds_.end()) ? kind_it->second : Kind::String;

        if (kind == Kind::Literal) {
            out += value.empty() ? "null" : value;
        } else {
            out += "\"" + escapeString(value) + "\"";
        }
    }
    out += "}";
    return out;
}

bool SimpleJson::splitObjectArray(const std::string& array_json,
                                  std::vector<std::string>& out) {
    out.clear();
    size_t pos = skipWs(array_json, 0);
    if (pos >= array_json.size() || array_json[pos] != '[') return false;
    ++pos;

    while (pos < array_json.size()) {
        pos = skipWs(array_json, pos);
        if (pos >= array_json.size()) return false;
        char c = array_json[pos];
        if (c == ']') return true;
        if (c == ',') { ++pos; continue; }

        Value element;
        if (!parseValue(array_json, pos, element)) return false;
        if (element.kind != Kind::Literal || element.text.empty() ||
            element.text[0] != '{') {
            return false;
        }
        out.push_back(element.text);
    }
    return false;
}

} // namespace lp

#include "meta_doc.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

MetaValue MetaValue::makeString(std::string s) {
    MetaValue v;
    v.kind = MetaKind::String;
    v.str = std::move(s);
    return v;
}

MetaValue MetaValue::makeInt(int64_t x) {
    MetaValue v;
    v.kind = MetaKind::Integer;
    v.i = x;
    return v;
}

MetaValue MetaValue::makeFloat(double x) {
    MetaValue v;
    v.kind = MetaKind::Float;
    v.f = x;
    return v;
}

MetaValue MetaValue::makeBool(bool x) {
    MetaValue v;
    v.kind = MetaKind::Boolean;
    v.b = x;
    return v;
}

MetaValue MetaValue::makeArray(std::vector<MetaValue> items) {
    MetaValue v;
    v.kind = MetaKind::Array;
    v.arr = std::move(items);
    return v;
}

MetaValue MetaValue::makeTable() {
    return MetaValue{};
}

const MetaValue* MetaValue::find(const std::string& key) const {
    if (kind != MetaKind::Table) return nullptr;
    for (size_t k = 0; k < keys.size(); ++k) {
        if (keys[k] == key) return &vals[k];
    }
    return nullptr;
}

MetaValue& MetaValue::set(const std::string& key, MetaValue v) {
    for (size_t k = 0; k < keys.size(); ++k) {
        if (keys[k] == key) {
            vals[k] = std::move(v);
            return vals[k];
        }
    }
    keys.push_back(key);
    vals.push_back(std::move(v));
    return vals.back();
}

std::string MetaValue::repr() const {
    std::ostringstream ss;
    switch (kind) {
        case MetaKind::String: ss << '"' << str << '"'; break;
        case MetaKind::Integer: ss << i; break;
        case MetaKind::Float: ss << f; break;
        case MetaKind::Boolean: ss << (b ? "true" : "false"); break;
        case MetaKind::Array:
            ss << '[';
            for (size_t k = 0; k < arr.size(); ++k) {
                if (k) ss << ", ";
                ss << arr[k].repr();
            }
            ss << ']';
            break;
        case MetaKind::Table:
            ss << '{';
            for (size_t k = 0; k < keys.size(); ++k) {
                if (k) ss << ", ";
                ss << keys[k] << " = " << vals[k].repr();
            }
            ss << '}';
            break;
    }
    return ss.str();
}

namespace {

// Arrays and inline tables nested deeper than this are rejected.
constexpr int MAX_NESTING = 64;

bool isBareKeyChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

class DocParser {
public:
    explicit DocParser(const std::string& text) : src_(text) {}

    bool parse(MetaValue& root, std::string& err) {
        root = MetaValue::makeTable();
        std::vector<std::string> current;
        bool currentIsArrayElem = false;

        while (true) {
            skipBlankAndComments();
            if (atEnd()) break;

            if (peek() == '[') {
                const bool arrayOfTables = (peekAt(1) == '[');
                pos_ += arrayOfTables ? 2 : 1;
                std::vector<std::string> path;
                if (!parseKeyPath(path, err)) return false;
                skipInlineSpace();
                if (!expect(']', err)) return false;
                if (arrayOfTables && !expect(']', err)) return false;
                if (!expectLineEnd(err)) return false;

                current = path;
                currentIsArrayElem = arrayOfTables;
                if (arrayOfTables) {
                    MetaValue* parent = nullptr;
                    std::vector<std::string> parentPath(path.begin(), path.end() - 1);
                    if (!tableAt(root, parentPath, false, parent, err)) return false;
                    MetaValue* arr = nullptr;
                    if (const MetaValue* existing = parent->find(path.back())) {
                        if (!existing->isArray()) return fail("'" + path.back() + "' is not an array of tables", err);
                        arr = const_cast<MetaValue*>(existing);
                    } else {
                        arr = &parent->set(path.back(), MetaValue::makeArray());
                    }
                    arr->arr.push_back(MetaValue::makeTable());
                } else {
                    MetaValue* t = nullptr;
                    if (!tableAt(root, path, false, t, err)) return false;
                }
                continue;
            }

            MetaValue* table = nullptr;
            if (!tableAt(root, current, currentIsArrayElem, table, err)) return false;

            std::vector<std::string> keyPath;
            if (!parseKeyPath(keyPath, err)) return false;
            skipInlineSpace();
            if (!expect('=', err)) return false;
            skipInlineSpace();

            MetaValue value;
            if (!parseValue(value, err)) return false;
            if (!expectLineEnd(err)) return false;

            if (!assign(*table, keyPath, std::move(value), err)) return false;
        }
        return true;
    }

private:
    const std::string& src_;
    size_t pos_ = 0;
    int line_ = 1;

    bool atEnd() const { return pos_ >= src_.size(); }
    char peek() const { return atEnd() ? '\0' : src_[pos_]; }
    char peekAt(size_t off) const { return (pos_ + off < src_.size()) ? src_[pos_ + off] : '\0'; }

    bool fail(const std::string& msg, std::string& err) const {
        err = "Line " + std::to_string(line_) + ": " + msg;
        return false;
    }

    void advance() {
        if (src_[pos_] == '\n') ++line_;
        ++pos_;
    }

    void skipInlineSpace() {
        while (!atEnd() && (peek() == ' ' || peek() == '\t' || peek() == '\r')) ++pos_;
    }

    void skipComment() {
        if (peek() == '#') {
            while (!atEnd() && peek() != '\n') ++pos_;
        }
    }

    void skipBlankAndComments() {
        while (!atEnd()) {
            const char c = peek();
            if (c == '#') {
                skipComment();
            } else if (std::isspace(static_cast<unsigned char>(c))) {
                advance();
            } else {
                break;
            }
        }
    }

    bool expect(char c, std::string& err) {
        if (peek() != c) {
            return fail(std::string("Expected '") + c + "'", err);
        }
        ++pos_;
        return true;
    }

    bool expectLineEnd(std::string& err) {
        skipInlineSpace();
        skipComment();
        if (atEnd()) return true;
        if (peek() != '\n') return fail("Unexpected trailing characters", err);
        advance();
        return true;
    }

    bool parseQuoted(std::string& out, std::string& err) {
        const char quote = peek();
        ++pos_;
        out.clear();
        while (true) {
            if (atEnd() || peek() == '\n') return fail("Unterminated string", err);
            char c = src_[pos_++];
            if (c == quote) break;
            if (c == '\\' && quote == '"') {
                if (atEnd()) return fail("Unterminated string", err);
                const char e = src_[pos_++];
                switch (e) {
                    case 'n': c = '\n'; break;
                    case 't': c = '\t'; break;
                    case 'r': c = '\r'; break;
                    case '"': c = '"'; break;
                    case '\\': c = '\\'; break;
                    default: return fail(std::string("Unknown escape \\") + e, err);
                }
            }
            out.push_back(c);
        }
        return true;
    }

    bool parseKey(std::string& out, std::string& err) {
        skipInlineSpace();
        if (peek() == '"' || peek() == '\'') return parseQuoted(out, err);
        out.clear();
        while (!atEnd() && isBareKeyChar(peek())) out.push_back(src_[pos_++]);
        if (out.empty()) return fail("Expected a key", err);
        return true;
    }

    bool parseKeyPath(std::vector<std::string>& out, std::string& err) {
        out.clear();
        while (true) {
            std::string k;
            if (!parseKey(k, err)) return false;
            out.push_back(k);
            skipInlineSpace();
            if (peek() != '.') break;
            ++pos_;
        }
        return true;
    }

    // Walk (creating as needed) to the table at `path`. When `lastIsArrayElem`
    // the final segment names an array of tables and its last element is returned.
    bool tableAt(MetaValue& root, const std::vector<std::string>& path, bool lastIsArrayElem,
                 MetaValue*& out, std::string& err) {
        MetaValue* cur = &root;
        for (size_t k = 0; k < path.size(); ++k) {
            const MetaValue* child = cur->find(path[k]);
            MetaValue* next = nullptr;
            if (!child) {
                next = &cur->set(path[k], MetaValue::makeTable());
            } else {
                next = const_cast<MetaValue*>(child);
            }
            if (next->isArray()) {
                const bool ok = !next->arr.empty() && next->arr.back().isTable()
                    && (lastIsArrayElem || k + 1 < path.size());
                if (!ok) return fail("'" + path[k] + "' is not a table", err);
                next = &next->arr.back();
            } else if (!next->isTable()) {
                return fail("'" + path[k] + "' is not a table", err);
            }
            cur = next;
        }
        out = cur;
        return true;
    }

    bool assign(MetaValue& table, const std::vector<std::string>& keyPath, MetaValue value, std::string& err) {
        MetaValue* cur = &table;
        for (size_t k = 0; k + 1 < keyPath.size(); ++k) {
            const MetaValue* child = cur->find(keyPath[k]);
            if (!child) {
                cur = &cur->set(keyPath[k], MetaValue::makeTable());
            } else if (child->isTable()) {
                cur = const_cast<MetaValue*>(child);
            } else {
                return fail("'" + keyPath[k] + "' is not a table", err);
            }
        }
        if (cur->find(keyPath.back())) {
            return fail("Duplicate key '" + keyPath.back() + "'", err);
        }
        cur->set(keyPath.back(), std::move(value));
        return true;
    }

    bool parseNumber(MetaValue& out, std::string& err) {
        std::string tok;
        while (!atEnd()) {
            const char c = peek();
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.' || c == '_') {
                if (c != '_') tok.push_back(c);
                ++pos_;
            } else {
                break;
            }
        }
        if (tok.empty()) return fail("Expected a value", err);

        const bool isFloat = tok.find_first_of(".eE") != std::string::npos;
        char* end = nullptr;
        if (isFloat) {
            const double v = std::strtod(tok.c_str(), &end);
            if (end == tok.c_str() || *end != '\0') return fail("Invalid number: " + tok, err);
            out = MetaValue::makeFloat(v);
        } else {
            const long long v = std::strtoll(tok.c_str(), &end, 10);
            if (end == tok.c_str() || *end != '\0') return fail("Invalid value: " + tok, err);
            out = MetaValue::makeInt(static_cast<int64_t>(v));
        }
        return true;
    }

    bool parseArray(MetaValue& out, std::string& err, int depth) {
        ++pos_; // [
        out = MetaValue::makeArray();
        while (true) {
            skipBlankAndComments();
            if (atEnd()) return fail("Unterminated array", err);
            if (peek() == ']') {
                ++pos_;
                return true;
            }
            MetaValue item;
            if (!parseValue(item, err, depth)) return false;
            out.arr.push_back(std::move(item));
            skipBlankAndComments();
            if (atEnd()) return fail("Unterminated array", err);
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            if (peek() == ']') {
                ++pos_;
                return true;
            }
            return fail("Expected ',' or ']' in array", err);
        }
    }

    bool parseInlineTable(MetaValue& out, std::string& err, int depth) {
        ++pos_; // {
        out = MetaValue::makeTable();
        skipInlineSpace();
        if (peek() == '}') {
            ++pos_;
            return true;
        }
        while (true) {
            std::vector<std::string> keyPath;
            if (!parseKeyPath(keyPath, err)) return false;
            skipInlineSpace();
            if (!expect('=', err)) return false;
            skipInlineSpace();
            MetaValue v;
            if (!parseValue(v, err, depth)) return false;
            if (!assign(out, keyPath, std::move(v), err)) return false;
            skipInlineSpace();
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            if (peek() == '}') {
                ++pos_;
                return true;
            }
            return fail("Expected ',' or '}' in inline table", err);
        }
    }

    bool parseValue(MetaValue& out, std::string& err, int depth = 0) {
        const char c = peek();
        if (c == '"' || c == '\'') {
            std::string s;
            if (!parseQuoted(s, err)) return false;
            out = MetaValue::makeString(std::move(s));
            return true;
        }
        if ((c == '[' || c == '{') && depth >= MAX_NESTING) return fail("Nesting too deep", err);
        if (c == '[') return parseArray(out, err, depth + 1);
        if (c == '{') return parseInlineTable(out, err, depth + 1);
        if (src_.compare(pos_, 4, "true") == 0 && !isBareKeyChar(peekAt(4))) {
            pos_ += 4;
            out = MetaValue::makeBool(true);
            return true;
        }
        if (src_.compare(pos_, 5, "false") == 0 && !isBareKeyChar(peekAt(5))) {
            pos_ += 5;
            out = MetaValue::makeBool(false);
            return true;
        }
        return parseNumber(out, err);
    }
};

} // namespace

bool parseMetaDoc(const std::string& text, MetaValue& out, std::string* err) {
    std::string contents = text;
    if (contents.size() >= 3 && static_cast<unsigned char>(contents[0]) == 0xEF
        && static_cast<unsigned char>(contents[1]) == 0xBB && static_cast<unsigned char>(contents[2]) == 0xBF) {
        contents.erase(0, 3);
    }

    DocParser parser(contents);
    std::string perr;
    if (!parser.parse(out, perr)) {
        out = MetaValue::makeTable();
        if (err) *err = perr;
        return false;
    }
    return true;
}

bool loadMetaDoc(const std::string& path, MetaValue& out, std::string* err) {
    out = MetaValue::makeTable();

    std::ifstream f(path, std::ios::binary);
    if (!f) {
        if (err) *err = "Could not open config file: " + path;
        return false;
    }

    std::ostringstream oss;
    oss << f.rdbuf();
    return parseMetaDoc(oss.str(), out, err);
}

#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Value tree of the TOML-like configuration document.
//
// Supported subset:
//  - [table] and [table.sub] headers, [[array.of.tables]]
//  - key = value with bare, quoted or dotted keys
//  - strings ("..." with \" \\ \n \t escapes, '...' literal), integers, floats, booleans
//  - arrays (may span lines, trailing comma allowed) and inline tables { k = v, ... }
//  - comments starting with #
//
// Tables keep insertion order; lookups are linear (documents are tiny).
enum class MetaKind : uint8_t {
    String = 0,
    Integer,
    Float,
    Boolean,
    Array,
    Table,
};

struct MetaValue {
    MetaKind kind = MetaKind::Table;

    std::string str;
    int64_t i = 0;
    double f = 0.0;
    bool b = false;

    std::vector<MetaValue> arr;

    // Table entries, parallel vectors.
    std::vector<std::string> keys;
    std::vector<MetaValue> vals;

    static MetaValue makeString(std::string s);
    static MetaValue makeInt(int64_t v);
    static MetaValue makeFloat(double v);
    static MetaValue makeBool(bool v);
    static MetaValue makeArray(std::vector<MetaValue> items = {});
    static MetaValue makeTable();

    bool isTable() const { return kind == MetaKind::Table; }
    bool isArray() const { return kind == MetaKind::Array; }
    bool isString() const { return kind == MetaKind::String; }
    bool isNumber() const { return kind == MetaKind::Integer || kind == MetaKind::Float; }

    double asDouble() const { return kind == MetaKind::Float ? f : static_cast<double>(i); }

    // nullptr when missing or when this is not a table.
    const MetaValue* find(const std::string& key) const;

    // Inserts (or overwrites) a key. Only valid on tables.
    MetaValue& set(const std::string& key, MetaValue v);

    // Compact single-line rendering for warnings.
    std::string repr() const;
};

// Parse a whole document. On failure `out` is reset to an empty table and err
// gets "Line N: <reason>".
bool parseMetaDoc(const std::string& text, MetaValue& out, std::string* err = nullptr);

// Read + parse a file. A missing file is an error too; callers decide whether to care.
bool loadMetaDoc(const std::string& path, MetaValue& out, std::string* err = nullptr);

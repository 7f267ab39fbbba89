///////////////////////////////////////////////////////////////////////////////
// simple_json.h -- Minimal flat JSON object codec
//
// Used for the handshake wire messages, the host configuration file and the
// trusted-client database.  Values are kept as strings; nested objects and
// arrays are stored as their raw JSON text and can be unpacked with
// splitObjectArray().
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace lp {

// ---------------------------------------------------------------------------
// SimpleJson -- minimal JSON key-value store (string values only)
//
// Supports flat objects: { "key": "value", "num": 123, "flag": true }
// Callers use getString() / getInt() / getUint() / getBool() for typed access.
// ---------------------------------------------------------------------------
class SimpleJson {
public:
    SimpleJson() = default;

    /// Parse a JSON object string.  Returns true on success.
    bool parse(const std::string& json);

    /// Check if a key exists.
    bool hasKey(const std::string& key) const;

    /// Get a string value (returns empty string if not found).
    std::string getString(const std::string& key) const;

    /// Get an integer value (returns \p fallback if not found or not numeric).
    int64_t getInt(const std::string& key, int64_t fallback = 0) const;

    /// Get an unsigned integer value.
    uint64_t getUint(const std::string& key, uint64_t fallback = 0) const;

    /// "true"/"1"/"yes" are true, "false"/"0"/"no" are false, anything else
    /// returns \p fallback.
    bool getBool(const std::string& key, bool fallback = false) const;

    /// Set a string value.  Always serialized as a JSON string.
    void setString(const std::string& key, const std::string& value);

    /// Set a numeric value.
    void setInt(const std::string& key, int64_t value);

    /// Set an unsigned numeric value.
    void setUint(const std::string& key, uint64_t value);

    /// Set a floating-point value.
    void setFloat(const std::string& key, double value);

    /// Set a boolean value.
    void setBool(const std::string& key, bool value);

    /// Embed raw JSON text (an object or array) verbatim.
    void setRaw(const std::string& key, const std::string& json);

    /// Serialize to a single-line JSON string.
    std::string serialize() const;

    /// Access the underlying map.
    const std::map<std::string, std::string>& entries() const { return entries_; }

    /// Split a raw JSON array of objects ("[{...},{...}]") into its element
    /// texts.  Returns false if \p array_json is not an array.
    static bool splitObjectArray(const std::string& array_json,
                                 std::vector<std::string>& out);

private:
    enum class Kind { String, Literal };

    struct Value {
        std::string text;
        Kind        kind = Kind::String;
    };

    static size_t skipWs(const std::string& s, size_t pos);

    /// Parse a JSON string literal starting at pos (including quotes).
    /// Returns the parsed string and advances pos past the closing quote.
    static std::string parseString(const std::string& s, size_t& pos, bool& ok);

    /// Parse a JSON value starting at pos.
    static bool parseValue(const std::string& s, size_t& pos, Value& out);

    /// Escape a string for JSON output.
    static std::string escapeString(const std::string& s);

    std::map<std::string, std::string> entries_;
    std::map<std::string, Kind>        kinds_;
};

} // namespace lp

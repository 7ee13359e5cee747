#include "integrity/manifest.hpp"

#include "errors.hpp"
#include "integrity/integrity_string.hpp"
#include "utils/file_io.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <limits>
#include <set>
#include <sstream>
#include <utility>

namespace auraseal::integrity {
namespace {

constexpr std::size_t kMaxParts = 256;
constexpr std::size_t kMaxDepth = 16;

struct JsonValue {
    enum class Type { Null, Bool, Number, String, Array, Object };

    Type type {Type::Null};
    bool boolean {false};
    std::string text;
    std::vector<JsonValue> items;
    std::vector<std::pair<std::string, JsonValue>> members;
};

// Strict RFC 8259 reader for the manifest document.
class JsonReader {
public:
    explicit JsonReader(const std::string& input)
        : input_(input)
    {
    }

    JsonValue parseDocument()
    {
        auto value = parseValue(0);
        skipWhitespace();
        if (position_ != input_.size()) {
            fail("trailing characters");
        }
        return value;
    }

private:
    [[noreturn]] void fail(const std::string& reason) const
    {
        throw MalformedManifestError("Manifest JSON " + reason + " at offset " + std::to_string(position_));
    }

    void skipWhitespace()
    {
        while (position_ < input_.size()
               && (input_[position_] == ' ' || input_[position_] == '\t' || input_[position_] == '\n'
                   || input_[position_] == '\r')) {
            ++position_;
        }
    }

    char peek()
    {
        skipWhitespace();
        if (position_ >= input_.size()) {
            fail("ends unexpectedly");
        }
        return input_[position_];
    }

    void expect(char c)
    {
        if (peek() != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++position_;
    }

    void expectLiteral(const char* literal)
    {
        const std::string word(literal);
        if (input_.compare(position_, word.size(), word) != 0) {
            fail("has an invalid literal");
        }
        position_ += word.size();
    }

    JsonValue parseValue(std::size_t depth)
    {
        if (depth > kMaxDepth) {
            fail("nests too deeply");
        }

        JsonValue value {};
        const char c = peek();
        if (c == '{') {
            value.type = JsonValue::Type::Object;
            ++position_;
            if (peek() == '}') {
                ++position_;
                return value;
            }
            std::set<std::string> keys;
            while (true) {
                if (peek() != '"') {
                    fail("expected an object key");
                }
                auto key = parseString();
                if (!keys.insert(key).second) {
                    fail("repeats the key '" + key + "'");
                }
                expect(':');
                value.members.emplace_back(std::move(key), parseValue(depth + 1U));
                if (peek() == ',') {
                    ++position_;
                    continue;
                }
                expect('}');
                return value;
            }
        }
        if (c == '[') {
            value.type = JsonValue::Type::Array;
            ++position_;
            if (peek() == ']') {
                ++position_;
                return value;
            }
            while (true) {
                value.items.emplace_back(parseValue(depth + 1U));
                if (peek() == ',') {
                    ++position_;
                    continue;
                }
                expect(']');
                return value;
            }
        }
        if (c == '"') {
            value.type = JsonValue::Type::String;
            value.text = parseString();
            return value;
        }
        if (c == 't' || c == 'f') {
            value.type = JsonValue::Type::Bool;
            value.boolean = c == 't';
            expectLiteral(value.boolean ? "true" : "false");
            return value;
        }
        if (c == 'n') {
            expectLiteral("null");
            return value;
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            value.type = JsonValue::Type::Number;
            value.text = parseNumber();
            return value;
        }
        fail("has an unexpected character");
    }

    bool digitAt(std::size_t offset) const
    {
        return offset < input_.size() && std::isdigit(static_cast<unsigned char>(input_[offset])) != 0;
    }

    void skipDigits()
    {
        while (digitAt(position_)) {
            ++position_;
        }
    }

    // -?(0|[1-9][0-9]*)(.[0-9]+)?([eE][+-]?[0-9]+)?
    std::string parseNumber()
    {
        const auto start = position_;
        if (input_[position_] == '-') {
            ++position_;
        }
        if (!digitAt(position_)) {
            fail("has a malformed number");
        }
        if (input_[position_] == '0') {
            ++position_;
            if (digitAt(position_)) {
                fail("has a number with a leading zero");
            }
        } else {
            skipDigits();
        }
        if (position_ < input_.size() && input_[position_] == '.') {
            ++position_;
            if (!digitAt(position_)) {
                fail("has a malformed fraction");
            }
            skipDigits();
        }
        if (position_ < input_.size() && (input_[position_] == 'e' || input_[position_] == 'E')) {
            ++position_;
            if (position_ < input_.size() && (input_[position_] == '+' || input_[position_] == '-')) {
                ++position_;
            }
            if (!digitAt(position_)) {
                fail("has a malformed exponent");
            }
            skipDigits();
        }
        return input_.substr(start, position_ - start);
    }

    std::string parseString()
    {
        expect('"');
        std::string out;
        while (true) {
            if (position_ >= input_.size()) {
                fail("has an unterminated string");
            }
            const char c = input_[position_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20U) {
                fail("has a control character in a string");
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (position_ >= input_.size()) {
                fail("has an unterminated escape");
            }
            const char escape = input_[position_++];
            switch (escape) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/': out.push_back('/'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'u': appendUtf8(out, parseCodePoint()); break;
            default:
                fail("has an invalid escape");
            }
        }
    }

    std::uint32_t parseHex4()
    {
        if (position_ + 4U > input_.size()) {
            fail("has a truncated unicode escape");
        }
        std::uint32_t code = 0;
        for (int i = 0; i < 4; ++i) {
            const char c = input_[position_++];
            code <<= 4U;
            if (c >= '0' && c <= '9') {
                code |= static_cast<std::uint32_t>(c - '0');
            } else if (c >= 'a' && c <= 'f') {
                code |= static_cast<std::uint32_t>(c - 'a' + 10);
            } else if (c >= 'A' && c <= 'F') {
                code |= static_cast<std::uint32_t>(c - 'A' + 10);
            } else {
                fail("has an invalid unicode escape");
            }
        }
        return code;
    }

    // A \u escape, joining a UTF-16 surrogate pair into one code point.
    std::uint32_t parseCodePoint()
    {
        const auto high = parseHex4();
        if (high >= 0xDC00U && high <= 0xDFFFU) {
            fail("has an unpaired low surrogate");
        }
        if (high < 0xD800U || high > 0xDBFFU) {
            return high;
        }
        if (input_.compare(position_, 2, "\\u") != 0) {
            fail("has an unpaired high surrogate");
        }
        position_ += 2;
        const auto low = parseHex4();
        if (low < 0xDC00U || low > 0xDFFFU) {
            fail("has an unpaired high surrogate");
        }
        return 0x10000U + ((high - 0xD800U) << 10U) + (low - 0xDC00U);
    }

    static void appendUtf8(std::string& out, std::uint32_t code)
    {
        if (code < 0x80U) {
            out.push_back(static_cast<char>(code));
        } else if (code < 0x800U) {
            out.push_back(static_cast<char>(0xC0U | (code >> 6U)));
            out.push_back(static_cast<char>(0x80U | (code & 0x3FU)));
        } else if (code < 0x10000U) {
            out.push_back(static_cast<char>(0xE0U | (code >> 12U)));
            out.push_back(static_cast<char>(0x80U | ((code >> 6U) & 0x3FU)));
            out.push_back(static_cast<char>(0x80U | (code & 0x3FU)));
        } else {
            out.push_back(static_cast<char>(0xF0U | (code >> 18U)));
            out.push_back(static_cast<char>(0x80U | ((code >> 12U) & 0x3FU)));
            out.push_back(static_cast<char>(0x80U | ((code >> 6U) & 0x3FU)));
            out.push_back(static_cast<char>(0x80U | (code & 0x3FU)));
        }
    }

    const std::string& input_;
    std::size_t position_ {0};
};

const JsonValue* member(const JsonValue& object, const std::string& key)
{
    for (const auto& entry : object.members) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

std::uint64_t toUnsigned(const JsonValue& value, const std::string& context)
{
    if (value.type != JsonValue::Type::Number || value.text.empty()
        || !std::all_of(value.text.begin(), value.text.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        throw MalformedManifestError(context + " must be a non-negative integer");
    }
    std::uint64_t result = 0;
    for (const char c : value.text) {
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (result > (std::numeric_limits<std::uint64_t>::max() - digit) / 10U) {
            throw MalformedManifestError(context + " overflows 64 bits");
        }
        result = result * 10U + digit;
    }
    return result;
}

std::string toString(const JsonValue& value, const std::string& context)
{
    if (value.type != JsonValue::Type::String) {
        throw MalformedManifestError(context + " must be a string");
    }
    return value.text;
}

IntegrityRecord recordFromJson(const std::string& path, const JsonValue& value, std::size_t position)
{
    if (value.type != JsonValue::Type::Object) {
        throw MalformedManifestError("Manifest entry '" + path + "' must be an object");
    }

    IntegrityRecord record {};
    record.path = path;

    const auto* integrity = member(value, "integrity");
    const auto* size = member(value, "size");
    const auto* parts = member(value, "parts");
    if (integrity == nullptr || size == nullptr || parts == nullptr) {
        throw MalformedManifestError("Manifest entry '" + path + "' needs integrity, size and parts");
    }
    record.integrity = toString(*integrity, path + ".integrity");
    record.size = toUnsigned(*size, path + ".size");
    const auto partCount = toUnsigned(*parts, path + ".parts");
    if (partCount == 0U || partCount > kMaxParts) {
        throw MalformedManifestError("Manifest entry '" + path + "' has parts outside 1.." + std::to_string(kMaxParts));
    }
    record.parts = static_cast<std::size_t>(partCount);

    const auto* id = member(value, "id");
    const auto idValue = id != nullptr ? toUnsigned(*id, path + ".id") : static_cast<std::uint64_t>(position);
    if (idValue > 255U) {
        throw MalformedManifestError("Manifest entry '" + path + "' has a component id above 255");
    }
    record.id = static_cast<std::uint8_t>(idValue);

    if (const auto* parity = member(value, "parity")) {
        const auto parityCount = toUnsigned(*parity, path + ".parity");
        if (parityCount >= kMaxParts) {
            throw MalformedManifestError("Manifest entry '" + path + "' has too many parity parts");
        }
        record.parity = static_cast<std::size_t>(parityCount);
    }

    const auto* recovery = member(value, "recovery");
    if (recovery != nullptr && recovery->type != JsonValue::Type::Null) {
        if (recovery->type != JsonValue::Type::Object) {
            throw MalformedManifestError("Manifest entry '" + path + "' has a non-object recovery reference");
        }
        const auto* primary = member(*recovery, "primary");
        const auto* secondary = member(*recovery, "secondary");
        if (primary == nullptr || secondary == nullptr) {
            throw MalformedManifestError("Recovery reference of '" + path + "' needs primary and secondary");
        }
        record.recovery = RecoveryReference {toString(*primary, path + ".recovery.primary"),
                                             toString(*secondary, path + ".recovery.secondary")};
    }
    return record;
}

void validateRecord(IntegrityRecord& record)
{
    if (record.path.empty()) {
        throw MalformedManifestError("Manifest entry with an empty path");
    }
    if (record.parts == 0U || record.parts > kMaxParts) {
        throw MalformedManifestError("Manifest entry '" + record.path + "' has parts outside 1.." + std::to_string(kMaxParts));
    }
    if (record.parts + record.parity > kMaxParts) {
        throw MalformedManifestError("Manifest entry '" + record.path + "' has more than " + std::to_string(kMaxParts)
                                     + " data and parity parts");
    }

    const auto parsed = parseIntegrityString(record.integrity);
    if (parsed.isDual()) {
        if (!record.recovery) {
            record.recovery = defaultRecoveryReference(record.id);
        }
    } else if (record.recovery) {
        throw MalformedManifestError("Manifest entry '" + record.path + "' has a recovery reference but a single-hash integrity string");
    }
    if (record.recovery && (record.recovery->primary.empty() || record.recovery->secondary.empty())) {
        throw MalformedManifestError("Manifest entry '" + record.path + "' has an empty recovery reference");
    }
}

std::string escapeJson(const std::string& text)
{
    std::string out;
    out.reserve(text.size() + 2U);
    out.push_back('"');
    for (const char c : text) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20U) {
                static const char* kHex = "0123456789abcdef";
                out += "\\u00";
                out.push_back(kHex[(static_cast<unsigned char>(c) >> 4U) & 0x0FU]);
                out.push_back(kHex[static_cast<unsigned char>(c) & 0x0FU]);
            } else {
                out.push_back(c);
            }
        }
    }
    out.push_back('"');
    return out;
}

} // namespace

RecoveryReference defaultRecoveryReference(std::uint8_t componentId)
{
    const auto base = "parts/" + std::to_string(componentId);
    return RecoveryReference {base + "/data", base + "/parity"};
}

std::string dataLocation(const IntegrityRecord& record)
{
    return record.recovery ? record.recovery->primary : defaultRecoveryReference(record.id).primary;
}

std::string parityLocation(const IntegrityRecord& record)
{
    return record.recovery ? record.recovery->secondary : defaultRecoveryReference(record.id).secondary;
}

Manifest Manifest::fromRecords(std::vector<IntegrityRecord> records)
{
    Manifest manifest;
    std::set<std::uint8_t> ids;
    for (auto& record : records) {
        validateRecord(record);
        if (!ids.insert(record.id).second) {
            throw MalformedManifestError("Duplicate component id " + std::to_string(record.id));
        }
    }

    std::sort(records.begin(), records.end(), [](const IntegrityRecord& lhs, const IntegrityRecord& rhs) {
        return lhs.path < rhs.path;
    });
    for (std::size_t index = 0; index < records.size(); ++index) {
        if (!manifest.index_.emplace(records[index].path, index).second) {
            throw MalformedManifestError("Duplicate manifest path: " + records[index].path);
        }
    }
    manifest.records_ = std::move(records);
    return manifest;
}

Manifest Manifest::parse(const std::string& json)
{
    JsonReader reader(json);
    const auto document = reader.parseDocument();
    if (document.type != JsonValue::Type::Object) {
        throw MalformedManifestError("Manifest must be a JSON object keyed by component path");
    }

    std::vector<IntegrityRecord> records;
    records.reserve(document.members.size());
    for (std::size_t position = 0; position < document.members.size(); ++position) {
        const auto& entry = document.members[position];
        records.emplace_back(recordFromJson(entry.first, entry.second, position));
    }
    return fromRecords(std::move(records));
}

Manifest Manifest::load(const std::filesystem::path& path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw MalformedManifestError("Failed to open manifest: " + path.string());
    }
    const std::string json((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    return parse(json);
}

std::string Manifest::toJson() const
{
    std::ostringstream out;
    out << "{";
    for (std::size_t index = 0; index < records_.size(); ++index) {
        const auto& record = records_[index];
        out << (index == 0U ? "\n" : ",\n");
        out << "  " << escapeJson(record.path) << ": {\n"
            << "    \"id\": " << static_cast<unsigned>(record.id) << ",\n"
            << "    \"integrity\": " << escapeJson(record.integrity) << ",\n"
            << "    \"size\": " << record.size << ",\n"
            << "    \"parts\": " << record.parts << ",\n"
            << "    \"parity\": " << record.parity;
        if (record.recovery) {
            out << ",\n    \"recovery\": {\"primary\": " << escapeJson(record.recovery->primary)
                << ", \"secondary\": " << escapeJson(record.recovery->secondary) << "}";
        }
        out << "\n  }";
    }
    out << (records_.empty() ? "}\n" : "\n}\n");
    return out.str();
}

void Manifest::save(const std::filesystem::path& path) const
{
    const auto json = toJson();
    utils::writeBufferToFile(path, std::vector<std::uint8_t>(json.begin(), json.end()));
}

const IntegrityRecord* Manifest::find(const std::string& path) const noexcept
{
    const auto it = index_.find(path);
    return it == index_.end() ? nullptr : &records_[it->second];
}

const IntegrityRecord& Manifest::at(const std::string& path) const
{
    const auto* record = find(path);
    if (record == nullptr) {
        throw std::out_of_range("Component not in manifest: " + path);
    }
    return *record;
}

const std::vector<IntegrityRecord>& Manifest::records() const noexcept
{
    return records_;
}

std::vector<std::string> Manifest::paths() const
{
    std::vector<std::string> result;
    result.reserve(records_.size());
    for (const auto& record : records_) {
        result.push_back(record.path);
    }
    return result;
}

std::size_t Manifest::size() const noexcept
{
    return records_.size();
}

} // namespace auraseal::integrity

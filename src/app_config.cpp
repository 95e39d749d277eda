#include "config/app_config.hpp"
#include "market/errors.hpp"

#include <cctype>
#include <cmath>
#include <fstream>
#include <ostream>
#include <optional>
#include <sstream>

namespace gbce {

namespace {

// Minimal JSON value for config loading (no external deps)
struct JsonValue {
    enum Type { Null, Bool, Number, String, Array, Object };
    Type type = Null;
    bool boolean = false;
    double number = 0;
    std::string str;
    std::vector<JsonValue> arr;
    std::vector<std::pair<std::string, JsonValue>> obj;

    const JsonValue* get(const std::string& key) const {
        for (const auto& [k, v] : obj) {
            if (k == key) return &v;
        }
        return nullptr;
    }

    double get_number(const std::string& key, double def = 0) const {
        auto* v = get(key);
        return (v && v->type == Number) ? v->number : def;
    }
    std::string get_string(const std::string& key, const std::string& def = "") const {
        auto* v = get(key);
        return (v && v->type == String) ? v->str : def;
    }
    const JsonValue* get_array(const std::string& key) const {
        auto* v = get(key);
        return (v && v->type == Array) ? v : nullptr;
    }
};

void append_utf8(std::string& out, unsigned cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Simple recursive descent JSON parser
class JsonParser {
public:
    explicit JsonParser(const std::string& input) : input_(input), pos_(0) {}

    JsonValue parse() {
        skip_ws();
        auto v = parse_value();
        skip_ws();
        if (pos_ != input_.size()) fail("trailing characters");
        return v;
    }

private:
    const std::string& input_;
    size_t pos_;

    [[noreturn]] void fail(const std::string& msg) const {
        throw ConfigError("JSON parse error at offset " + std::to_string(pos_) + ": " + msg);
    }

    char peek() const { return pos_ < input_.size() ? input_[pos_] : '\0'; }
    char next() { return pos_ < input_.size() ? input_[pos_++] : '\0'; }
    void expect(char c) {
        if (next() != c) fail(std::string("expected '") + c + "'");
    }
    void expect_word(const std::string& word) {
        if (input_.compare(pos_, word.size(), word) != 0) fail("expected " + word);
        pos_ += word.size();
    }
    void skip_ws() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) ++pos_;
    }

    JsonValue parse_value() {
        skip_ws();
        char c = peek();
        if (c == '"') return parse_string();
        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == 'n') { expect_word("null"); return JsonValue{}; }
        if (c == 't') { expect_word("true"); JsonValue v; v.type = JsonValue::Bool; v.boolean = true; return v; }
        if (c == 'f') { expect_word("false"); JsonValue v; v.type = JsonValue::Bool; return v; }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();
        fail("unexpected character");
    }

    JsonValue parse_string() {
        expect('"');
        JsonValue v;
        v.type = JsonValue::String;
        while (peek() != '"') {
            if (peek() == '\0') fail("unterminated string");
            char c = next();
            if (c != '\\') { v.str += c; continue; }
            switch (char e = next()) {
                case '"': case '\\': case '/': v.str += e; break;
                case 'b': v.str += '\b'; break;
                case 'f': v.str += '\f'; break;
                case 'n': v.str += '\n'; break;
                case 'r': v.str += '\r'; break;
                case 't': v.str += '\t'; break;
                case 'u': append_utf8(v.str, parse_code_point()); break;
                default: fail("invalid escape sequence");
            }
        }
        next(); // skip closing "
        return v;
    }

    unsigned parse_hex4() {
        unsigned cp = 0;
        for (int i = 0; i < 4; ++i) {
            char c = next();
            cp <<= 4;
            if (c >= '0' && c <= '9') cp |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') cp |= static_cast<unsigned>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') cp |= static_cast<unsigned>(c - 'A' + 10);
            else fail("invalid \\u escape");
        }
        return cp;
    }

    // Body of a \uXXXX escape; a high surrogate must be followed by a low one.
    unsigned parse_code_point() {
        unsigned cp = parse_hex4();
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (next() != '\\' || next() != 'u') fail("unpaired surrogate");
            unsigned low = parse_hex4();
            if (low < 0xDC00 || low > 0xDFFF) fail("unpaired surrogate");
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("unpaired surrogate");
        }
        return cp;
    }

    JsonValue parse_number() {
        size_t start = pos_;
        if (peek() == '-') next();
        while (std::isdigit(static_cast<unsigned char>(peek()))) next();
        if (peek() == '.') { next(); while (std::isdigit(static_cast<unsigned char>(peek()))) next(); }
        if (peek() == 'e' || peek() == 'E') {
            next();
            if (peek() == '+' || peek() == '-') next();
            while (std::isdigit(static_cast<unsigned char>(peek()))) next();
        }
        JsonValue v;
        v.type = JsonValue::Number;
        try {
            v.number = std::stod(input_.substr(start, pos_ - start));
        } catch (const std::exception&) {
            fail("invalid number");
        }
        return v;
    }

    JsonValue parse_array() {
        expect('[');
        JsonValue v;
        v.type = JsonValue::Array;
        skip_ws();
        if (peek() == ']') { next(); return v; }
        while (true) {
            v.arr.push_back(parse_value());
            skip_ws();
            if (peek() == ',') { next(); skip_ws(); }
            else break;
        }
        skip_ws();
        expect(']');
        return v;
    }

    JsonValue parse_object() {
        expect('{');
        JsonValue v;
        v.type = JsonValue::Object;
        skip_ws();
        if (peek() == '}') { next(); return v; }
        while (true) {
            skip_ws();
            auto key = parse_string();
            skip_ws();
            expect(':');
            auto val = parse_value();
            v.obj.emplace_back(key.str, std::move(val));
            skip_ws();
            if (peek() == ',') { next(); }
            else break;
        }
        skip_ws();
        expect('}');
        return v;
    }
};

// 2^63: one past the largest int64_t, and exactly representable as a double.
constexpr double kInt64Limit = 9223372036854775808.0;

// Whole number inside the int64_t range. Error is the exception type of the
// entry being parsed.
template <typename Error>
int64_t to_integer(double value, const std::string& key) {
    if (std::floor(value) != value) {
        throw Error("'" + key + "' must be an integer");
    }
    if (!(value >= -kInt64Limit && value < kInt64Limit)) {
        throw Error("'" + key + "' is out of range");
    }
    return static_cast<int64_t>(value);
}

// Minutes as a millisecond Duration; throws Error if it does not fit.
template <typename Error>
Duration to_duration(double minutes, const std::string& key) {
    double ms = minutes * 60000.0;
    if (!(ms > -kInt64Limit && ms < kInt64Limit)) {
        throw Error("'" + key + "' is out of range");
    }
    return Duration(static_cast<Duration::rep>(ms));
}

// Whole number field; missing means `def`.
int64_t get_integer(const JsonValue& entry, const std::string& key, int64_t def = 0) {
    auto* v = entry.get(key);
    if (!v || v->type == JsonValue::Null) return def;
    if (v->type != JsonValue::Number) {
        throw InvalidInstrument("'" + key + "' must be an integer");
    }
    return to_integer<InvalidInstrument>(v->number, key);
}

InstrumentConfig parse_instrument(const JsonValue& entry) {
    std::optional<double> fixed_rate;
    if (auto* fd = entry.get("fixed_dividend"); fd && fd->type != JsonValue::Null) {
        if (fd->type != JsonValue::Number) {
            throw InvalidInstrument("'fixed_dividend' must be a number or null");
        }
        fixed_rate = fd->number;
    }

    return make_instrument_config(entry.get_string("symbol"),
                                  entry.get_string("type", "common"),
                                  get_integer(entry, "last_dividend"),
                                  fixed_rate,
                                  get_integer(entry, "par_value"));
}

SeedTrade parse_trade(const JsonValue& entry) {
    SeedTrade trade;
    trade.symbol = entry.get_string("symbol");

    auto* side = entry.get("side");
    if (side && side->type == JsonValue::String && (side->str == "buy" || side->str == "BUY")) {
        trade.side = TradeSide::Buy;
    } else if (side && side->type == JsonValue::String && (side->str == "sell" || side->str == "SELL")) {
        trade.side = TradeSide::Sell;
    } else if (side && side->type == JsonValue::Number && (side->number == 1 || side->number == -1)) {
        trade.side = side->number > 0 ? TradeSide::Buy : TradeSide::Sell;
    } else {
        throw InvalidTrade("'side' must be \"buy\", \"sell\", 1 or -1");
    }

    auto* qty = entry.get("quantity");
    auto* px = entry.get("price");
    if (!qty || qty->type != JsonValue::Number) {
        throw InvalidTrade("'quantity' must be an integer");
    }
    if (!px || px->type != JsonValue::Number) {
        throw InvalidTrade("'price' must be an integer");
    }
    trade.quantity = to_integer<InvalidTrade>(qty->number, "quantity");
    trade.price = to_integer<InvalidTrade>(px->number, "price");

    trade.age = to_duration<InvalidTrade>(entry.get_number("minutes_ago", 0.0), "minutes_ago");
    return trade;
}

} // anonymous namespace

Duration window_from_minutes(double minutes) {
    if (!(minutes >= 0)) {
        throw ConfigError("price window must be a non-negative number of minutes");
    }
    return to_duration<ConfigError>(minutes, "window_minutes");
}

AppConfig parse_config(const std::string& json, std::ostream& warn) {
    JsonParser parser(json);
    auto root = parser.parse();
    if (root.type != JsonValue::Object) {
        throw ConfigError("config root must be a JSON object");
    }

    AppConfig config;

    config.window = window_from_minutes(root.get_number("window_minutes", 15.0));

    if (auto* insts = root.get_array("instruments")) {
        for (const auto& inst : insts->arr) {
            try {
                config.instruments.push_back(parse_instrument(inst));
            } catch (const InvalidInstrument& e) {
                warn << "Skipping instrument '" << inst.get_string("symbol") << "': " << e.what() << "\n";
            }
        }
    }

    if (auto* trades = root.get_array("trades")) {
        for (const auto& t : trades->arr) {
            try {
                config.trades.push_back(parse_trade(t));
            } catch (const InvalidTrade& e) {
                warn << "Skipping trade for '" << t.get_string("symbol") << "': " << e.what() << "\n";
            }
        }
    }

    return config;
}

AppConfig load_config(const std::string& path, std::ostream& warn) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigError("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << f.rdbuf();
    return parse_config(buffer.str(), warn);
}

PopulateResult populate_registry(const AppConfig& config,
                                 InstrumentRegistry& registry,
                                 std::ostream& warn) {
    PopulateResult result;

    for (const auto& ic : config.instruments) {
        if (registry.register_instrument(ic) == nullptr) {
            warn << "Skipping duplicate instrument '" << ic.symbol << "'\n";
            ++result.skipped;
            continue;
        }
        ++result.instruments;
    }

    Timestamp now = registry.clock().now();
    for (const auto& t : config.trades) {
        auto* ledger = registry.find(t.symbol);
        if (ledger == nullptr) {
            warn << "Skipping trade for unknown instrument '" << t.symbol << "'\n";
            ++result.skipped;
            continue;
        }
        try {
            ledger->record_trade(t.side, t.quantity, t.price, now - t.age);
            ++result.trades;
        } catch (const InvalidTrade& e) {
            warn << "Skipping trade: " << e.what() << "\n";
            ++result.skipped;
        }
    }

    return result;
}

} // namespace gbce

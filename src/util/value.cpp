#include <sitecfg/value.hpp>
#include <cmath>
#include <cstdio>

namespace sitecfg {

// ---------------------------------------------------------------------------
// Table
// ---------------------------------------------------------------------------

Table::Table(std::initializer_list<Entry> init) {
    for (const auto& entry : init) {
        set(entry.first, entry.second);
    }
}

bool Table::contains(const std::string& key) const {
    return find(key) != nullptr;
}

const Value* Table::find(const std::string& key) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) return &entry.second;
    }
    return nullptr;
}

Value* Table::find(const std::string& key) {
    for (auto& entry : entries_) {
        if (entry.first == key) return &entry.second;
    }
    return nullptr;
}

Value& Table::operator[](const std::string& key) {
    if (Value* v = find(key)) return *v;
    entries_.emplace_back(key, Value());
    return entries_.back().second;
}

void Table::set(const std::string& key, Value value) {
    if (Value* v = find(key)) {
        *v = std::move(value);
        return;
    }
    entries_.emplace_back(key, std::move(value));
}

bool Table::erase(const std::string& key) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->first == key) {
            entries_.erase(it);
            return true;
        }
    }
    return false;
}

bool Table::operator==(const Table& other) const {
    if (size() != other.size()) return false;
    for (const auto& entry : entries_) {
        const Value* rhs = other.find(entry.first);
        if (!rhs || *rhs != entry.second) return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Callable
// ---------------------------------------------------------------------------

Callable::Callable(CallableFn fn)
    : fn_(std::make_shared<const CallableFn>(std::move(fn))) {}

Value Callable::operator()(const Array& args) const {
    if (!fn_ || !*fn_) return Value();
    return (*fn_)(args);
}

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

Value::Shape Value::shape() const {
    switch (kind()) {
        case Sequence: return SequenceShape;
        case Record:   return RecordShape;
        case Function: return CallableShape;
        default:       return ScalarShape;
    }
}

double Value::as_number() const {
    if (is_integer()) return static_cast<double>(as_integer());
    return std::get<double>(data_);
}

const Value* Value::find(const std::string& key) const {
    if (!is_table()) return nullptr;
    return as_table().find(key);
}

const char* Value::type_name() const {
    switch (kind()) {
        case Null:     return "null";
        case Bool:     return "boolean";
        case Integer:  return "integer";
        case Float:    return "float";
        case String:   return "string";
        case Sequence: return "array";
        case Record:   return "table";
        case Function: return "function";
    }
    return "unknown";
}

static void append_json_string(std::string& out, const std::string& s) {
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

static std::string format_double(double d) {
    if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 1e15) {
        return std::to_string(static_cast<int64_t>(d));
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", d);
    return buf;
}

static void append_json(std::string& out, const Value& v) {
    switch (v.kind()) {
        case Value::Null:    out += "null"; break;
        case Value::Bool:    out += v.as_bool() ? "true" : "false"; break;
        case Value::Integer: out += std::to_string(v.as_integer()); break;
        case Value::Float:   out += format_double(v.as_number()); break;
        case Value::String:  append_json_string(out, v.as_string()); break;
        case Value::Sequence: {
            out += '[';
            bool first = true;
            for (const auto& elem : v.as_array()) {
                if (!first) out += ',';
                first = false;
                append_json(out, elem);
            }
            out += ']';
            break;
        }
        case Value::Record: {
            out += '{';
            bool first = true;
            for (const auto& [key, elem] : v.as_table()) {
                if (!first) out += ',';
                first = false;
                append_json_string(out, key);
                out += ':';
                append_json(out, elem);
            }
            out += '}';
            break;
        }
        case Value::Function: out += "\"[function]\""; break;
    }
}

std::string Value::to_json() const {
    std::string out;
    append_json(out, *this);
    return out;
}

std::string Value::to_display() const {
    if (is_string()) return as_string();
    return to_json();
}

bool Value::operator==(const Value& other) const {
    if (is_number() && other.is_number()) {
        if (is_integer() && other.is_integer()) {
            return as_integer() == other.as_integer();
        }
        return as_number() == other.as_number();
    }
    return data_ == other.data_;
}

std::string join_display(const Array& values) {
    std::string out;
    for (const auto& v : values) {
        if (!out.empty()) out += ", ";
        out += v.to_display();
    }
    return out;
}

} // namespace sitecfg

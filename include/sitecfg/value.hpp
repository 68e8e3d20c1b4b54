#pragma once

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sitecfg {

class Value;

using Array = std::vector<Value>;
using CallableFn = std::function<Value(const Array& args)>;

// Keyed record that keeps insertion order. Lookups are linear; config
// records are small.
class Table {
public:
    using Entry = std::pair<std::string, Value>;
    using iterator = std::vector<Entry>::iterator;
    using const_iterator = std::vector<Entry>::const_iterator;

    Table() = default;
    Table(std::initializer_list<Entry> init);

    bool contains(const std::string& key) const;
    const Value* find(const std::string& key) const;
    Value* find(const std::string& key);

    // Inserts a null value when the key is missing
    Value& operator[](const std::string& key);

    // Replaces in place when present, appends otherwise
    void set(const std::string& key, Value value);
    bool erase(const std::string& key);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    iterator begin() { return entries_.begin(); }
    iterator end() { return entries_.end(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    // Key order does not participate in equality
    bool operator==(const Table& other) const;
    bool operator!=(const Table& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
};

// Shared, identity-compared function value
class Callable {
public:
    Callable() = default;
    explicit Callable(CallableFn fn);

    Value operator()(const Array& args) const;
    explicit operator bool() const { return static_cast<bool>(fn_); }

    bool operator==(const Callable& other) const { return fn_ == other.fn_; }
    bool operator!=(const Callable& other) const { return fn_ != other.fn_; }

private:
    std::shared_ptr<const CallableFn> fn_;
};

// Configuration value with a closed set of kinds
class Value {
public:
    enum Kind { Null, Bool, Integer, Float, String, Sequence, Record, Function };

    // The shapes the merge engine distinguishes
    enum Shape { ScalarShape, SequenceShape, RecordShape, CallableShape };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : data_(b) {}
    Value(int i) : data_(static_cast<int64_t>(i)) {}
    Value(long i) : data_(static_cast<int64_t>(i)) {}
    Value(long long i) : data_(static_cast<int64_t>(i)) {}
    Value(double d) : data_(d) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(Table t) : data_(std::move(t)) {}
    Value(Callable c) : data_(std::move(c)) {}

    static Value function(CallableFn fn) { return Value(Callable(std::move(fn))); }

    Kind kind() const { return static_cast<Kind>(data_.index()); }
    Shape shape() const;

    bool is_null() const { return kind() == Null; }
    bool is_bool() const { return kind() == Bool; }
    bool is_integer() const { return kind() == Integer; }
    bool is_float() const { return kind() == Float; }
    bool is_number() const { return is_integer() || is_float(); }
    bool is_string() const { return kind() == String; }
    bool is_array() const { return kind() == Sequence; }
    bool is_table() const { return kind() == Record; }
    bool is_callable() const { return kind() == Function; }

    bool as_bool() const { return std::get<bool>(data_); }
    int64_t as_integer() const { return std::get<int64_t>(data_); }
    double as_number() const;
    const std::string& as_string() const { return std::get<std::string>(data_); }
    const Array& as_array() const { return std::get<Array>(data_); }
    Array& as_array() { return std::get<Array>(data_); }
    const Table& as_table() const { return std::get<Table>(data_); }
    Table& as_table() { return std::get<Table>(data_); }
    const Callable& as_callable() const { return std::get<Callable>(data_); }

    // Record member lookup; nullptr when this is not a record or lacks the key
    const Value* find(const std::string& key) const;

    // "null", "boolean", "integer", "float", "string", "array", "table", "function"
    const char* type_name() const;

    std::string to_json() const;
    // Strings unquoted, everything else as JSON
    std::string to_display() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, bool, int64_t, double, std::string,
                 Array, Table, Callable> data_;
};

// Joins to_display() of each value with ", "
std::string join_display(const Array& values);

} // namespace sitecfg

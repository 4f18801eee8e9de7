// value.cpp - Value type utilities

#include <json_patch/value.h>

#include <cmath>
#include <iomanip>  // for std::setprecision
#include <limits>
#include <sstream>  // for std::ostringstream

namespace json_patch {

namespace {

void append_escaped(std::string& out, const std::string& s)
{
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    out += oss.str();
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

std::string format_double(double d)
{
    if (!std::isfinite(d)) {
        return "null";  // JSON has no NaN / Infinity
    }
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << d;
    return oss.str();
}

void write_value(std::string& out, const Value& val)
{
    std::visit([&out](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            out += format_double(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            append_escaped(out, arg);
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            out += '{';
            bool first = true;
            arg.for_each([&](const std::string& key, const ValueBox& child) {
                if (!first) out += ',';
                first = false;
                append_escaped(out, key);
                out += ':';
                write_value(out, *child);
            });
            out += '}';
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            out += '[';
            bool first = true;
            for (const auto& child : arg) {
                if (!first) out += ',';
                first = false;
                write_value(out, *child);
            }
            out += ']';
        }
    }, val.data);
}

} // anonymous namespace

std::string value_to_string(const Value& val)
{
    std::string out;
    write_value(out, val);
    return out;
}

std::ostream& operator<<(std::ostream& os, const Value& val)
{
    return os << value_to_string(val);
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    std::visit(
        [&](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, ValueObject>) {
                arg.for_each([&](const std::string& key, const ValueBox& child) {
                    std::cout << std::string(depth * 2, ' ') << prefix << key << ":\n";
                    print_value(*child, "", depth + 1);
                });
            } else if constexpr (std::is_same_v<T, ValueArray>) {
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    std::cout << std::string(depth * 2, ' ') << prefix << "["
                              << i << "]:\n";
                    print_value(*arg[i], "", depth + 1);
                }
            } else {
                std::cout << std::string(depth * 2, ' ') << prefix
                          << value_to_string(val) << "\n";
            }
        },
        val.data);
}

// ============================================================
// Explicit Template Instantiations
// ============================================================

template struct BasicValue<thread_safe_memory_policy>;
template class BasicValueObject<thread_safe_memory_policy>;

} // namespace json_patch

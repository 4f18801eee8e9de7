// json_pointer.cpp
// Implementation of JSON Pointer (RFC 6901) parsing and helpers

#include <json_patch/json_pointer.h>

#include <charconv>

namespace json_patch {

namespace {

/// Unescape a JSON Pointer segment according to RFC 6901
/// ~1 -> /, ~0 -> ~ ; any other use of '~' is rejected
bool unescape_segment(std::string_view segment, std::string& result)
{
    result.clear();
    result.reserve(segment.size());

    for (size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] != '~') {
            result += segment[i];
            continue;
        }
        if (i + 1 >= segment.size()) {
            return false;
        }
        if (segment[i + 1] == '1') {
            result += '/';
        } else if (segment[i + 1] == '0') {
            result += '~';
        } else {
            return false;
        }
        ++i;
    }
    return true;
}

PointerParseResult parse_failure(std::string message)
{
    PointerParseResult result;
    result.error_code = PatchErrorCode::InvalidPointerToken;
    result.error_message = std::move(message);
    return result;
}

} // anonymous namespace

PointerParseResult parse_json_pointer(std::string_view pointer)
{
    PointerParseResult result;

    // Empty pointer refers to root
    if (pointer.empty()) {
        result.success = true;
        return result;
    }

    if (pointer[0] != '/') {
        return parse_failure("pointer must be empty or start with '/': \"" + std::string{pointer} + "\"");
    }

    pointer.remove_prefix(1);
    std::string token;
    while (true) {
        auto pos = pointer.find('/');
        std::string_view segment = (pos == std::string_view::npos)
                                    ? pointer
                                    : pointer.substr(0, pos);

        if (!unescape_segment(segment, token)) {
            return parse_failure("invalid '~' escape in token \"" + std::string{segment} + "\"");
        }
        result.pointer.push_back(std::move(token));
        token = std::string{};

        if (pos == std::string_view::npos) {
            break;
        }
        pointer.remove_prefix(pos + 1);
    }

    result.success = true;
    return result;
}

std::string to_string(const JsonPointer& pointer)
{
    std::string result;
    for (const auto& token : pointer) {
        result += '/';
        // Escape: ~ -> ~0, / -> ~1
        for (char c : token) {
            if (c == '~') {
                result += "~0";
            } else if (c == '/') {
                result += "~1";
            } else {
                result += c;
            }
        }
    }
    return result;
}

bool is_prefix_of(const JsonPointer& prefix, const JsonPointer& pointer)
{
    if (prefix.size() > pointer.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), pointer.begin());
}

JsonPointer parent_of(const JsonPointer& pointer)
{
    if (pointer.empty()) {
        return {};
    }
    return JsonPointer(pointer.begin(), pointer.end() - 1);
}

std::optional<std::size_t> parse_array_index(std::string_view token, bool allow_append, std::size_t append_index)
{
    if (token == append_token) {
        if (allow_append) {
            return append_index;
        }
        return std::nullopt;
    }
    if (token.empty()) {
        return std::nullopt;
    }
    // RFC 6901: "0" or a digit sequence without leading zero
    if (token.size() > 1 && token[0] == '0') {
        return std::nullopt;
    }

    std::size_t index = 0;
    auto [end, ec] = std::from_chars(token.data(), token.data() + token.size(), index);
    if (ec != std::errc{} || end != token.data() + token.size()) {
        return std::nullopt;  // sign, non-digit or overflow
    }
    return index;
}

} // namespace json_patch

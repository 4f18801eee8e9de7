// pointer_lens.cpp
// lager lens over pointer resolution and persistent edits

#include <json_patch/pointer_lens.h>
#include <json_patch/pointer_resolver.h>
#include <json_patch/tree_rebuilder.h>
#include <zug/compose.hpp>

namespace json_patch {

namespace {

Value view_at(const Value& whole, const JsonPointer& pointer)
{
    auto found = value_at(Document{whole}, pointer);
    if (!found) {
        detail::log_access_error("pointer_lens", found.error_message);
        return Value{};
    }
    return *found.value;
}

Value set_at(Value whole, const JsonPointer& pointer, Value part)
{
    Document root{std::move(whole)};
    auto resolved = resolve(root, pointer);
    if (!resolved) {
        detail::log_access_error("pointer_lens", resolved.error_message);
        return *root;
    }

    const bool replace = resolved.slot.existed && !resolved.slot.append;
    auto result = replace ? replace_at(root, pointer, Document{std::move(part)})
                          : add_at(root, pointer, Document{std::move(part)});
    if (!result) {
        detail::log_access_error("pointer_lens", result.error_message);
        return *root;
    }
    return *result.document;
}

} // anonymous namespace

PointerLens pointer_lens(JsonPointer pointer)
{
    if (pointer.empty()) {
        return zug::identity;
    }

    return lager::lenses::getset(
        [pointer](const Value& whole) -> Value {
            return view_at(whole, pointer);
        },
        [pointer](Value whole, Value part) -> Value {
            return set_at(std::move(whole), pointer, std::move(part));
        });
}

PointerLens pointer_lens(std::string_view pointer)
{
    auto parsed = parse_json_pointer(pointer);
    if (!parsed) {
        detail::log_access_error("pointer_lens", parsed.error_message);
        return lager::lenses::getset(
            [](const Value&) -> Value { return Value{}; },
            [](Value whole, Value) -> Value { return whole; });
    }
    return pointer_lens(std::move(parsed.pointer));
}

} // namespace json_patch

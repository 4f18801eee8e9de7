// pointer_lens.h - lager::lens<Value, Value> addressed by JSON Pointer

#pragma once

#include <json_patch/api.h>
#include <json_patch/json_pointer.h>
#include <json_patch/value.h>
#include <lager/lens.hpp>
#include <lager/lenses.hpp>

namespace json_patch {

using PointerLens = lager::lens<Value, Value>;

/// @brief Lens focusing the value a pointer addresses
///
/// - view: the addressed value, or null when the pointer does not resolve
/// - set: replaces an existing target, adds a missing one (object member,
///   array insertion / "-" append); an unresolvable pointer leaves the
///   whole unchanged
///
/// Works with lager::view / lager::set / lager::over.
[[nodiscard]] JSON_PATCH_API PointerLens pointer_lens(JsonPointer pointer);

/// Parse @p pointer first; a malformed string yields a lens that views null
/// and never changes its whole
[[nodiscard]] JSON_PATCH_API PointerLens pointer_lens(std::string_view pointer);

} // namespace json_patch

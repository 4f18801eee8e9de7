// patch_demo.cpp - JSON Patch over a lager store
//
// Every dispatched patch produces a new document that shares all untouched
// subtrees with the previous one, so keeping a history for undo/redo costs
// only the rebuilt ancestor chains.

#include <json_patch/builders.h>
#include <json_patch/patch.h>
#include <json_patch/pointer_lens.h>

#include <immer/vector.hpp>
#include <lager/event_loop/manual.hpp>
#include <lager/store.hpp>

#include <iostream>
#include <string>
#include <variant>

using namespace json_patch;

// ============================================================
// Application State and Actions
// ============================================================

struct ApplyPatch
{
    Patch steps;
};

struct Undo {};
struct Redo {};

using Action = std::variant<ApplyPatch, Undo, Redo>;

struct EditorState
{
    Document current;
    immer::vector<Document> history;
    immer::vector<Document> future;
    std::string last_error;
};

bool operator==(const EditorState& a, const EditorState& b)
{
    return same_node(a.current, b.current)
        && a.history.size() == b.history.size()
        && a.future.size() == b.future.size()
        && a.last_error == b.last_error;
}

EditorState create_initial_state()
{
    auto todo = ObjectBuilder()
                    .set("title", "Write docs")
                    .set("done", false)
                    .finish();

    auto root = ObjectBuilder()
                    .set("items", Value::array({todo}))
                    .set("owner", "chenmou")
                    .finish();

    return EditorState{
        .current    = Document{std::move(root)},
        .history    = {},
        .future     = {},
        .last_error = {},
    };
}

// ============================================================
// Reducer
// ============================================================

EditorState reducer(EditorState state, Action action)
{
    return std::visit(
        [&](auto&& act) -> EditorState {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, Undo>) {
                if (state.history.empty())
                    return state;
                auto previous = state.history.back();
                return EditorState{
                    .current    = previous,
                    .history    = state.history.take(state.history.size() - 1),
                    .future     = state.future.push_back(state.current),
                    .last_error = {},
                };
            } else if constexpr (std::is_same_v<T, Redo>) {
                if (state.future.empty())
                    return state;
                auto next = state.future.back();
                return EditorState{
                    .current    = next,
                    .history    = state.history.push_back(state.current),
                    .future     = state.future.take(state.future.size() - 1),
                    .last_error = {},
                };
            } else {
                auto result = json_patch::apply(state.current, act.steps);
                if (!result) {
                    state.last_error = std::string{to_string(result.error_code)} + " at step " +
                                       std::to_string(result.failed_step) + ": " + result.error_message;
                    return state;
                }
                if (same_node(result.document, state.current)) {
                    state.last_error.clear();
                    return state;  // Only tests ran: nothing to record
                }
                return EditorState{
                    .current    = result.document,
                    .history    = state.history.push_back(state.current),
                    .future     = {},
                    .last_error = {},
                };
            }
        },
        std::move(action));
}

// ============================================================
// Main
// ============================================================

namespace {

void show(const EditorState& state)
{
    std::cout << "document: " << *state.current << "\n";
    std::cout << "history:  " << state.history.size()
              << "  future: " << state.future.size() << "\n";
    if (!state.last_error.empty()) {
        std::cout << "error:    " << state.last_error << "\n";
    }
    std::cout << "\n";
}

} // namespace

int main()
{
    auto loop  = lager::with_manual_event_loop{};
    auto store = lager::make_store<Action>(
        create_initial_state(),
        loop,
        lager::with_reducer(reducer)
    );

    std::cout << "=== JSON Patch Demo ===\n\n";
    show(store.get());

    std::cout << "--- add an item, mark the first done ---\n";
    store.dispatch(ApplyPatch{PatchBuilder()
                                  .add("/items/-", Value::object({{"title", "Ship it"}, {"done", false}}))
                                  .replace("/items/0/done", Value{true})
                                  .steps()});
    show(store.get());

    std::cout << "--- move the owner into the first item ---\n";
    store.dispatch(ApplyPatch{PatchBuilder()
                                  .test("/owner", Value{"chenmou"})
                                  .move("/items/0/owner", "/owner")
                                  .steps()});
    show(store.get());

    std::cout << "--- failing test leaves the document untouched ---\n";
    store.dispatch(ApplyPatch{PatchBuilder()
                                  .remove("/items/1")
                                  .test("/items/0/done", Value{false})
                                  .steps()});
    show(store.get());

    std::cout << "--- undo twice, redo once ---\n";
    store.dispatch(Undo{});
    store.dispatch(Undo{});
    store.dispatch(Redo{});
    show(store.get());

    std::cout << "--- read through a pointer lens ---\n";
    auto title = lager::view(pointer_lens("/items/1/title"), *store.get().current);
    std::cout << "/items/1/title = " << title << "\n";

    return 0;
}

#include "core/mutation.hpp"

#include <type_traits>

namespace trellis {
namespace {

template<class>
inline constexpr bool always_false = false;

std::string parent_text(const std::optional<GlobalId>& parent) {
    return parent.has_value() ? *parent : std::string("<root>");
}

} // namespace

std::string_view op_name(const MutationOp& op) {
    return std::visit([](const auto& o) -> std::string_view {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, ReassignPageClaim>) return "reassign_claim";
        else if constexpr (std::is_same_v<T, RenamePage>) return "rename_page";
        else if constexpr (std::is_same_v<T, RetitleBlock>) return "retitle_block";
        else if constexpr (std::is_same_v<T, ReparentRoot>) return "reparent_root";
        else if constexpr (std::is_same_v<T, CreateBlock>) return "create";
        else if constexpr (std::is_same_v<T, UpdateBlock>) return "update";
        else if constexpr (std::is_same_v<T, MoveBlock>) return "move";
        else if constexpr (std::is_same_v<T, DeleteBlock>) return "delete";
        else static_assert(always_false<T>, "unhandled op");
    }, op);
}

std::string op_target(const MutationOp& op) {
    return std::visit([](const auto& o) -> std::string {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, ReassignPageClaim>) return o.block_id;
        else if constexpr (std::is_same_v<T, RenamePage>) return o.old_title;
        else if constexpr (std::is_same_v<T, RetitleBlock>) return o.block_id;
        else if constexpr (std::is_same_v<T, ReparentRoot>) return o.block_id;
        else if constexpr (std::is_same_v<T, CreateBlock>) return o.global_id;
        else if constexpr (std::is_same_v<T, UpdateBlock>) return o.local_id;
        else if constexpr (std::is_same_v<T, MoveBlock>) return o.local_id;
        else if constexpr (std::is_same_v<T, DeleteBlock>) return o.local_id;
        else static_assert(always_false<T>, "unhandled op");
    }, op);
}

std::string describe(const MutationOp& op) {
    auto head = std::string(op_name(op)) + " " + op_target(op);
    return std::visit([&head](const auto& o) -> std::string {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, ReassignPageClaim>) {
            return head + " samepage=" + o.page_id;
        } else if constexpr (std::is_same_v<T, RenamePage>) {
            return head + " -> \"" + o.new_title + "\"";
        } else if constexpr (std::is_same_v<T, RetitleBlock>) {
            return head + " -> \"" + o.title + "\"";
        } else if constexpr (std::is_same_v<T, ReparentRoot>) {
            return head + " parent=" + o.new_parent_id;
        } else if constexpr (std::is_same_v<T, CreateBlock>) {
            return head + " parent=" + parent_text(o.parent) + " order=" +
                   std::to_string(o.order) + " \"" + o.content + "\"";
        } else if constexpr (std::is_same_v<T, UpdateBlock>) {
            return head + " \"" + o.content + "\"";
        } else if constexpr (std::is_same_v<T, MoveBlock>) {
            return head + " parent=" + parent_text(o.parent) + " order=" + std::to_string(o.order);
        } else {
            return head;
        }
    }, op);
}

} // namespace trellis

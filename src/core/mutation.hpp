#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace trellis {

/**
 * Local tree mutations produced by reconciliation.
 *
 * Parents of created or moved blocks are named by global id because they may
 * be created earlier in the same batch; the executor resolves them when the
 * op runs. An empty optional parent means the container root.
 */

/// Point another page's `samepage::` claim at `page_id` before a rename.
struct ReassignPageClaim {
    LocalId block_id;
    PageId page_id;

    bool operator==(const ReassignPageClaim&) const = default;
};

struct RenamePage {
    std::string old_title;
    std::string new_title;

    bool operator==(const RenamePage&) const = default;
};

/// Title change of a shared block container.
struct RetitleBlock {
    LocalId block_id;
    std::string title;

    bool operator==(const RetitleBlock&) const = default;
};

/// Move a shared block container under a new parent (appended).
struct ReparentRoot {
    LocalId block_id;
    LocalId new_parent_id;

    bool operator==(const ReparentRoot&) const = default;
};

struct CreateBlock {
    GlobalId global_id;
    std::optional<GlobalId> parent;
    std::size_t order{0};
    std::string content;

    bool operator==(const CreateBlock&) const = default;
};

struct UpdateBlock {
    LocalId local_id;
    GlobalId global_id;
    std::string content;

    bool operator==(const UpdateBlock&) const = default;
};

struct MoveBlock {
    LocalId local_id;
    GlobalId global_id;
    std::optional<GlobalId> parent;
    std::size_t order{0};

    bool operator==(const MoveBlock&) const = default;
};

struct DeleteBlock {
    LocalId local_id;

    bool operator==(const DeleteBlock&) const = default;
};

using MutationOp = std::variant<
    ReassignPageClaim,
    RenamePage,
    RetitleBlock,
    ReparentRoot,
    CreateBlock,
    UpdateBlock,
    MoveBlock,
    DeleteBlock
>;

/**
 * Short op name: "rename_page", "create", ...
 */
[[nodiscard]] std::string_view op_name(const MutationOp& op);

/**
 * The id an op acts on (local id, or the global id for creates, or the page
 * title for renames).
 */
[[nodiscard]] std::string op_target(const MutationOp& op);

/**
 * One-line human readable form, used in logs and by trellis_inspect.
 */
[[nodiscard]] std::string describe(const MutationOp& op);

} // namespace trellis

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sync/memory_notebook.hpp"

#include <QByteArray>
#include <QJsonObject>

namespace trellis::sync {

/**
 * Build a shared page in a MemoryNotebook from an outline description:
 *
 *   {"title": "Groceries", "pageId": "<uuid, optional>",
 *    "blocks": [{"content": "milk", "viewType": "numbered",
 *                "collapsed": false, "children": [...]}]}
 *
 * Returns the shared page id (generated when absent).
 */
[[nodiscard]] Result<PageId> load_outline(MemoryNotebook& notebook, const QJsonObject& outline);

[[nodiscard]] Result<PageId> load_outline(MemoryNotebook& notebook, const QByteArray& json);

} // namespace trellis::sync

#pragma once

#include "core/annotation.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <QJsonObject>

namespace trellis::sync {

/**
 * JSON form of a flat document, as exchanged with the collaboration layer
 * and stored in `page_states`:
 *
 *   {"content": "...",
 *    "annotations": [{"type": "block", "start": 5, "end": 9,
 *                     "attributes": {"identifier": "...", "level": 0,
 *                                    "viewType": "bullet"}}, ...]}
 *
 * Offsets are byte offsets into the UTF-8 content.
 */
[[nodiscard]] QJsonObject to_json_object(const doc::FlatDocument& doc);

[[nodiscard]] QByteArray to_json(const doc::FlatDocument& doc, bool indented = false);

/**
 * Parse and validate. Decode on bad JSON or missing fields, MalformedDocument
 * when the annotations break the document invariants.
 */
[[nodiscard]] Result<doc::FlatDocument> from_json_object(const QJsonObject& object);

[[nodiscard]] Result<doc::FlatDocument> from_json(const QByteArray& bytes);

} // namespace trellis::sync

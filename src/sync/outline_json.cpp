#include "sync/outline_json.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace trellis::sync {
namespace {

Result<void> add_blocks(MemoryNotebook& notebook, const LocalId& parent, const QJsonArray& blocks) {
    for (const auto& entry : blocks) {
        if (!entry.isObject()) {
            return Result<void>::err(Error{"Outline block is not an object", ErrorCode::Decode});
        }
        const auto obj = entry.toObject();

        std::optional<ViewType> view;
        if (obj.contains(QStringLiteral("viewType"))) {
            const auto name = obj.value(QStringLiteral("viewType")).toString();
            view = parse_view_type(name.toStdString());
            if (!view.has_value()) {
                return Result<void>::err(
                    Error{"Unknown viewType " + name.toStdString(), ErrorCode::Decode});
            }
        }

        const auto id = notebook.add_block(
            parent, obj.value(QStringLiteral("content")).toString().toStdString(), view);
        if (obj.value(QStringLiteral("collapsed")).toBool()) {
            notebook.set_collapsed(id, true);
        }

        auto nested = add_blocks(notebook, id, obj.value(QStringLiteral("children")).toArray());
        if (nested.is_err()) {
            return nested;
        }
    }
    return Result<void>::ok();
}

} // namespace

Result<PageId> load_outline(MemoryNotebook& notebook, const QJsonObject& outline) {
    const auto title = outline.value(QStringLiteral("title")).toString();
    if (title.isEmpty()) {
        return Result<PageId>::err(Error{"Outline has no title", ErrorCode::Decode});
    }

    PageId page_id = outline.value(QStringLiteral("pageId")).toString().toStdString();
    if (page_id.empty()) {
        page_id = new_global_id();
    } else if (!Uuid::parse(page_id).has_value()) {
        return Result<PageId>::err(Error{"pageId is not a UUID: " + page_id, ErrorCode::Decode});
    }

    const auto page = notebook.add_page(title.toStdString(), page_id);
    auto added = add_blocks(notebook, page, outline.value(QStringLiteral("blocks")).toArray());
    if (added.is_err()) {
        return Result<PageId>::err(added.unwrap_err());
    }
    return Result<PageId>::ok(std::move(page_id));
}

Result<PageId> load_outline(MemoryNotebook& notebook, const QByteArray& json) {
    QJsonParseError err{};
    const auto parsed = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError || !parsed.isObject()) {
        return Result<PageId>::err(
            Error{"Invalid outline JSON: " + err.errorString().toStdString(), ErrorCode::Decode});
    }
    return load_outline(notebook, parsed.object());
}

} // namespace trellis::sync

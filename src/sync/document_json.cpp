#include "sync/document_json.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

#include <cmath>

namespace trellis::sync {
namespace {

QString qstr(const std::string& s) {
    return QString::fromStdString(s);
}

QString qstr(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

QJsonObject attributes_to_json(const doc::Annotation& a) {
    QJsonObject attrs;
    if (const auto* block = a.block()) {
        attrs.insert(QStringLiteral("identifier"), qstr(block->identifier));
        attrs.insert(QStringLiteral("level"), block->level);
        attrs.insert(QStringLiteral("viewType"), qstr(view_type_name(block->view_type)));
    } else if (const auto* metadata = a.metadata()) {
        attrs.insert(QStringLiteral("title"), qstr(metadata->title));
        attrs.insert(QStringLiteral("parent"), qstr(metadata->parent));
    } else if (const auto* link = a.link()) {
        attrs.insert(QStringLiteral("href"), qstr(link->href));
    }
    return attrs;
}

Error decode_error(int index, const QString& why) {
    return Error{"Annotation " + std::to_string(index) + ": " + why.toStdString(),
                 ErrorCode::Decode};
}

// Largest integer a JSON number carries exactly.
constexpr double kMaxOffset = 9007199254740992.0;

// Offsets must be non-negative integers.
bool read_offset(const QJsonObject& obj, const QString& key, std::size_t& out) {
    const auto value = obj.value(key);
    if (!value.isDouble()) {
        return false;
    }
    const double d = value.toDouble();
    if (!(d >= 0 && d <= kMaxOffset) || d != std::floor(d)) {
        return false;
    }
    out = static_cast<std::size_t>(d);
    return true;
}

Result<doc::Annotation> annotation_from_json(int index, const QJsonValue& value) {
    using Out = Result<doc::Annotation>;
    if (!value.isObject()) {
        return Out::err(decode_error(index, QStringLiteral("not an object")));
    }
    const auto obj = value.toObject();

    const auto type_name = obj.value(QStringLiteral("type")).toString();
    if (type_name.isEmpty()) {
        return Out::err(decode_error(index, QStringLiteral("missing type")));
    }

    doc::Annotation a;
    a.type = doc::parse_type(type_name.toStdString());
    if (a.type == doc::AnnotationType::Unknown) {
        a.raw_type = type_name.toStdString();
    }
    if (!read_offset(obj, QStringLiteral("start"), a.start) ||
        !read_offset(obj, QStringLiteral("end"), a.end)) {
        return Out::err(decode_error(index, QStringLiteral("bad start/end")));
    }

    const auto attrs = obj.value(QStringLiteral("attributes")).toObject();
    switch (a.type) {
        case doc::AnnotationType::Block: {
            const auto view_name = attrs.value(QStringLiteral("viewType"))
                                       .toString(QStringLiteral("bullet"));
            auto view = parse_view_type(view_name.toStdString());
            if (!view.has_value()) {
                return Out::err(decode_error(index, QStringLiteral("unknown viewType ") + view_name));
            }
            const auto level = attrs.value(QStringLiteral("level"));
            if (!level.isDouble()) {
                return Out::err(decode_error(index, QStringLiteral("missing level")));
            }
            a.attributes = doc::BlockAttributes{
                attrs.value(QStringLiteral("identifier")).toString().toStdString(),
                level.toInt(),
                *view};
            break;
        }
        case doc::AnnotationType::Metadata:
            a.attributes = doc::MetadataAttributes{
                attrs.value(QStringLiteral("title")).toString().toStdString(),
                attrs.value(QStringLiteral("parent")).toString().toStdString()};
            break;
        case doc::AnnotationType::Link:
            a.attributes = doc::LinkAttributes{
                attrs.value(QStringLiteral("href")).toString().toStdString()};
            break;
        default:
            break;
    }
    return Out::ok(std::move(a));
}

} // namespace

QJsonObject to_json_object(const doc::FlatDocument& doc) {
    QJsonArray annotations;
    for (const auto& a : doc.annotations) {
        QJsonObject obj;
        obj.insert(QStringLiteral("type"), qstr(a.wire_type()));
        obj.insert(QStringLiteral("start"), static_cast<qint64>(a.start));
        obj.insert(QStringLiteral("end"), static_cast<qint64>(a.end));
        const auto attrs = attributes_to_json(a);
        if (!attrs.isEmpty()) {
            obj.insert(QStringLiteral("attributes"), attrs);
        }
        annotations.append(obj);
    }

    QJsonObject root;
    root.insert(QStringLiteral("content"), qstr(doc.content));
    root.insert(QStringLiteral("annotations"), annotations);
    return root;
}

QByteArray to_json(const doc::FlatDocument& doc, bool indented) {
    return QJsonDocument(to_json_object(doc))
        .toJson(indented ? QJsonDocument::Indented : QJsonDocument::Compact);
}

Result<doc::FlatDocument> from_json_object(const QJsonObject& object) {
    using Out = Result<doc::FlatDocument>;

    const auto content = object.value(QStringLiteral("content"));
    if (!content.isString()) {
        return Out::err(Error{"Document has no content string", ErrorCode::Decode});
    }
    const auto annotations = object.value(QStringLiteral("annotations"));
    if (!annotations.isArray() && !annotations.isUndefined()) {
        return Out::err(Error{"Document annotations is not an array", ErrorCode::Decode});
    }

    doc::FlatDocument doc;
    doc.content = content.toString().toStdString();

    const auto array = annotations.toArray();
    for (int i = 0; i < array.size(); ++i) {
        auto a = annotation_from_json(i, array.at(i));
        if (a.is_err()) {
            return Out::err(a.unwrap_err());
        }
        doc.annotations.push_back(std::move(a).unwrap());
    }

    auto valid = doc::validate(doc);
    if (valid.is_err()) {
        return Out::err(valid.unwrap_err());
    }
    return Out::ok(std::move(doc));
}

Result<doc::FlatDocument> from_json(const QByteArray& bytes) {
    QJsonParseError err{};
    const auto json = QJsonDocument::fromJson(bytes, &err);
    if (err.error != QJsonParseError::NoError) {
        return Result<doc::FlatDocument>::err(Error{
            "Invalid document JSON: " + err.errorString().toStdString() + " at offset " +
                std::to_string(err.offset),
            ErrorCode::Decode});
    }
    if (!json.isObject()) {
        return Result<doc::FlatDocument>::err(
            Error{"Document JSON is not an object", ErrorCode::Decode});
    }
    return from_json_object(json.object());
}

} // namespace trellis::sync

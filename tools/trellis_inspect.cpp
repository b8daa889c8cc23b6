#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

#include "core/document_encoder.hpp"
#include "core/inline_markup.hpp"
#include "core/tree_reconciler.hpp"
#include "core/mutation.hpp"
#include "sync/document_json.hpp"
#include "sync/logging.hpp"
#include "sync/memory_notebook.hpp"
#include "sync/outline_json.hpp"
#include "sync/sqlite_stores.hpp"
#include "sync/sync_settings.hpp"

namespace {

using namespace trellis;

int fail(const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n');
    return 1;
}

int fail(const Error& error) {
    return fail(QStringLiteral("error (%1): %2")
                    .arg(QString::fromLatin1(error_code_name(error.code).data()),
                         QString::fromStdString(error.message)));
}

Result<QByteArray> read_file(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<QByteArray>::err(Error{
            "Cannot read " + path.toStdString() + ": " + file.errorString().toStdString(),
            ErrorCode::Decode});
    }
    return Result<QByteArray>::ok(file.readAll());
}

QJsonArray plan_to_json(const tree::ReconcilePlan& plan) {
    QJsonArray ops;
    for (const auto& op : plan.ops) {
        QJsonObject entry;
        entry.insert(QStringLiteral("op"), QString::fromLatin1(op_name(op).data()));
        entry.insert(QStringLiteral("target"), QString::fromStdString(op_target(op)));
        entry.insert(QStringLiteral("summary"), QString::fromStdString(describe(op)));
        ops.append(entry);
    }
    return ops;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("trellis_inspect");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Trellis");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Inspect page sync: encode an outline, or plan/apply a document against it."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Id mapping database (default: in-memory)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption graphOption(
        QStringList{QStringLiteral("graph")},
        QStringLiteral("Graph name for stored page state (default from settings)."),
        QStringLiteral("name"));
    parser.addOption(graphOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for commands that support it)."));
    parser.addOption(jsonOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets TRELLIS_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Also append log messages to <path>."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("encode <outline.json> | plan <outline.json> "
                                                "<document.json> | apply <outline.json> "
                                                "<document.json>"));
    parser.process(app);

    if (parser.isSet(debugSyncOption)) {
        qputenv("TRELLIS_DEBUG_SYNC", "1");
    }
    if (parser.isSet(logFileOption)) {
        const auto logPath = parser.value(logFileOption);
        if (!trellis::sync::install_file_logging(logPath)) {
            return fail(QStringLiteral("cannot log to ") + logPath);
        }
    }

    const auto positional = parser.positionalArguments();
    if (positional.size() < 2) {
        parser.showHelp(1);
    }
    const auto command = positional.at(0);
    const bool wants_document = command == QStringLiteral("plan") ||
                                command == QStringLiteral("apply");
    if (command != QStringLiteral("encode") && !wants_document) {
        return fail(QStringLiteral("unknown command: ") + command);
    }
    if (wants_document && positional.size() < 3) {
        return fail(command + QStringLiteral(" needs an outline and a document"));
    }

    const auto settings = sync::SyncSettings::load();
    const auto graph = parser.isSet(graphOption) ? parser.value(graphOption) : settings.graph_name;
    auto stores = parser.isSet(dbPathOption)
        ? sync::SqliteStores::open(parser.value(dbPathOption).toStdString(), graph.toStdString())
        : sync::SqliteStores::open_memory(graph.toStdString());
    if (stores.is_err()) {
        return fail(stores.unwrap_err());
    }
    auto& store = *stores.unwrap();

    auto outline = read_file(positional.at(1));
    if (outline.is_err()) {
        return fail(outline.unwrap_err());
    }
    sync::MemoryNotebook notebook;
    auto page = sync::load_outline(notebook, outline.unwrap());
    if (page.is_err()) {
        return fail(page.unwrap_err());
    }
    const auto& page_id = page.unwrap();

    doc::MarkdownInlineCodec codec;
    SyncContext ctx(notebook, store.ids(), store.states(), codec);
    ctx.open();

    QTextStream out(stdout);

    if (command == QStringLiteral("encode")) {
        auto encoded = doc::encode(ctx, page_id);
        if (encoded.is_err()) {
            return fail(encoded.unwrap_err());
        }
        out << sync::to_json(encoded.unwrap(), true);
        return 0;
    }

    // Ids of the outline must be known before a document can refer to them.
    auto baseline = doc::encode(ctx, page_id);
    if (baseline.is_err()) {
        return fail(baseline.unwrap_err());
    }

    auto document_bytes = read_file(positional.at(2));
    if (document_bytes.is_err()) {
        return fail(document_bytes.unwrap_err());
    }
    auto document = sync::from_json(document_bytes.unwrap());
    if (document.is_err()) {
        return fail(document.unwrap_err());
    }

    if (command == QStringLiteral("plan")) {
        auto planned = tree::plan(ctx, page_id, document.unwrap());
        if (planned.is_err()) {
            return fail(planned.unwrap_err());
        }
        if (parser.isSet(jsonOption)) {
            out << QJsonDocument(plan_to_json(planned.unwrap())).toJson(QJsonDocument::Indented);
        } else {
            for (const auto& op : planned.unwrap().ops) {
                out << QString::fromStdString(describe(op)) << QLatin1Char('\n');
            }
        }
        return 0;
    }

    auto applied = tree::reconcile(ctx, page_id, document.unwrap());
    if (applied.is_err()) {
        return fail(applied.unwrap_err());
    }
    auto page_info = notebook.find_page(page_id);
    if (page_info.is_err()) {
        return fail(page_info.unwrap_err());
    }
    const auto page_name = page_info.unwrap() ? page_info.unwrap()->original_name : std::string{};
    out << QStringLiteral("applied %1 ops\n").arg(applied.unwrap())
        << QString::fromStdString(notebook.outline(page_name));
    return 0;
}

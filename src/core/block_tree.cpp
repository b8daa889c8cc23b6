#include "core/block_tree.hpp"

#include <regex>

namespace trellis::tree {
namespace {

void flatten_into(const std::vector<const BlockNode*>& nodes,
                  const LocalId& parent_id,
                  std::vector<FlatEntry>& out) {
    for (std::size_t order = 0; order < nodes.size(); ++order) {
        const auto& node = *nodes[order];
        out.push_back(FlatEntry{
            .id = node.id,
            .content = node.content,
            .view_type = node.view_type,
            .order = order,
            .parent_id = parent_id,
        });
        flatten_into(expanded_children(node), node.id, out);
    }
}

// Removes the first match of `re` from `text`.
std::string erase_first(const std::string& text, const std::regex& re) {
    std::smatch m;
    if (!std::regex_search(text, m, re)) {
        return text;
    }
    return text.substr(0, static_cast<std::size_t>(m.position(0))) +
           text.substr(static_cast<std::size_t>(m.position(0) + m.length(0)));
}

} // namespace

std::vector<FlatEntry> flatten(const std::vector<BlockNode>& roots, const LocalId& root_parent_id) {
    std::vector<const BlockNode*> top;
    top.reserve(roots.size());
    for (const auto& r : roots) {
        top.push_back(&r);
    }

    std::vector<FlatEntry> out;
    flatten_into(top, root_parent_id, out);
    return out;
}

std::vector<const BlockNode*> expanded_children(const BlockNode& node) {
    std::vector<const BlockNode*> out;
    out.reserve(node.children.size());
    for (const auto& child : node.children) {
        if (const auto* expanded = std::get_if<BlockNode>(&child)) {
            out.push_back(expanded);
        }
    }
    return out;
}

std::string strip_property_lines(std::string_view content) {
    static const std::regex property_line(R"([a-z]+:: [^\n]+\n?)");
    return std::regex_replace(std::string(content), property_line, "");
}

std::map<std::string, std::string> parse_properties(std::string_view content) {
    static const std::regex property_line(R"(([a-z]+):: ([^\n]+))");
    std::map<std::string, std::string> out;
    std::size_t begin = 0;
    while (begin <= content.size()) {
        auto end = content.find('\n', begin);
        if (end == std::string_view::npos) {
            end = content.size();
        }
        const std::string line(content.substr(begin, end - begin));
        std::smatch m;
        if (std::regex_match(line, m, property_line)) {
            out.emplace(m[1].str(), m[2].str());
        }
        begin = end + 1;
    }
    return out;
}

std::string with_property(std::string_view content, const std::string& key, const std::string& value) {
    const std::regex existing("(^|\n)" + key + ":: [^\n]*");
    std::string text(content);
    std::smatch m;
    if (std::regex_search(text, m, existing)) {
        return m.prefix().str() + m[1].str() + key + ":: " + value + m.suffix().str();
    }
    return text + "\n" + key + ":: " + value;
}

bool is_content_block(const BlockNode& node) {
    return node.content.empty() || !strip_property_lines(node.content).empty();
}

std::vector<BlockNode> content_blocks(std::vector<BlockNode> nodes) {
    std::vector<BlockNode> out;
    out.reserve(nodes.size());
    for (auto& n : nodes) {
        if (is_content_block(n)) {
            out.push_back(std::move(n));
        }
    }
    return out;
}

std::string strip_sync_properties(std::string_view content, const LocalId& own_id) {
    static const std::regex title_line(R"(\ntitle:: [^\n]+)");
    static const std::regex samepage_line(
        R"(\nsamepage:: [0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12})");

    std::string text(content);
    if (!own_id.empty()) {
        const std::string id_line = "\nid:: " + own_id;
        if (const auto pos = text.find(id_line); pos != std::string::npos) {
            text.erase(pos, id_line.size());
        }
    }
    text = erase_first(text, title_line);
    text = erase_first(text, samepage_line);

    if (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    return text;
}

} // namespace trellis::tree

#include <litedoc-cpp/stats.hpp>

#include <algorithm>
#include <cstddef>

namespace litedoc_cpp {

namespace {

class StatsCollector {
public:
    explicit StatsCollector(DocumentStats& stats) : stats_{stats} {}

    void blocks(const Blocks& nodes, std::size_t depth) {
        for (const auto& node : nodes) block(node, depth);
    }

private:
    void block(const Block& node, std::size_t depth) {
        ++stats_.total_blocks;
        ++stats_.blocks_by_kind[static_cast<std::size_t>(node.kind())];
        stats_.max_depth = std::max(stats_.max_depth, depth);

        std::visit(overload{
            [&](const Heading& n) { inlines(n.content); },
            [&](const Paragraph& n) { inlines(n.content); },
            [&](const List& n) {
                for (const auto& item : n.items) {
                    ++stats_.list_items;
                    blocks(item.blocks, depth + 1);
                }
            },
            [&](const Callout& n) { blocks(n.blocks, depth + 1); },
            [&](const Quote& n) { blocks(n.blocks, depth + 1); },
            [&](const Figure& n) {
                if (n.caption) inlines(*n.caption);
                blocks(n.blocks, depth + 1);
            },
            [&](const Table& n) {
                for (const auto& row : n.rows) {
                    ++stats_.table_rows;
                    for (const auto& cell : row.cells) inlines(cell.content);
                }
            },
            [&](const Footnotes& n) {
                for (const auto& def : n.defs) {
                    ++stats_.footnote_defs;
                    blocks(def.blocks, depth + 1);
                }
            },
            [](const auto&) {},
        }, node.inner);
    }

    void inlines(const Inlines& nodes) {
        for (const auto& node : nodes) {
            ++stats_.total_inlines;
            ++stats_.inlines_by_kind[static_cast<std::size_t>(node.kind())];
            if (const auto* children = node.children()) inlines(*children);
        }
    }

    DocumentStats& stats_;
};

auto is_word_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

}  // namespace

auto compute_stats(const Document& doc, std::string_view source) -> DocumentStats {
    auto stats = DocumentStats{};
    StatsCollector{stats}.blocks(doc.blocks, 1);
    stats.metadata_entries = doc.metadata ? doc.metadata->size() : 0;

    stats.bytes = source.size();
    auto in_word = false;
    for (auto c : source) {
        if (is_word_space(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++stats.words;
        }
    }
    if (!source.empty()) {
        stats.lines = static_cast<std::size_t>(std::ranges::count(source, '\n'));
        if (source.back() != '\n') ++stats.lines;
    }
    return stats;
}

}  // namespace litedoc_cpp

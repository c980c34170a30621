#include "inline_parser.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace litedoc_cpp::detail {

namespace {

constexpr auto is_whitespace(char c) noexcept -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// Characters that may start an inline construct. Everything else is
// consumed in bulk as literal text.
constexpr auto is_special(char c) noexcept -> bool {
    switch (c) {
        case '\\': case '`': case '*': case '~':
        case '[': case '<': case '\n': case 'h':
            return true;
        default:
            return false;
    }
}

auto is_uri_char(char c) -> bool {
    if (is_ascii_alnum(c)) return true;
    switch (c) {
        case '-': case '.': case '_': case '~': case ':': case '/':
        case '?': case '#': case '@': case '!': case '$': case '&':
        case '\'': case '(': case ')': case '+': case ',': case ';':
        case '=': case '%':
            return true;
        default:
            return false;
    }
}

auto is_trailing_punct(char c) -> bool {
    switch (c) {
        case '.': case ',': case ':': case ';': case '!': case '?':
        case '\'': case '"':
            return true;
        default:
            return false;
    }
}

// scheme "://" rest, or mailto:rest. No whitespace or '<' anywhere.
auto is_absolute_uri(std::string_view s) -> bool {
    if (s.empty()) return false;
    if (std::ranges::any_of(s, [](char c) { return is_whitespace(c) || c == '<'; })) {
        return false;
    }
    if (s.starts_with("mailto:")) return s.size() > 7;
    auto sep = s.find("://");
    if (sep == std::string_view::npos || sep == 0 || sep + 3 >= s.size()) return false;
    if (!is_ascii_alpha(s[0])) return false;
    return std::ranges::all_of(s.substr(1, sep - 1), [](char c) {
        return is_ascii_alnum(c) || c == '+' || c == '.' || c == '-';
    });
}

// Longest link label and destination searched for a closing bracket.
constexpr auto max_link_label = std::size_t{1000};
constexpr auto max_link_destination = std::size_t{2048};

class InlineParser {
public:
    InlineParser(const SourceText& src, std::size_t begin, std::size_t end,
                 const InlineOptions& options, std::size_t depth)
        : src_{src}, text_{src.text()}, begin_{begin}, end_{end},
          pos_{begin}, options_{options}, depth_{depth} {}

    auto run() -> Inlines {
        while (pos_ < end_) {
            auto handled = false;
            switch (text_[pos_]) {
                case '\\': handled = try_escape(); break;
                case '`':  handled = try_code_span(); break;
                case '*':  handled = try_delimiter_run('*'); break;
                case '~':  handled = options_.strikethrough && try_delimiter_run('~'); break;
                case '[':  handled = try_bracket(); break;
                case '<':  handled = try_angle_autolink(); break;
                case '\n': handled = try_line_break(); break;
                case 'h':  handled = options_.bare_autolinks && try_bare_autolink(); break;
                default:   break;
            }
            if (!handled) consume_literal();
        }
        flush_text();
        merge_adjacent_text(nodes_);
        return std::move(nodes_);
    }

private:
    struct Opener {
        char marker;
        std::size_t size;
        std::size_t node_index;  // index of the marker's Text node
        std::size_t pos;         // logical position of the marker
    };

    struct Pending {
        std::string text;
        std::size_t begin{0};
        std::size_t end{0};
        bool active{false};
    };

    // -- Text accumulation ----------------------------------------------------

    void add_text(std::size_t b, std::size_t e, std::string_view content) {
        if (pending_.active && pending_.end == b) {
            pending_.text.append(content);
            pending_.end = e;
            return;
        }
        flush_text();
        pending_ = Pending{std::string{content}, b, e, true};
    }

    void flush_text() {
        if (!pending_.active) return;
        nodes_.push_back(Inline{Text{std::move(pending_.text),
                                     src_.span_of(pending_.begin, pending_.end)}});
        pending_ = Pending{};
    }

    void push(Inline node) {
        flush_text();
        nodes_.push_back(std::move(node));
    }

    void consume_literal() {
        auto start = pos_++;
        while (pos_ < end_ && !is_special(text_[pos_])) ++pos_;
        add_text(start, pos_, text_.substr(start, pos_ - start));
    }

    auto parse_label(std::size_t b, std::size_t e) const -> Inlines {
        if (b >= e) return {};
        if (depth_ + 1 >= options_.max_depth) {
            return Inlines{Inline{Text{std::string{text_.substr(b, e - b)}, src_.span_of(b, e)}}};
        }
        return InlineParser{src_, b, e, options_, depth_ + 1}.run();
    }

    // -- Escapes and breaks ---------------------------------------------------

    auto try_escape() -> bool {
        if (pos_ + 1 >= end_) return false;
        auto next = text_[pos_ + 1];
        if (next == '\n') {
            push(Inline{HardBreak{src_.span_of(pos_, pos_ + 2)}});
            pos_ += 2;
            skip_indent();
            return true;
        }
        if (is_ascii_punct(next)) {
            add_text(pos_, pos_ + 2, text_.substr(pos_ + 1, 1));
            pos_ += 2;
            return true;
        }
        return false;
    }

    auto try_line_break() -> bool {
        auto nl = pos_;
        auto ws = nl;
        while (ws > begin_ && (text_[ws - 1] == ' ' || text_[ws - 1] == '\t')) --ws;
        auto hard = (nl - ws) >= 2;

        // Trailing whitespace never ends up in a Text node.
        if (pending_.active && pending_.end == nl) {
            auto cut = std::max(ws, pending_.begin);
            pending_.text.resize(pending_.text.size() - (nl - cut));
            pending_.end = cut;
            if (pending_.begin == pending_.end) pending_ = Pending{};
        }

        if (hard) {
            push(Inline{HardBreak{src_.span_of(ws, nl + 1)}});
        } else {
            push(Inline{SoftBreak{src_.span_of(nl, nl + 1)}});
        }
        pos_ = nl + 1;
        skip_indent();
        return true;
    }

    void skip_indent() {
        while (pos_ < end_ && (text_[pos_] == ' ' || text_[pos_] == '\t')) ++pos_;
    }

    // -- Code spans -----------------------------------------------------------

    auto try_code_span() -> bool {
        auto start = pos_;
        auto open_end = start;
        while (open_end < end_ && text_[open_end] == '`') ++open_end;
        auto ticks = open_end - start;

        auto missing = no_closing_run_from_.find(ticks);
        auto scan = missing == no_closing_run_from_.end() || start < missing->second;
        for (auto k = open_end; scan && k < end_;) {
            if (text_[k] != '`') {
                ++k;
                continue;
            }
            auto m = k;
            while (m < end_ && text_[m] == '`') ++m;
            if (m - k == ticks) {
                auto content = std::string{text_.substr(open_end, k - open_end)};
                std::ranges::replace(content, '\n', ' ');
                if (content.size() >= 2 && content.front() == ' ' && content.back() == ' ' &&
                    content.find_first_not_of(' ') != std::string::npos) {
                    content = content.substr(1, content.size() - 2);
                }
                push(Inline{CodeSpan{std::move(content), src_.span_of(start, m)}});
                pos_ = m;
                return true;
            }
            k = m;
        }

        // No closing run of the same length: the backticks are literal, and
        // so is every later run of this length.
        if (scan) no_closing_run_from_[ticks] = start;
        add_text(start, open_end, text_.substr(start, ticks));
        pos_ = open_end;
        return true;
    }

    // -- Emphasis, strong, strikethrough --------------------------------------

    auto find_opener(char marker) const -> std::optional<std::size_t> {
        for (auto i = openers_.size(); i > 0; --i) {
            if (openers_[i - 1].marker == marker) return i - 1;
        }
        return std::nullopt;
    }

    void close_opener(std::size_t index, std::size_t close_end) {
        flush_text();
        auto op = openers_[index];

        auto children = Inlines{};
        children.reserve(nodes_.size() - op.node_index - 1);
        for (auto i = op.node_index + 1; i < nodes_.size(); ++i) {
            children.push_back(std::move(nodes_[i]));
        }
        merge_adjacent_text(children);
        nodes_.erase(nodes_.begin() + static_cast<std::ptrdiff_t>(op.node_index), nodes_.end());

        auto span = src_.span_of(op.pos, close_end);
        if (op.marker == '~') {
            nodes_.push_back(Inline{Strikethrough{std::move(children), span}});
        } else if (op.size == 2) {
            nodes_.push_back(Inline{Strong{std::move(children), span}});
        } else {
            nodes_.push_back(Inline{Emphasis{std::move(children), span}});
        }
        // Openers above the matched one can no longer close: they stay text.
        openers_.erase(openers_.begin() + static_cast<std::ptrdiff_t>(index), openers_.end());
    }

    auto try_delimiter_run(char marker) -> bool {
        auto start = pos_;
        auto run_end = start;
        while (run_end < end_ && text_[run_end] == marker) ++run_end;
        auto length = run_end - start;
        pos_ = run_end;

        if (marker == '~' && length != 2) {
            add_text(start, run_end, text_.substr(start, length));
            return true;
        }

        auto prev = start > begin_ ? text_[start - 1] : ' ';
        auto next = run_end < end_ ? text_[run_end] : ' ';
        auto can_open = !is_whitespace(next);
        auto can_close = !is_whitespace(prev);

        auto at = start;
        auto remaining = length;
        if (can_close) {
            while (remaining > 0) {
                auto index = find_opener(marker);
                if (!index || openers_[*index].size > remaining) break;
                auto size = openers_[*index].size;
                close_opener(*index, at + size);
                at += size;
                remaining -= size;
            }
        }

        if (remaining == 0) return true;

        if (!can_open) {
            add_text(at, at + remaining, text_.substr(at, remaining));
            return true;
        }

        flush_text();
        while (remaining > 0) {
            auto size = std::size_t{remaining >= 2 ? 2u : 1u};
            nodes_.push_back(Inline{Text{std::string(size, marker), src_.span_of(at, at + size)}});
            openers_.push_back(Opener{marker, size, nodes_.size() - 1, at});
            at += size;
            remaining -= size;
        }
        return true;
    }

    // -- Links and references -------------------------------------------------

    auto try_bracket() -> bool {
        if (pos_ + 1 < end_) {
            auto next = text_[pos_ + 1];
            if (next == '[' && options_.wiki_links && try_wiki_link()) return true;
            if (next == '^' && options_.footnote_refs && try_footnote_ref()) return true;
        }
        return try_markdown_link();
    }

    // [[destination]] or [[label|destination]]
    auto try_wiki_link() -> bool {
        auto inner_begin = pos_ + 2;
        auto close = std::string_view::npos;
        for (auto k = inner_begin; k + 1 < end_; ++k) {
            if (text_[k] == '\n') return false;
            if (text_[k] == '[' && text_[k + 1] == '[') return false;
            if (text_[k] == ']' && text_[k + 1] == ']') {
                close = k;
                break;
            }
        }
        if (close == std::string_view::npos) return false;
        auto inner = text_.substr(inner_begin, close - inner_begin);

        auto pipe = inner.find('|');
        auto label_b = inner_begin;
        auto label_e = pipe == std::string_view::npos ? close : inner_begin + pipe;
        auto dest_b = pipe == std::string_view::npos ? inner_begin : inner_begin + pipe + 1;
        auto destination = trim(text_.substr(dest_b, close - dest_b));
        if (destination.empty()) return false;

        while (label_b < label_e && is_space(text_[label_b])) ++label_b;
        while (label_e > label_b && is_space(text_[label_e - 1])) --label_e;
        if (label_b == label_e) {
            label_b = dest_b;
            label_e = close;
            while (label_b < label_e && is_space(text_[label_b])) ++label_b;
            while (label_e > label_b && is_space(text_[label_e - 1])) --label_e;
        }

        auto label = parse_label(label_b, label_e);
        push(Inline{Link{std::move(label), std::string{destination},
                         src_.span_of(pos_, close + 2)}});
        pos_ = close + 2;
        return true;
    }

    auto try_footnote_ref() -> bool {
        auto id_begin = pos_ + 2;
        auto k = id_begin;
        while (k < end_ && text_[k] != ']') {
            if (is_whitespace(text_[k]) || text_[k] == '[') return false;
            ++k;
        }
        if (k >= end_ || k == id_begin) return false;
        push(Inline{FootnoteRef{std::string{text_.substr(id_begin, k - id_begin)},
                                src_.span_of(pos_, k + 1)}});
        pos_ = k + 1;
        return true;
    }

    // [label](destination)
    auto try_markdown_link() -> bool {
        auto nesting = 0;
        auto k = pos_ + 1;
        auto label_end = std::min(end_, k + max_link_label);
        for (; k < label_end; ++k) {
            auto c = text_[k];
            if (c == '\\') {
                ++k;
            } else if (c == '[') {
                ++nesting;
            } else if (c == ']') {
                if (nesting == 0) break;
                --nesting;
            }
        }
        if (k >= label_end || k + 1 >= end_ || text_[k] != ']' || text_[k + 1] != '(') {
            return false;
        }

        // ( spaces destination spaces )
        auto dest_begin = k + 2;
        auto limit = std::min(end_, dest_begin + max_link_destination);
        auto d = dest_begin;
        while (d < limit && is_space(text_[d])) ++d;
        auto dest_b = d;
        while (d < limit && text_[d] != ')' && !is_whitespace(text_[d])) ++d;
        auto dest_e = d;
        while (d < limit && is_space(text_[d])) ++d;
        if (d >= limit || text_[d] != ')' || dest_b == dest_e) return false;
        auto close = d;
        auto destination = text_.substr(dest_b, dest_e - dest_b);

        auto label = parse_label(pos_ + 1, k);
        push(Inline{Link{std::move(label), std::string{destination},
                         src_.span_of(pos_, close + 1)}});
        pos_ = close + 1;
        return true;
    }

    auto try_angle_autolink() -> bool {
        auto close = pos_ + 1;
        while (close < end_ && text_[close] != '>') {
            if (is_whitespace(text_[close]) || text_[close] == '<') return false;
            ++close;
        }
        if (close >= end_) return false;
        auto url = text_.substr(pos_ + 1, close - pos_ - 1);
        if (!is_absolute_uri(url)) return false;
        push(Inline{AutoLink{std::string{url}, src_.span_of(pos_, close + 1)}});
        pos_ = close + 1;
        return true;
    }

    auto try_bare_autolink() -> bool {
        if (pos_ > begin_ && is_ascii_alnum(text_[pos_ - 1])) return false;
        auto rest = text_.substr(pos_, end_ - pos_);
        auto scheme = rest.starts_with("https://") ? std::size_t{8}
                    : rest.starts_with("http://")  ? std::size_t{7}
                                                   : std::size_t{0};
        if (scheme == 0) return false;

        auto body = pos_ + scheme;
        auto k = body;
        while (k < end_ && is_uri_char(text_[k])) ++k;
        while (k > body) {
            auto last = text_[k - 1];
            if (is_trailing_punct(last)) {
                --k;
                continue;
            }
            if (last == ')') {
                auto url = text_.substr(pos_, k - pos_);
                if (std::ranges::count(url, ')') > std::ranges::count(url, '(')) {
                    --k;
                    continue;
                }
            }
            break;
        }
        if (k == body) return false;

        push(Inline{AutoLink{std::string{text_.substr(pos_, k - pos_)}, src_.span_of(pos_, k)}});
        pos_ = k;
        return true;
    }

    const SourceText& src_;
    std::string_view text_;
    std::size_t begin_;
    std::size_t end_;
    std::size_t pos_;
    const InlineOptions& options_;
    std::size_t depth_;

    Inlines nodes_;
    std::vector<Opener> openers_;
    std::unordered_map<std::size_t, std::size_t> no_closing_run_from_;  ///< ticks -> start
    Pending pending_;
};

}  // namespace

void merge_adjacent_text(Inlines& nodes) {
    auto merged = Inlines{};
    merged.reserve(nodes.size());
    for (auto& node : nodes) {
        if (!merged.empty()) {
            auto* prev = std::get_if<Text>(&merged.back().inner);
            const auto* cur = std::get_if<Text>(&node.inner);
            if (prev && cur && prev->span.end == cur->span.start) {
                prev->content += cur->content;
                prev->span.end = cur->span.end;
                continue;
            }
        }
        merged.push_back(std::move(node));
    }
    nodes = std::move(merged);
}

auto parse_inlines(const SourceText& src, const InlineOptions& options) -> Inlines {
    if (src.empty()) return {};
    return InlineParser{src, 0, src.size(), options, 0}.run();
}

}  // namespace litedoc_cpp::detail

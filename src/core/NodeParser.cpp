#include "pathviz/core/NodeParser.h"

#include <cctype>
#include <charconv>
#include <limits>
#include <optional>

namespace pathviz {

namespace {

std::string_view trim(std::string_view text) {
    size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::optional<std::int64_t> parseInteger(std::string_view text) {
    text = trim(text);
    if (text.empty()) return std::nullopt;

    // from_chars rejects a leading '+'
    if (text.front() == '+') {
        text.remove_prefix(1);
        if (text.empty() || text.front() == '-') return std::nullopt;
    }

    std::int64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::optional<GridCell> parseCell(std::string_view text) {
    if (text.size() < 2 || text.front() != '(' || text.back() != ')') {
        return std::nullopt;
    }
    std::string_view inner = text.substr(1, text.size() - 2);
    size_t comma = inner.find(',');
    if (comma == std::string_view::npos) return std::nullopt;

    auto row = parseInteger(inner.substr(0, comma));
    auto col = parseInteger(inner.substr(comma + 1));
    if (!row || !col) return std::nullopt;

    constexpr auto lo = std::numeric_limits<int>::min();
    constexpr auto hi = std::numeric_limits<int>::max();
    if (*row < lo || *row > hi || *col < lo || *col > hi) {
        return std::nullopt;
    }
    return GridCell{static_cast<int>(*row), static_cast<int>(*col)};
}

std::optional<std::string> parseQuoted(std::string_view text) {
    if (text.size() < 2) return std::nullopt;
    char quote = text.front();
    if ((quote != '\'' && quote != '"') || text.back() != quote) {
        return std::nullopt;
    }
    std::string_view inner = text.substr(1, text.size() - 2);
    if (inner.find(quote) != std::string_view::npos) {
        return std::nullopt;
    }
    return std::string(inner);
}

}  // namespace

NodeKey parseNodeKey(std::string_view text) {
    std::string_view trimmed = trim(text);

    if (auto value = parseInteger(trimmed)) {
        return NodeKey{*value};
    }
    if (auto cell = parseCell(trimmed)) {
        return NodeKey{*cell};
    }
    if (auto name = parseQuoted(trimmed)) {
        return NodeKey{std::move(*name)};
    }
    return NodeKey{std::string(trimmed)};
}

}  // namespace pathviz

#include "lexer/source.hpp"

#include <algorithm>

namespace semdiff::lexer {

Source::Source(std::string filename, std::string content)
    : filename_(std::move(filename)), content_(std::move(content)) {
    build_line_index();
}

void Source::build_line_index() {
    line_offsets_.assign(1, 0);
    std::string_view text = content_;
    for (size_t nl = text.find('\n'); nl != std::string_view::npos; nl = text.find('\n', nl + 1)) {
        line_offsets_.push_back(nl + 1);
    }
}

auto Source::at(size_t offset) const -> char {
    return offset < content_.size() ? content_[offset] : '\0';
}

auto Source::slice(size_t start, size_t end) const -> std::string_view {
    if (start >= content_.size() || end <= start) {
        return {};
    }
    return std::string_view(content_).substr(start, std::min(end, content_.size()) - start);
}

auto Source::location(size_t offset) const -> SourceLocation {
    // Last line start that is <= offset.
    auto it = std::partition_point(line_offsets_.begin(), line_offsets_.end(),
                                   [offset](size_t start) { return start <= offset; });
    auto line_index = static_cast<size_t>(std::distance(line_offsets_.begin(), it)) - 1;

    return SourceLocation{.file = filename_,
                          .line = static_cast<uint32_t>(line_index + 1),
                          .column = static_cast<uint32_t>(offset - line_offsets_[line_index] + 1),
                          .offset = static_cast<uint32_t>(offset),
                          .length = 1};
}

auto Source::line(uint32_t line_num) const -> std::string_view {
    if (line_num == 0 || line_num > line_offsets_.size()) {
        return {};
    }
    size_t start = line_offsets_[line_num - 1];
    size_t end = line_num < line_offsets_.size() ? line_offsets_[line_num] : content_.size();

    std::string_view text = std::string_view(content_).substr(start, end - start);
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}

auto Source::line_count() const -> uint32_t {
    return static_cast<uint32_t>(line_offsets_.size());
}

auto Source::from_string(std::string content, std::string name) -> Source {
    return Source(std::move(name), std::move(content));
}

} // namespace semdiff::lexer

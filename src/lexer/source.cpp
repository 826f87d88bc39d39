#include "lexer/source.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace pystruct::lexer {

Source::Source(std::string filename, std::string content)
    : filename_(std::move(filename)), content_(std::move(content)) {
    build_line_index();
}

void Source::build_line_index() {
    line_offsets_.clear();
    line_offsets_.push_back(0);

    // "\r\n", "\n" and a lone "\r" all terminate a line.
    for (size_t i = 0; i < content_.size(); ++i) {
        if (content_[i] == '\n') {
            line_offsets_.push_back(i + 1);
        } else if (content_[i] == '\r' && (i + 1 >= content_.size() || content_[i + 1] != '\n')) {
            line_offsets_.push_back(i + 1);
        }
    }
}

auto Source::at(size_t offset) const -> char {
    if (offset >= content_.size()) {
        return '\0';
    }
    return content_[offset];
}

auto Source::slice(size_t start, size_t end) const -> std::string_view {
    if (start >= content_.size() || end <= start) {
        return {};
    }
    end = std::min(end, content_.size());
    return std::string_view(content_).substr(start, end - start);
}

auto Source::location(size_t offset) const -> SourceLocation {
    auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
    if (it != line_offsets_.begin()) {
        --it;
    }

    auto line_index = static_cast<uint32_t>(std::distance(line_offsets_.begin(), it));
    auto column = static_cast<uint32_t>(offset - *it);

    return SourceLocation{.line = line_index + 1,
                          .column = column + 1,
                          .offset = static_cast<uint32_t>(offset),
                          .length = 1};
}

auto Source::line_start(uint32_t line_num) const -> size_t {
    if (line_num == 0) {
        return 0;
    }
    if (line_num > line_offsets_.size()) {
        return content_.size();
    }
    return line_offsets_[line_num - 1];
}

auto Source::line_end(uint32_t line_num) const -> size_t {
    if (line_num == 0 || line_num > line_offsets_.size()) {
        return content_.size();
    }
    size_t end = line_num < line_offsets_.size() ? line_offsets_[line_num] : content_.size();
    size_t start = line_offsets_[line_num - 1];
    if (end > start && content_[end - 1] == '\n') {
        --end;
    }
    if (end > start && content_[end - 1] == '\r') {
        --end;
    }
    return end;
}

auto Source::line(uint32_t line_num) const -> std::string_view {
    if (line_num == 0 || line_num > line_offsets_.size()) {
        return {};
    }
    auto start = line_start(line_num);
    return std::string_view(content_).substr(start, line_end(line_num) - start);
}

auto Source::line_count() const -> uint32_t {
    return static_cast<uint32_t>(line_offsets_.size());
}

auto Source::from_file(const std::string& path, std::string display_name)
    -> Result<Source, std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "Failed to open file: " + path;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    if (file.bad()) {
        return "Failed to read file: " + path;
    }

    std::string content = buffer.str();
    if (content.starts_with("\xEF\xBB\xBF")) {
        content.erase(0, 3);
    }
    if (display_name.empty()) {
        display_name = path;
    }
    return Source(std::move(display_name), std::move(content));
}

auto Source::from_string(std::string content, std::string name) -> Source {
    return Source(std::move(name), std::move(content));
}

} // namespace pystruct::lexer

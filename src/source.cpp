#include "source.hpp"
#include <algorithm>

Source::Source(std::string filename, std::string text)
    : filename_(std::move(filename)), text_(std::move(text)) {
    const int size = static_cast<int>(text_.size());
    if (size > 0) line_starts_.push_back(0);

    for (int i = 0; i < size; ++i) {
        // A newline at the very end does not open another line.
        if (text_[i] == '\n' && i + 1 < size) line_starts_.push_back(i + 1);
    }
}

SourceLoc Source::loc_from_offset(int offset) const {
    if (offset < 0) offset = 0;
    if (offset > static_cast<int>(text_.size())) offset = static_cast<int>(text_.size());

    SourceLoc loc;
    loc.offset = offset;
    if (line_starts_.empty()) return loc;

    // Find the last line start <= offset
    auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    int line_index = static_cast<int>(it - line_starts_.begin()) - 1;
    if (line_index < 0) line_index = 0;

    loc.line = line_index + 1;
    loc.col = (offset - line_starts_[line_index]) + 1;
    return loc;
}

int Source::line_start(int line1) const {
    if (line1 < 1 || line1 > line_count()) return static_cast<int>(text_.size());
    return line_starts_[line1 - 1];
}

std::string_view Source::line_text(int line1) const {
    if (line1 < 1 || line1 > line_count()) return {};

    int start = line_starts_[line1 - 1];
    int end = line1 < line_count() ? line_starts_[line1] : static_cast<int>(text_.size());

    if (end > start && text_[end - 1] == '\n') end -= 1;
    if (end > start && text_[end - 1] == '\r') end -= 1;

    return std::string_view(text_).substr(static_cast<size_t>(start),
                                          static_cast<size_t>(end - start));
}

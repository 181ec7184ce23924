#include "scantext/ReadingOrder.hpp"

#include <algorithm>
#include <cstdlib>

namespace scantext {

namespace {

// Twice the vertical centre, to stay in integers
int centerY2(const RecognizedSpan &span) {
  return 2 * span.bbox.y + span.bbox.height;
}

bool leftToRight(const RecognizedSpan &a, const RecognizedSpan &b) {
  if (a.bbox.x != b.bbox.x) {
    return a.bbox.x < b.bbox.x;
  }
  if (a.bbox.y != b.bbox.y) {
    return a.bbox.y < b.bbox.y;
  }
  if (a.bbox.width != b.bbox.width) {
    return a.bbox.width < b.bbox.width;
  }
  return a.text < b.text;
}

} // anonymous namespace

bool onSameLine(const RecognizedSpan &a, const RecognizedSpan &b) {
  if (a.page != b.page) {
    return false;
  }
  // |cyA - cyB| <= min(hA, hB) / 2, scaled by 2
  int diff2 = std::abs(centerY2(a) - centerY2(b));
  return diff2 <= std::min(a.bbox.height, b.bbox.height);
}

std::vector<std::vector<RecognizedSpan>>
groupIntoLines(std::vector<RecognizedSpan> spans) {
  std::vector<std::vector<RecognizedSpan>> lines;

  // Page by page, top to bottom, so each line is seeded by its highest span
  std::sort(spans.begin(), spans.end(),
            [](const RecognizedSpan &a, const RecognizedSpan &b) {
              if (a.page != b.page) {
                return a.page < b.page;
              }
              int ca = centerY2(a);
              int cb = centerY2(b);
              if (ca != cb) {
                return ca < cb;
              }
              return leftToRight(a, b);
            });

  for (const RecognizedSpan &span : spans) {
    if (!lines.empty() && onSameLine(lines.back().front(), span)) {
      lines.back().push_back(span);
    } else {
      lines.push_back({span});
    }
  }

  for (auto &line : lines) {
    std::sort(line.begin(), line.end(), leftToRight);
  }

  return lines;
}

void sortByReadingOrder(std::vector<RecognizedSpan> &spans) {
  std::vector<std::vector<RecognizedSpan>> lines =
      groupIntoLines(std::move(spans));

  spans.clear();
  for (auto &line : lines) {
    for (auto &span : line) {
      spans.push_back(std::move(span));
    }
  }

  renumber(spans);
}

void renumber(std::vector<RecognizedSpan> &spans) {
  for (size_t i = 0; i < spans.size(); ++i) {
    spans[i].order = static_cast<int>(i);
  }
}

std::string joinText(const std::vector<RecognizedSpan> &spans) {
  std::string text;
  const std::vector<std::vector<RecognizedSpan>> lines = groupIntoLines(spans);
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      // Blank line between pages
      text += lines[i - 1].front().page != lines[i].front().page ? "\n\n"
                                                                  : "\n";
    }
    for (size_t j = 0; j < lines[i].size(); ++j) {
      if (j > 0) {
        text += " ";
      }
      text += lines[i][j].text;
    }
  }
  return text;
}

} // namespace scantext

#ifndef SCANTEXT_READING_ORDER_HPP
#define SCANTEXT_READING_ORDER_HPP

#include "scantext/Types.hpp"

#include <string>
#include <vector>

namespace scantext {

/**
 * @brief Whether two spans sit on the same text line
 *
 * Spans share a line when they are on the same page and their vertical
 * centres differ by at most half the smaller of the two heights.
 */
bool onSameLine(const RecognizedSpan &a, const RecognizedSpan &b);

/**
 * @brief Group spans into lines
 *
 * Lines are ordered by page, then top to bottom by vertical centre, and never
 * span two pages. Spans within a line are
 * ordered left to right by x, ties broken by y and then text. The result is
 * deterministic for a given set of spans regardless of input order.
 */
std::vector<std::vector<RecognizedSpan>>
groupIntoLines(std::vector<RecognizedSpan> spans);

/**
 * @brief Sort spans into reading order and number them from 0
 *
 * Sorts top to bottom, then left to right within a line, and rewrites each
 * span's order to its position.
 */
void sortByReadingOrder(std::vector<RecognizedSpan> &spans);

/**
 * @brief Rewrite order indices to 0..n-1 following the current sequence
 */
void renumber(std::vector<RecognizedSpan> &spans);

/**
 * @brief Join span texts: spaces within a line, newlines between lines
 *
 * Lines are those of groupIntoLines. Pages are separated by a blank line.
 */
std::string joinText(const std::vector<RecognizedSpan> &spans);

} // namespace scantext

#endif // SCANTEXT_READING_ORDER_HPP

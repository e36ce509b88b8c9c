/** \brief Keyword relevance ranking of feed items.
 *
 *  \copyright 2024 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


#include <string>
#include <vector>
#include "ContentAcquisitionFeeds.h"


namespace ContentAcquisition {


struct ScoredItem {
    FeedItem item_;
    unsigned score_; // Always > 0.
public:
    ScoredItem(const FeedItem &item, const unsigned score): item_(item), score_(score) { }
};


/** \class  RelevanceRanker
 *  \brief  Scores items by case-insensitive substring matches of the query tokens in their title and summary.
 *
 *  Every distinct token that occurs adds its length in code points, clamped to [1, MAX_TOKEN_WEIGHT].  A query that
 *  consists of a single CJK token of at least MIN_CJK_TOKEN_LENGTH code points is extended by the token's overlapping
 *  bigrams, since CJK text has no word boundaries.
 */
class RelevanceRanker {
public:
    static constexpr unsigned MAX_TOKEN_WEIGHT = 6;
    static constexpr unsigned MIN_CJK_TOKEN_LENGTH = 4;
    static constexpr unsigned MAX_BIGRAM_COUNT = 32;
public:
    /** \return At most "limit" items with a positive score, best first.  Items with equal scores keep their order. */
    std::vector<ScoredItem> rank(const std::vector<FeedItem> &items, const std::string &query, const size_t limit) const;

    /** \return The distinct, lowercased tokens of "query" in order of first occurrence, including CJK bigrams. */
    static std::vector<std::string> Tokenize(const std::string &query);

    static unsigned Score(const FeedItem &item, const std::vector<std::string> &tokens);
};


} // namespace ContentAcquisition

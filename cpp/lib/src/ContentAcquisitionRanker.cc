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
#include "ContentAcquisitionRanker.h"
#include <algorithm>
#include <unordered_set>
#include "TextUtil.h"
#include "util.h"


namespace ContentAcquisition {


namespace {


void SplitOnWhitespace(const std::vector<uint32_t> &utf32_chars, std::vector<std::vector<uint32_t>> * const words) {
    std::vector<uint32_t> word;
    for (const auto ch : utf32_chars) {
        if (TextUtil::IsWhitespace(ch)) {
            if (not word.empty()) {
                words->emplace_back(word);
                word.clear();
            }
        } else
            word.emplace_back(ch);
    }
    if (not word.empty())
        words->emplace_back(word);
}


bool ContainsCJK(const std::vector<uint32_t> &utf32_chars) {
    return std::any_of(utf32_chars.cbegin(), utf32_chars.cend(), TextUtil::IsCJKCodePoint);
}


} // unnamed namespace


std::vector<std::string> RelevanceRanker::Tokenize(const std::string &query) {
    std::string lowercase_query;
    std::vector<uint32_t> utf32_chars;
    if (not TextUtil::UTF8ToLower(query, &lowercase_query) or not TextUtil::UTF8ToUTF32(lowercase_query, &utf32_chars)) {
        LOG_WARNING("query is not valid UTF-8");
        return {};
    }

    std::vector<std::vector<uint32_t>> words;
    SplitOnWhitespace(utf32_chars, &words);

    std::vector<std::string> tokens;
    std::unordered_set<std::string> already_seen;
    for (const auto &word : words) {
        const std::string token(TextUtil::UTF32ToUTF8(word));
        if (already_seen.emplace(token).second)
            tokens.emplace_back(token);
    }

    // Repetitions of a single word count as a single word.
    if (tokens.size() == 1 and words[0].size() >= MIN_CJK_TOKEN_LENGTH and ContainsCJK(words[0])) {
        unsigned bigram_count(0);
        for (size_t i(0); i + 1 < words[0].size() and bigram_count < MAX_BIGRAM_COUNT; ++i, ++bigram_count) {
            const std::string bigram(TextUtil::UTF32ToUTF8(std::vector<uint32_t>{ words[0][i], words[0][i + 1] }));
            if (already_seen.emplace(bigram).second)
                tokens.emplace_back(bigram);
        }
    }

    return tokens;
}


unsigned RelevanceRanker::Score(const FeedItem &item, const std::vector<std::string> &tokens) {
    std::string haystack;
    if (not TextUtil::UTF8ToLower(item.title_ + "\n" + item.summary_, &haystack))
        return 0;

    unsigned score(0);
    for (const auto &token : tokens) {
        if (haystack.find(token) != std::string::npos) {
            const unsigned length(static_cast<unsigned>(TextUtil::CodePointCount(token)));
            score += std::min(MAX_TOKEN_WEIGHT, std::max(1u, length));
        }
    }

    return score;
}


std::vector<ScoredItem> RelevanceRanker::rank(const std::vector<FeedItem> &items, const std::string &query, const size_t limit) const {
    const std::vector<std::string> tokens(Tokenize(query));
    if (tokens.empty())
        return {};

    std::vector<ScoredItem> scored_items;
    for (const auto &item : items) {
        const unsigned score(Score(item, tokens));
        if (score > 0)
            scored_items.emplace_back(item, score);
    }

    std::stable_sort(scored_items.begin(), scored_items.end(),
                     [](const ScoredItem &lhs, const ScoredItem &rhs) { return lhs.score_ > rhs.score_; });
    if (scored_items.size() > limit)
        scored_items.erase(scored_items.begin() + limit, scored_items.end());

    LOG_DEBUG(std::to_string(scored_items.size()) + " of " + std::to_string(items.size()) + " items match the query");
    return scored_items;
}


} // namespace ContentAcquisition

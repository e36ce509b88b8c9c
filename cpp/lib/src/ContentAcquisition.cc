/** \brief Turns a user-supplied topic, a URL or keywords, into article text.
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
#include "ContentAcquisition.h"
#include <algorithm>
#include <stdexcept>
#include "HtmlUtil.h"
#include "StringUtil.h"
#include "TextUtil.h"
#include "UrlUtil.h"
#include "util.h"


namespace ContentAcquisition {


ArticleDocument ExtractArticle(const FetchResult &fetch_result) {
    if (StringUtil::StartsWith(fetch_result.content_type_, "text/plain"))
        return ArticleDocument(fetch_result.url_, "", TextUtil::CollapseAndTrimWhitespace(fetch_result.body_));

    return ArticleDocument(fetch_result.url_, HtmlUtil::ExtractTitle(fetch_result.body_), HtmlUtil::ExtractText(fetch_result.body_));
}


std::string Failure::KindToString(const Kind kind) {
    switch (kind) {
    case INVALID_URL:
        return "INVALID_URL";
    case UNREACHABLE:
        return "UNREACHABLE";
    case TOO_LARGE:
        return "TOO_LARGE";
    case UNSUPPORTED_CONTENT:
        return "UNSUPPORTED_CONTENT";
    case NO_CANDIDATES:
        return "NO_CANDIDATES";
    case NO_KEYWORD_MATCH:
        return "NO_KEYWORD_MATCH";
    case NO_FEEDS_CONFIGURED:
        return "NO_FEEDS_CONFIGURED";
    }

    throw std::runtime_error("in ContentAcquisition::Failure::KindToString: unknown kind " + std::to_string(kind) + "!");
}


Failure Failure::FromFetchError(const FetchError &fetch_error) {
    switch (fetch_error.code_) {
    case REJECTED:
        return Failure(INVALID_URL, fetch_error.rejection_.toString());
    case CONNECTION_FAILURE:
    case STATUS_ERROR:
    case REDIRECT_LIMIT_EXCEEDED:
        return Failure(UNREACHABLE, fetch_error.toString());
    case ContentAcquisition::TOO_LARGE:
        return Failure(Failure::TOO_LARGE, fetch_error.message_);
    case UNSUPPORTED_CONTENT_TYPE:
        return Failure(UNSUPPORTED_CONTENT, fetch_error.message_);
    }

    throw std::runtime_error("in ContentAcquisition::Failure::FromFetchError: unknown code " + std::to_string(fetch_error.code_) + "!");
}


bool ContentAcquirer::fetchDirect(const std::string &url, ArticleDocument * const article, Failure * const failure) {
    FetchResult fetch_result;
    FetchError fetch_error;
    if (not fetcher_.fetch(url, ARTICLE, {}, &fetch_result, &fetch_error)) {
        LOG_WARNING("can't fetch " + UrlUtil::SanitizeUrlForLogging(url) + ": " + fetch_error.toString());
        *failure = Failure::FromFetchError(fetch_error);
        return false;
    }

    try {
        *article = ExtractArticle(fetch_result);
    } catch (const std::exception &x) {
        LOG_WARNING("can't extract the text of " + UrlUtil::SanitizeUrlForLogging(url) + ": " + std::string(x.what()));
        *failure = Failure(Failure::UNSUPPORTED_CONTENT, "text extraction failed: " + std::string(x.what()));
        return false;
    }
    LOG_INFO("fetched \"" + article->title_ + "\" from " + UrlUtil::SanitizeUrlForLogging(article->url_));
    return true;
}


bool ContentAcquirer::searchFeeds(const std::string &query, std::vector<ArticleDocument> * const articles, Failure * const failure) {
    const std::vector<std::string> &feed_urls(config_.feed_urls_);
    if (feed_urls.empty()) {
        *failure = Failure(Failure::NO_FEEDS_CONFIGURED, "neither RSS_FEED_URLS nor \"" + config_.feed_file_ + "\" name any feeds");
        return false;
    }

    if (TextUtil::CollapseAndTrimWhitespace(query).empty()) {
        *failure = Failure(Failure::NO_KEYWORD_MATCH, "the query is empty");
        return false;
    }

    unsigned usable_feed_count;
    const std::vector<FeedItem> items(aggregator_.aggregate(feed_urls, &usable_feed_count));
    if (usable_feed_count == 0) {
        *failure = Failure(Failure::NO_FEEDS_CONFIGURED, "none of the configured feeds could be fetched and parsed");
        return false;
    }

    const size_t rank_limit(std::max<size_t>(config_.rank_limit_, config_.max_articles_ * 5));
    const std::vector<ScoredItem> candidates(ranker_.rank(items, query, rank_limit));
    if (candidates.empty()) {
        *failure = Failure(Failure::NO_KEYWORD_MATCH, "none of the " + std::to_string(items.size()) + " feed items match the query");
        return false;
    }

    articles->clear();
    std::string last_error("all candidates were denied by the link policy");
    for (const auto &candidate : candidates) {
        if (articles->size() == config_.max_articles_)
            break;

        const std::string sanitized_link(UrlUtil::SanitizeUrlForLogging(candidate.item_.link_));
        std::string reason;
        if (link_scoping_policy_.decide(candidate.item_.link_, candidate.item_.feed_url_, config_.link_policy_mode_,
                                        config_.allowlist_domains_, &reason)
            == DENY)
        {
            LOG_WARNING("skipping " + sanitized_link + ": " + reason);
            continue;
        }

        FetchResult fetch_result;
        FetchError fetch_error;
        if (not fetcher_.fetch(candidate.item_.link_, ARTICLE, {}, &fetch_result, &fetch_error)) {
            last_error = fetch_error.toString();
            LOG_WARNING("skipping " + sanitized_link + ": " + last_error);
            continue;
        }

        try {
            articles->emplace_back(ExtractArticle(fetch_result));
        } catch (const std::exception &x) {
            last_error = "text extraction failed: " + std::string(x.what());
            LOG_WARNING("skipping " + sanitized_link + ": " + last_error);
            continue;
        }
        LOG_INFO("fetched candidate " + std::to_string(articles->size()) + " (score " + std::to_string(candidate.score_) + "): "
                 + sanitized_link);
    }

    if (articles->empty()) {
        *failure = Failure(Failure::NO_CANDIDATES,
                           "none of the " + std::to_string(candidates.size()) + " matching items could be fetched (" + last_error + ")");
        return false;
    }

    return true;
}


} // namespace ContentAcquisition

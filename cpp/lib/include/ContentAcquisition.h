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
#pragma once


#include <string>
#include <vector>
#include "ContentAcquisitionConfig.h"
#include "ContentAcquisitionFeeds.h"
#include "ContentAcquisitionFetcher.h"
#include "ContentAcquisitionLinkPolicy.h"
#include "ContentAcquisitionRanker.h"
#include "ContentAcquisitionUrlValidator.h"
#include "DnsUtil.h"


namespace ContentAcquisition {


struct ArticleDocument {
    std::string url_; // After following all redirects.
    std::string title_;
    std::string text_;
public:
    ArticleDocument() = default;
    ArticleDocument(const std::string &url, const std::string &title, const std::string &text): url_(url), title_(title), text_(text) { }
};


/** \brief  Converts a fetched HTML or plain text document to an ArticleDocument.
 *  \note   Scripts, styles, comments and tags are removed, but no boilerplate detection takes place.
 */
ArticleDocument ExtractArticle(const FetchResult &fetch_result);


struct Failure {
    enum Kind {
        INVALID_URL,
        UNREACHABLE,
        TOO_LARGE,
        UNSUPPORTED_CONTENT,
        NO_CANDIDATES,
        NO_KEYWORD_MATCH, // Not an error for callers, rather a clean early stop.
        NO_FEEDS_CONFIGURED
    };

    Kind kind_;
    std::string reason_;
public:
    Failure(): kind_(NO_CANDIDATES) { }
    Failure(const Kind kind, const std::string &reason): kind_(kind), reason_(reason) { }

    static std::string KindToString(const Kind kind);
    inline std::string toString() const { return KindToString(kind_) + ": " + reason_; }

    /** \brief Maps a fetch error to the failure that a direct fetch reports. */
    static Failure FromFetchError(const FetchError &fetch_error);
};


/** \class  ContentAcquirer
 *  \brief  The entry point for callers: fetches a single URL or searches the configured feeds for articles.
 *
 *  Work is done synchronously, one request at a time.  An instance must not be shared between threads, but any number
 *  of instances may share one Config.
 */
class ContentAcquirer {
    const Config &config_;
    UrlValidator validator_;
    SecureFetcher fetcher_;
    FeedAggregator aggregator_;
    RelevanceRanker ranker_;
    LinkScopingPolicy link_scoping_policy_;
public:
    ContentAcquirer(const Config &config, const DnsUtil::Resolver &resolver, HttpTransport &transport)
        : config_(config), validator_(config, resolver), fetcher_(config, validator_, transport), aggregator_(config, fetcher_) { }

    /** \brief  Validates and fetches "url" as an article.
     *  \return True on success, else false and "failure" is one of INVALID_URL, UNREACHABLE, TOO_LARGE or UNSUPPORTED_CONTENT.
     */
    bool fetchDirect(const std::string &url, ArticleDocument * const article, Failure * const failure);

    /** \brief  Ranks the items of the configured feeds against "query" and fetches up to "config.max_articles_" of them.
     *  \return True if at least one article could be fetched, else false and "failure" is one of NO_FEEDS_CONFIGURED,
     *          NO_KEYWORD_MATCH or NO_CANDIDATES.
     */
    bool searchFeeds(const std::string &query, std::vector<ArticleDocument> * const articles, Failure * const failure);
};


} // namespace ContentAcquisition

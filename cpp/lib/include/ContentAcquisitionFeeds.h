/** \brief Aggregation of allowlisted RSS, RDF and Atom feeds.
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
#include "ContentAcquisitionFetcher.h"


namespace ContentAcquisition {


struct FeedItem {
    std::string title_;
    std::string link_; // Never empty.
    std::string summary_;
    std::string published_;
    std::string feed_url_; // The configured URL of the feed the item came from.
public:
    FeedItem() = default;
    FeedItem(const std::string &title, const std::string &link, const std::string &summary, const std::string &published,
             const std::string &feed_url)
        : title_(title), link_(link), summary_(summary), published_(published), feed_url_(feed_url) { }
};


class FeedAggregator {
    const Config &config_;
    SecureFetcher &fetcher_;
public:
    FeedAggregator(const Config &config, SecureFetcher &fetcher): config_(config), fetcher_(fetcher) { }

    /** \brief  Fetches and parses up to "config.max_feeds_" feeds, one after the other.
     *  \param  usable_feed_count  If non-NULL, the number of feeds that could be fetched and parsed will be stored here.
     *  \return The items of all feeds in feed list order.  Feeds that can't be fetched or parsed are logged and skipped.
     */
    std::vector<FeedItem> aggregate(const std::vector<std::string> &feed_urls, unsigned * const usable_feed_count = nullptr);

    /** \brief  Parses an RSS 2.0, RDF or Atom document.
     *  \param  base_url  Relative item links are resolved against this.
     *  \param  feed_url  Stored in every extracted item.
     *  \return False if "xml_document" is not a well-formed feed, in which case "items" stays unchanged.
     */
    static bool ParseFeed(const std::string &xml_document, const std::string &base_url, const std::string &feed_url,
                          std::vector<FeedItem> * const items, std::string * const error_message);
};


} // namespace ContentAcquisition

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
#include "ContentAcquisitionFeeds.h"
#include <memory>
#include <stdexcept>
#include "SyndicationFormat.h"
#include "Url.h"
#include "UrlUtil.h"
#include "util.h"


namespace ContentAcquisition {


bool FeedAggregator::ParseFeed(const std::string &xml_document, const std::string &base_url, const std::string &feed_url,
                               std::vector<FeedItem> * const items, std::string * const error_message)
{
    const std::unique_ptr<SyndicationFormat> syndication_format(SyndicationFormat::Factory(xml_document, error_message));
    if (syndication_format == nullptr)
        return false;

    // Items are only handed out once the whole document has been parsed successfully.
    std::vector<FeedItem> parsed_items;
    const Url base(base_url);
    try {
        for (const auto &item : *syndication_format) {
            std::string link;
            if (not base.makeAbsolute(item.getLink(), &link)) {
                LOG_DEBUG("dropping item \"" + item.getTitle() + "\" with unresolvable link "
                          + UrlUtil::SanitizeUrlForLogging(item.getLink()));
                continue;
            }
            parsed_items.emplace_back(item.getTitle(), link, item.getSummary(), item.getPublished(), feed_url);
        }
        syndication_format->finish();
    } catch (const std::runtime_error &x) {
        *error_message = syndication_format->getFormatName() + " parse error: " + std::string(x.what());
        return false;
    }

    items->insert(items->end(), parsed_items.cbegin(), parsed_items.cend());
    return true;
}


std::vector<FeedItem> FeedAggregator::aggregate(const std::vector<std::string> &feed_urls, unsigned * const usable_feed_count) {
    std::vector<FeedItem> items;
    unsigned processed_count(0), usable_count(0);
    for (const auto &feed_url : feed_urls) {
        if (processed_count == config_.max_feeds_) {
            LOG_INFO("reached the limit of " + std::to_string(config_.max_feeds_) + " feeds, ignoring the remaining "
                     + std::to_string(feed_urls.size() - processed_count));
            break;
        }
        ++processed_count;

        FetchResult fetch_result;
        FetchError fetch_error;
        if (not fetcher_.fetch(feed_url, FEED, {}, &fetch_result, &fetch_error)) {
            LOG_WARNING("skipping feed " + UrlUtil::SanitizeUrlForLogging(feed_url) + ": " + fetch_error.toString());
            continue;
        }

        const size_t old_size(items.size());
        std::string error_message;
        if (not ParseFeed(fetch_result.body_, fetch_result.url_, feed_url, &items, &error_message)) {
            LOG_WARNING("skipping feed " + UrlUtil::SanitizeUrlForLogging(feed_url) + ": " + error_message);
            continue;
        }
        ++usable_count;
        LOG_DEBUG("got " + std::to_string(items.size() - old_size) + " items from " + UrlUtil::SanitizeUrlForLogging(feed_url));
    }

    LOG_INFO("aggregated " + std::to_string(items.size()) + " items from " + std::to_string(usable_count) + " of "
             + std::to_string(processed_count) + " feeds");
    if (usable_feed_count != nullptr)
        *usable_feed_count = usable_count;
    return items;
}


} // namespace ContentAcquisition

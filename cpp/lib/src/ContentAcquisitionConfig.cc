/** \brief Immutable configuration of the content acquisition subsystem.
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
#include "ContentAcquisitionConfig.h"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include "FileUtil.h"
#include "MiscUtil.h"
#include "StringUtil.h"
#include "UrlUtil.h"
#include "util.h"


namespace ContentAcquisition {


std::string PurposeToString(const Purpose purpose) {
    switch (purpose) {
    case ARTICLE:
        return "article";
    case FEED:
        return "feed";
    }

    throw std::runtime_error("in ContentAcquisition::PurposeToString: unknown purpose " + std::to_string(purpose) + "!");
}


const std::string Config::INI_SECTION("content_acquisition");
const std::string Config::DEFAULT_FEED_FILE("config/rss_feeds.txt");
const std::vector<std::string> Config::SETTING_NAMES{
    "URL_ALLOWED_SCHEMES", "URL_ALLOWLIST_DOMAINS", "URL_BLOCK_PRIVATE_IPS", "URL_ALLOW_REDIRECTS", "URL_MAX_REDIRECTS",
    "HTTP_MAX_BYTES", "RSS_MAX_BYTES", "HTTP_CONNECT_TIMEOUT_SEC", "HTTP_READ_TIMEOUT_SEC", "RSS_MAX_FEEDS",
    "RSS_MAX_ARTICLES", "RSS_RANK_LIMIT", "RSS_ITEM_LINK_POLICY", "RSS_FEED_URLS", "RSS_FEED_FILE",
};


Config::Config()
    : allowed_schemes_{ "https" }, block_private_ips_(true), allow_redirects_(false), max_redirects_(DEFAULT_MAX_REDIRECTS),
      http_max_bytes_(DEFAULT_HTTP_MAX_BYTES), rss_max_bytes_(DEFAULT_RSS_MAX_BYTES), connect_timeout_(DEFAULT_CONNECT_TIMEOUT),
      read_timeout_(DEFAULT_READ_TIMEOUT), max_feeds_(DEFAULT_MAX_FEEDS), max_articles_(DEFAULT_MAX_ARTICLES),
      rank_limit_(DEFAULT_RANK_LIMIT), link_policy_mode_(LINK_POLICY_A), feed_file_(DEFAULT_FEED_FILE)
{
}


namespace {


// List values are separated by commas and/or whitespace.
std::vector<std::string> SplitList(const std::string &value) {
    std::vector<std::string> list;
    StringUtil::SplitThenTrimWhite(value, "," + StringUtil::WHITE_SPACE, &list);
    return list;
}


bool ParseBool(const std::string &name, const std::string &value) {
    bool b;
    if (unlikely(not StringUtil::ToBool(StringUtil::TrimWhite(value), &b)))
        throw std::runtime_error("in ContentAcquisition::Config::set: \"" + value + "\" is not a valid boolean for " + name + "!");
    return b;
}


unsigned ParseUnsigned(const std::string &name, const std::string &value) {
    unsigned n;
    if (unlikely(not StringUtil::ToUnsigned(StringUtil::TrimWhite(value), &n)))
        throw std::runtime_error("in ContentAcquisition::Config::set: \"" + value + "\" is not a valid unsigned integer for " + name
                                 + "!");
    return n;
}


std::vector<std::string> DeduplicatePreservingOrder(const std::vector<std::string> &urls) {
    std::vector<std::string> unique_urls;
    std::unordered_set<std::string> already_seen;
    for (const auto &url : urls) {
        if (already_seen.emplace(url).second)
            unique_urls.emplace_back(url);
    }

    return unique_urls;
}


size_t ParseSize(const std::string &name, const std::string &value) {
    unsigned long n;
    if (unlikely(not StringUtil::ToUnsignedLong(StringUtil::TrimWhite(value), &n)))
        throw std::runtime_error("in ContentAcquisition::Config::set: \"" + value + "\" is not a valid byte count for " + name + "!");
    return n;
}


} // unnamed namespace


void Config::set(const std::string &name, const std::string &value) {
    if (name == "URL_ALLOWED_SCHEMES") {
        allowed_schemes_.clear();
        for (const auto &scheme : SplitList(value))
            allowed_schemes_.emplace(StringUtil::ToLower(scheme));
        if (allowed_schemes_.empty())
            allowed_schemes_.emplace("https");
    } else if (name == "URL_ALLOWLIST_DOMAINS") {
        allowlist_domains_.clear();
        for (auto domain : SplitList(value)) {
            domain = UrlUtil::NormalizeDomainName(domain);
            if (StringUtil::StartsWith(domain, "*."))
                domain = domain.substr(2);
            if (not domain.empty())
                allowlist_domains_.emplace_back(domain);
        }
    } else if (name == "URL_BLOCK_PRIVATE_IPS")
        block_private_ips_ = ParseBool(name, value);
    else if (name == "URL_ALLOW_REDIRECTS")
        allow_redirects_ = ParseBool(name, value);
    else if (name == "URL_MAX_REDIRECTS")
        max_redirects_ = ParseUnsigned(name, value);
    else if (name == "HTTP_MAX_BYTES")
        http_max_bytes_ = ParseSize(name, value);
    else if (name == "RSS_MAX_BYTES")
        rss_max_bytes_ = ParseSize(name, value);
    else if (name == "HTTP_CONNECT_TIMEOUT_SEC")
        connect_timeout_ = ParseUnsigned(name, value);
    else if (name == "HTTP_READ_TIMEOUT_SEC")
        read_timeout_ = ParseUnsigned(name, value);
    else if (name == "RSS_MAX_FEEDS")
        max_feeds_ = std::max(1u, ParseUnsigned(name, value));
    else if (name == "RSS_MAX_ARTICLES")
        max_articles_ = std::min(MAX_MAX_ARTICLES, std::max(1u, ParseUnsigned(name, value)));
    else if (name == "RSS_RANK_LIMIT")
        rank_limit_ = std::max(1u, ParseUnsigned(name, value));
    else if (name == "RSS_ITEM_LINK_POLICY") {
        const std::string mode(StringUtil::ToLower(StringUtil::TrimWhite(value)));
        if (mode == "a")
            link_policy_mode_ = LINK_POLICY_A;
        else if (mode == "b")
            link_policy_mode_ = LINK_POLICY_B;
        else
            throw std::runtime_error("in ContentAcquisition::Config::set: unknown link policy \"" + value + "\"!");
    } else if (name == "RSS_FEED_URLS")
        feed_urls_ = DeduplicatePreservingOrder(SplitList(value));
    else if (name == "RSS_FEED_FILE")
        feed_file_ = StringUtil::TrimWhite(value);
    else
        throw std::runtime_error("in ContentAcquisition::Config::set: unknown setting \"" + name + "\"!");
}


void Config::applyIniFile(const IniFile &ini_file) {
    const auto section(ini_file.getSection(INI_SECTION));
    if (section == ini_file.end()) {
        LOG_DEBUG("no [" + INI_SECTION + "] section in \"" + ini_file.getFilename() + "\"");
        return;
    }

    for (const auto &entry : *section) {
        const std::string name(StringUtil::ToUpper(entry.name_));
        if (std::find(SETTING_NAMES.cbegin(), SETTING_NAMES.cend(), name) == SETTING_NAMES.cend())
            throw std::runtime_error("in ContentAcquisition::Config::applyIniFile: unknown entry \"" + entry.name_ + "\" in \""
                                     + ini_file.getFilename() + "\"!");
        if (not StringUtil::TrimWhite(entry.value_).empty())
            set(name, entry.value_);
    }
}


void Config::applyEnvironment() {
    for (const auto &name : SETTING_NAMES) {
        const std::string value(MiscUtil::SafeGetEnv(name));
        if (not StringUtil::TrimWhite(value).empty())
            set(name, value);
    }
}


void Config::resolveFeedUrls() {
    if (not feed_urls_.empty())
        return;

    std::vector<std::string> lines;
    if (not FileUtil::ReadLines(feed_file_, &lines)) {
        LOG_WARNING("can't read the feed list \"" + feed_file_ + "\"");
        return;
    }

    std::vector<std::string> feed_urls;
    for (auto &line : lines) {
        StringUtil::TrimWhite(&line);
        if (line.empty() or line[0] == '#')
            continue;
        feed_urls.emplace_back(line);
    }
    feed_urls_ = DeduplicatePreservingOrder(feed_urls);
    LOG_DEBUG("read " + std::to_string(feed_urls_.size()) + " feed URLs from \"" + feed_file_ + "\"");
}


Config Config::Load(const std::string &ini_file_path) {
    Config config;
    if (not ini_file_path.empty())
        config.applyIniFile(IniFile(ini_file_path));
    config.applyEnvironment();
    config.resolveFeedUrls();

    return config;
}


} // namespace ContentAcquisition

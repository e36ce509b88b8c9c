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
#pragma once


#include <set>
#include <string>
#include <vector>
#include "IniFile.h"


namespace ContentAcquisition {


// What a document is fetched for.  Selects the byte ceiling, the accepted content types and the "Accept" header.
enum Purpose { ARTICLE, FEED };


std::string PurposeToString(const Purpose purpose);


// Mode A only admits item links on the feed's own host or its subdomains unless a domain allowlist has been
// configured, mode B admits every link and leaves the decision to the URL validator.
enum LinkPolicyMode { LINK_POLICY_A, LINK_POLICY_B };


/** \brief  Process-wide settings, read once and afterwards only passed around by const reference.
 *
 *  Values are layered: built-in defaults, then the [content_acquisition] section of an optional INI file, then the
 *  environment.  INI entry names are the lowercase forms of the environment variable names.
 */
struct Config {
    static const std::string INI_SECTION;
    static const std::vector<std::string> SETTING_NAMES;

    static constexpr unsigned DEFAULT_MAX_REDIRECTS = 2;
    static constexpr size_t DEFAULT_HTTP_MAX_BYTES = 5000000;
    static constexpr size_t DEFAULT_RSS_MAX_BYTES = 2000000;
    static constexpr unsigned DEFAULT_CONNECT_TIMEOUT = 3; // In s.
    static constexpr unsigned DEFAULT_READ_TIMEOUT = 7;    // In s.
    static constexpr unsigned DEFAULT_MAX_FEEDS = 10;
    static constexpr unsigned DEFAULT_MAX_ARTICLES = 3;
    static constexpr unsigned MAX_MAX_ARTICLES = 3;
    static constexpr unsigned DEFAULT_RANK_LIMIT = 20;
    static const std::string DEFAULT_FEED_FILE;

    std::set<std::string> allowed_schemes_; // Lowercase.
    std::vector<std::string> allowlist_domains_; // Normalised, without a leading "*.".
    bool block_private_ips_;
    bool allow_redirects_;
    unsigned max_redirects_;
    size_t http_max_bytes_;
    size_t rss_max_bytes_;
    unsigned connect_timeout_;
    unsigned read_timeout_;
    unsigned max_feeds_;
    unsigned max_articles_; // Always between 1 and MAX_MAX_ARTICLES.
    unsigned rank_limit_;
    LinkPolicyMode link_policy_mode_;
    std::vector<std::string> feed_urls_; // Without duplicates.  If non-empty, takes precedence over "feed_file_".
    std::string feed_file_;
public:
    /** \brief Creates a configuration that only holds the built-in defaults. */
    Config();

    /** \brief  Applies a single setting, e.g. "URL_MAX_REDIRECTS".
     *  \throws std::runtime_error if "name" is unknown or "value" can't be converted.
     */
    void set(const std::string &name, const std::string &value);

    /** \brief  Applies the non-blank entries of the [content_acquisition] section, if there is one.
     *  \throws std::runtime_error on unknown entry names.
     */
    void applyIniFile(const IniFile &ini_file);

    /** \brief  Applies all SETTING_NAMES that are set to a non-blank value in the environment. */
    void applyEnvironment();

    /** \brief  If "feed_urls_" is empty, fills it from "feed_file_".
     *  \note   Blank lines and lines starting with a hash mark are ignored, duplicates are removed keeping the first one.
     *          A missing feed file leaves the list empty.
     */
    void resolveFeedUrls();

    inline size_t getMaxBytes(const Purpose purpose) const { return purpose == FEED ? rss_max_bytes_ : http_max_bytes_; }

    // \return The number of redirects a single fetch may follow, zero if redirects are disabled.
    inline unsigned getMaxRedirects() const { return allow_redirects_ ? max_redirects_ : 0; }

    // \return The time limit for a single request in ms.
    inline unsigned getTimeLimitPerHop() const { return (connect_timeout_ + read_timeout_) * 1000; }

    /** \brief  Builds a configuration from the defaults, "ini_file_path" (if not empty) and the environment, then resolves
     *          the feed list.
     *  \throws std::runtime_error on unreadable INI files or invalid values.
     */
    static Config Load(const std::string &ini_file_path = "");
};


} // namespace ContentAcquisition

/** \brief Test cases for ContentAcquisition::Config
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
#include <stdexcept>
#include "FileUtil.h"
#include "MiscUtil.h"
#include "UnitTest.h"


using namespace ContentAcquisition;


namespace {


void ClearEnvironment() {
    for (const auto &name : Config::SETTING_NAMES)
        MiscUtil::UnsetEnv(name);
}


bool SetThrows(Config * const config, const std::string &name, const std::string &value) {
    try {
        config->set(name, value);
    } catch (const std::runtime_error &) {
        return true;
    }
    return false;
}


} // unnamed namespace


TEST(Defaults) {
    const Config config;
    CHECK_EQ(config.allowed_schemes_.size(), 1u);
    CHECK_EQ(config.allowed_schemes_.count("https"), 1u);
    CHECK_TRUE(config.allowlist_domains_.empty());
    CHECK_TRUE(config.block_private_ips_);
    CHECK_FALSE(config.allow_redirects_);
    CHECK_EQ(config.getMaxRedirects(), 0u);
    CHECK_EQ(config.getMaxBytes(ARTICLE), 5000000u);
    CHECK_EQ(config.getMaxBytes(FEED), 2000000u);
    CHECK_EQ(config.getTimeLimitPerHop(), 10000u);
    CHECK_EQ(config.max_feeds_, 10u);
    CHECK_EQ(config.max_articles_, 3u);
    CHECK_EQ(config.rank_limit_, 20u);
    CHECK_EQ(config.link_policy_mode_, LINK_POLICY_A);
    CHECK_TRUE(config.feed_urls_.empty());
    CHECK_EQ(config.feed_file_, "config/rss_feeds.txt");
}


TEST(Lists) {
    Config config;
    config.set("URL_ALLOWED_SCHEMES", "HTTPS, http");
    CHECK_EQ(config.allowed_schemes_.size(), 2u);
    CHECK_EQ(config.allowed_schemes_.count("http"), 1u);

    config.set("URL_ALLOWED_SCHEMES", " , ");
    CHECK_EQ(config.allowed_schemes_.size(), 1u);
    CHECK_EQ(config.allowed_schemes_.count("https"), 1u);

    config.set("URL_ALLOWLIST_DOMAINS", "*.Example.com, news.example.org.\tfoo.net");
    CHECK_EQ(config.allowlist_domains_.size(), 3u);
    CHECK_EQ(config.allowlist_domains_[0], "example.com");
    CHECK_EQ(config.allowlist_domains_[1], "news.example.org");
    CHECK_EQ(config.allowlist_domains_[2], "foo.net");

    config.set("RSS_FEED_URLS", "https://a.example.com/feed https://b.example.com/rss,https://c.example.com/atom");
    CHECK_EQ(config.feed_urls_.size(), 3u);
    CHECK_EQ(config.feed_urls_[1], "https://b.example.com/rss");

    config.set("RSS_FEED_URLS", "https://a.example.com/rss, https://b.example.com/rss https://a.example.com/rss");
    CHECK_EQ(config.feed_urls_.size(), 2u);
    CHECK_EQ(config.feed_urls_[0], "https://a.example.com/rss");
    CHECK_EQ(config.feed_urls_[1], "https://b.example.com/rss");
}


TEST(RedirectsAndPolicy) {
    Config config;
    config.set("URL_ALLOW_REDIRECTS", "yes");
    CHECK_EQ(config.getMaxRedirects(), 2u);
    config.set("URL_MAX_REDIRECTS", "5");
    CHECK_EQ(config.getMaxRedirects(), 5u);
    config.set("URL_ALLOW_REDIRECTS", "0");
    CHECK_EQ(config.getMaxRedirects(), 0u);

    config.set("RSS_ITEM_LINK_POLICY", " B ");
    CHECK_EQ(config.link_policy_mode_, LINK_POLICY_B);
    config.set("RSS_ITEM_LINK_POLICY", "a");
    CHECK_EQ(config.link_policy_mode_, LINK_POLICY_A);
}


TEST(Clamping) {
    Config config;
    config.set("RSS_MAX_ARTICLES", "10");
    CHECK_EQ(config.max_articles_, 3u);
    config.set("RSS_MAX_ARTICLES", "0");
    CHECK_EQ(config.max_articles_, 1u);
    config.set("RSS_MAX_FEEDS", "0");
    CHECK_EQ(config.max_feeds_, 1u);
    config.set("RSS_RANK_LIMIT", "0");
    CHECK_EQ(config.rank_limit_, 1u);
}


TEST(InvalidValues) {
    Config config;
    CHECK_TRUE(SetThrows(&config, "NO_SUCH_SETTING", "1"));
    CHECK_TRUE(SetThrows(&config, "URL_BLOCK_PRIVATE_IPS", "maybe"));
    CHECK_TRUE(SetThrows(&config, "HTTP_MAX_BYTES", "-1"));
    CHECK_TRUE(SetThrows(&config, "HTTP_CONNECT_TIMEOUT_SEC", "3s"));
    CHECK_TRUE(SetThrows(&config, "RSS_ITEM_LINK_POLICY", "c"));

    // A failed update leaves the previous value alone.
    CHECK_TRUE(config.block_private_ips_);
    CHECK_EQ(config.http_max_bytes_, 5000000u);
}


TEST(Environment) {
    ClearEnvironment();
    MiscUtil::SetEnv("HTTP_MAX_BYTES", "1024");
    MiscUtil::SetEnv("URL_BLOCK_PRIVATE_IPS", "false");
    MiscUtil::SetEnv("RSS_FEED_URLS", "https://feeds.example.com/rss");
    MiscUtil::SetEnv("RSS_RANK_LIMIT", "   "); // Blank values are ignored.

    const Config config(Config::Load());
    CHECK_EQ(config.http_max_bytes_, 1024u);
    CHECK_FALSE(config.block_private_ips_);
    CHECK_EQ(config.feed_urls_.size(), 1u);
    CHECK_EQ(config.rank_limit_, 20u);

    ClearEnvironment();
}


TEST(ResolveFeedUrlsFromFile) {
    const FileUtil::AutoTempFile feed_file("/tmp/ContentAcquisitionConfigTests", ".txt");
    CHECK_TRUE(FileUtil::WriteString(feed_file.getFilePath(),
                                     "# Technology\n"
                                     "https://a.example.com/rss\n"
                                     "\n"
                                     "   https://b.example.com/atom   \n"
                                     "#https://disabled.example.com/rss\n"
                                     "https://a.example.com/rss\n"));
    Config config;
    config.set("RSS_FEED_FILE", feed_file.getFilePath());
    config.resolveFeedUrls();
    CHECK_EQ(config.feed_urls_.size(), 2u);
    CHECK_EQ(config.feed_urls_[0], "https://a.example.com/rss");
    CHECK_EQ(config.feed_urls_[1], "https://b.example.com/atom");

    // RSS_FEED_URLS takes precedence:
    Config explicit_config;
    explicit_config.set("RSS_FEED_URLS", "https://c.example.com/rss");
    explicit_config.set("RSS_FEED_FILE", feed_file.getFilePath());
    explicit_config.resolveFeedUrls();
    CHECK_EQ(explicit_config.feed_urls_.size(), 1u);
    CHECK_EQ(explicit_config.feed_urls_[0], "https://c.example.com/rss");

    Config missing_file_config;
    missing_file_config.set("RSS_FEED_FILE", "/nonexistent/feeds.txt");
    missing_file_config.resolveFeedUrls();
    CHECK_TRUE(missing_file_config.feed_urls_.empty());
}


TEST(LoadReadsTheFeedFile) {
    ClearEnvironment();
    const FileUtil::AutoTempFile feed_file("/tmp/ContentAcquisitionConfigTests", ".txt");
    CHECK_TRUE(FileUtil::WriteString(feed_file.getFilePath(), "https://a.example.com/rss\n"));
    MiscUtil::SetEnv("RSS_FEED_FILE", feed_file.getFilePath());

    const Config config(Config::Load());
    CHECK_EQ(config.feed_urls_.size(), 1u);
    CHECK_EQ(config.feed_urls_[0], "https://a.example.com/rss");

    ClearEnvironment();
}


TEST(IniFileAndEnvironmentPrecedence) {
    ClearEnvironment();
    const FileUtil::AutoTempFile ini_file("/tmp/ContentAcquisitionConfigTests", ".conf");
    CHECK_TRUE(FileUtil::WriteString(ini_file.getFilePath(),
                                     "[content_acquisition]\n"
                                     "url_allowed_schemes = http,https\n"
                                     "rss_max_articles = 2\n"
                                     "rss_item_link_policy = b # comment\n"
                                     "rss_feed_file =\n"
                                     "http_read_timeout_sec = 20\n"));
    MiscUtil::SetEnv("HTTP_READ_TIMEOUT_SEC", "1");

    const Config config(Config::Load(ini_file.getFilePath()));
    CHECK_EQ(config.allowed_schemes_.size(), 2u);
    CHECK_EQ(config.max_articles_, 2u);
    CHECK_EQ(config.link_policy_mode_, LINK_POLICY_B);
    CHECK_EQ(config.feed_file_, "config/rss_feeds.txt");
    CHECK_EQ(config.read_timeout_, 1u);

    ClearEnvironment();
}


TEST(UnknownIniEntry) {
    ClearEnvironment();
    const FileUtil::AutoTempFile ini_file("/tmp/ContentAcquisitionConfigTests", ".conf");
    CHECK_TRUE(FileUtil::WriteString(ini_file.getFilePath(), "[content_acquisition]\nurl_max_redirect = 4\n"));

    bool caught_error(false);
    try {
        Config::Load(ini_file.getFilePath());
    } catch (const std::runtime_error &) {
        caught_error = true;
    }
    CHECK_TRUE(caught_error);
}


TEST_MAIN(ContentAcquisitionConfig)

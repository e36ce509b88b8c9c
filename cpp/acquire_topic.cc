/** \file   acquire_topic.cc
 *  \brief  Fetches article text for a URL or for keywords matched against the configured feeds.
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

#include <iostream>
#include <vector>
#include <cstdlib>
#include "ContentAcquisition.h"
#include "DnsUtil.h"
#include "Downloader.h"
#include "StringUtil.h"
#include "util.h"


namespace {


const int EXIT_NO_KEYWORD_MATCH(2);


[[noreturn]] void Usage() {
    ::Usage("[--config-file=path] topic\n"
            "If \"topic\" starts with http:// or https:// it is fetched directly, otherwise the configured feeds are\n"
            "searched for it.  Settings are taken from the [content_acquisition] section of the config file, if any,\n"
            "and from environment variables like URL_ALLOWLIST_DOMAINS or RSS_FEED_URLS.");
}


void PrintArticle(const ContentAcquisition::ArticleDocument &article) {
    std::cout << "URL: " << article.url_ << '\n';
    std::cout << "Title: " << article.title_ << '\n';
    std::cout << article.text_ << "\n\n";
}


int ReportFailure(const ContentAcquisition::Failure &failure) {
    std::cerr << failure.toString() << '\n';
    return failure.kind_ == ContentAcquisition::Failure::NO_KEYWORD_MATCH ? EXIT_NO_KEYWORD_MATCH : EXIT_FAILURE;
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    if (argc < 2)
        Usage();

    std::string config_file_path;
    const std::string CONFIG_FILE_FLAG_PREFIX("--config-file=");
    if (StringUtil::StartsWith(argv[1], CONFIG_FILE_FLAG_PREFIX)) {
        config_file_path = argv[1] + CONFIG_FILE_FLAG_PREFIX.length();
        --argc, ++argv;
    }

    if (argc != 2)
        Usage();

    const std::string topic(StringUtil::TrimWhite(argv[1]));
    const ContentAcquisition::Config config(ContentAcquisition::Config::Load(config_file_path));
    DnsUtil::SystemResolver resolver;
    Downloader downloader;
    ContentAcquisition::ContentAcquirer content_acquirer(config, resolver, downloader);

    ContentAcquisition::Failure failure;
    if (StringUtil::StartsWith(topic, "http://", /* ignore_case = */ true)
        or StringUtil::StartsWith(topic, "https://", /* ignore_case = */ true))
    {
        ContentAcquisition::ArticleDocument article;
        if (not content_acquirer.fetchDirect(topic, &article, &failure))
            return ReportFailure(failure);
        PrintArticle(article);
    } else {
        std::vector<ContentAcquisition::ArticleDocument> articles;
        if (not content_acquirer.searchFeeds(topic, &articles, &failure))
            return ReportFailure(failure);
        for (const auto &article : articles)
            PrintArticle(article);
    }

    return EXIT_SUCCESS;
}

/** \brief Test cases for ContentAcquisition::SecureFetcher
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
#include "ContentAcquisitionFetcher.h"
#include <algorithm>
#include "FakeNetwork.h"
#include "UnitTest.h"


using namespace ContentAcquisition;


namespace {


// "example.com" and its subdomains resolve to a public address, "internal.example.com" to a private one.
struct Network {
    Config config_;
    FakeResolver resolver_;
    ScriptedTransport transport_;
    UrlValidator validator_;
    SecureFetcher fetcher_;
public:
    Network(): validator_(config_, resolver_), fetcher_(config_, validator_, transport_) {
        for (const auto &host : { "example.com", "news.example.com", "a.example.com", "b.example.com", "c.example.com",
                                  "d.example.com" })
            resolver_.addHost(host, { "93.184.216.34" });
        resolver_.addHost("internal.example.com", { "10.0.0.5" });
    }
};


} // unnamed namespace


TEST(Success) {
    Network network;
    network.transport_.addDocument("https://news.example.com/article", "text/html; charset=UTF-8", "<html>Hello</html>");

    FetchResult result;
    FetchError error;
    CHECK_TRUE(network.fetcher_.fetch("https://news.example.com/article", ARTICLE, {}, &result, &error));
    CHECK_EQ(result.url_, "https://news.example.com/article");
    CHECK_EQ(result.body_, "<html>Hello</html>");
    CHECK_EQ(result.content_type_, "text/html");
    CHECK_EQ(result.status_code_, 200u);
    CHECK_EQ(result.redirect_count_, 0u);

    CHECK_EQ(network.transport_.requests_.size(), 1u);
    const HttpRequest &request(network.transport_.requests_[0]);
    CHECK_EQ(request.url_.addresses_.size(), 1u);
    CHECK_EQ(request.connect_timeout_, 3000u);
    CHECK_EQ(request.low_speed_timeout_, 7000u);
    CHECK_EQ(request.time_limit_, 10000u);
}


TEST(RejectedBeforeAnyRequest) {
    Network network;
    FetchResult result;
    FetchError error;
    CHECK_FALSE(network.fetcher_.fetch("https://127.0.0.1/admin", ARTICLE, {}, &result, &error));
    CHECK_EQ(error.code_, REJECTED);
    CHECK_EQ(error.rejection_.reason_, BLOCKED_ADDRESS);
    CHECK_TRUE(network.transport_.requests_.empty());
}


TEST(DefaultAndExtraHeaders) {
    Network network;
    network.transport_.addDocument("https://news.example.com/feed", "application/rss+xml", "<rss/>");

    FetchResult result;
    FetchError error;
    CHECK_TRUE(network.fetcher_.fetch("https://news.example.com/feed", FEED, { "user-agent: TestAgent/1.0", "X-Test: 1" },
                                      &result, &error));

    const std::vector<std::string> &headers(network.transport_.requests_[0].headers_);
    CHECK_EQ(headers.size(), 3u);
    CHECK_EQ(headers[0], "user-agent: TestAgent/1.0");
    CHECK_TRUE(headers[1].find("Accept: application/rss+xml") == 0);
    CHECK_EQ(headers[2], "X-Test: 1");
}


TEST(RedirectsDisabled) {
    Network network;
    network.transport_.addRedirect("https://a.example.com/", "https://b.example.com/");
    network.transport_.addDocument("https://b.example.com/", "text/html", "<html/>");

    FetchResult result;
    FetchError error;
    CHECK_FALSE(network.fetcher_.fetch("https://a.example.com/", ARTICLE, {}, &result, &error));
    CHECK_EQ(error.code_, REDIRECT_LIMIT_EXCEEDED);
    CHECK_FALSE(network.transport_.wasRequested("https://b.example.com/"));
}


TEST(RedirectsFollowed) {
    Network network;
    network.config_.set("URL_ALLOW_REDIRECTS", "true");
    network.transport_.addRedirect("https://a.example.com/start", "https://b.example.com/next", 301);
    network.transport_.addRedirect("https://b.example.com/next", "/final?x=1", 307);
    network.transport_.addDocument("https://b.example.com/final?x=1", "text/plain", "done");

    FetchResult result;
    FetchError error;
    CHECK_TRUE(network.fetcher_.fetch("https://a.example.com/start", ARTICLE, {}, &result, &error));
    CHECK_EQ(result.url_, "https://b.example.com/final?x=1");
    CHECK_EQ(result.body_, "done");
    CHECK_EQ(result.redirect_count_, 2u);
    CHECK_EQ(network.transport_.requests_.size(), 3u);
}


TEST(RedirectLimitExceeded) {
    Network network;
    network.config_.set("URL_ALLOW_REDIRECTS", "true");
    network.config_.set("URL_MAX_REDIRECTS", "2");
    network.transport_.addRedirect("https://a.example.com/", "https://b.example.com/");
    network.transport_.addRedirect("https://b.example.com/", "https://c.example.com/");
    network.transport_.addRedirect("https://c.example.com/", "https://d.example.com/");
    network.transport_.addDocument("https://d.example.com/", "text/html", "<html/>");

    FetchResult result;
    FetchError error;
    CHECK_FALSE(network.fetcher_.fetch("https://a.example.com/", ARTICLE, {}, &result, &error));
    CHECK_EQ(error.code_, REDIRECT_LIMIT_EXCEEDED);
    CHECK_EQ(network.transport_.requests_.size(), 3u);
    CHECK_FALSE(network.transport_.wasRequested("https://d.example.com/"));
}


TEST(RedirectToBlockedAddress) {
    Network network;
    network.config_.set("URL_ALLOW_REDIRECTS", "true");
    network.transport_.addRedirect("https://news.example.com/go", "https://internal.example.com/secrets");
    network.transport_.addDocument("https://internal.example.com/secrets", "text/plain", "secret");

    FetchResult result;
    FetchError error;
    CHECK_FALSE(network.fetcher_.fetch("https://news.example.com/go", ARTICLE, {}, &result, &error));
    CHECK_EQ(error.code_, REJECTED);
    CHECK_EQ(error.rejection_.reason_, BLOCKED_ADDRESS);
    CHECK_EQ(error.url_, "https://internal.example.com/secrets");
    CHECK_FALSE(network.transport_.wasRequested("https://internal.example.com/secrets"));
}


TEST(RedirectToDisallowedScheme) {
    Network network;
    network.config_.set("URL_ALLOW_REDIRECTS", "true");
    network.transport_.addRedirect("https://news.example.com/go", "http://news.example.com/plain");

    FetchResult result;
    FetchError error;
    CHECK_FALSE(network.fetcher_.fetch("https://news.example.com/go", ARTICLE, {}, &result, &error));
    CHECK_EQ(error.code_, REJECTED);
    CHECK_EQ(error.rejection_.reason_, DISALLOWED_SCHEME);
}


TEST(RedirectWithoutLocation) {
    Network network;
    network.config_.set("URL_ALLOW_REDIRECTS", "true");
    network.transport_.addResponse("https://news.example.com/go", 302, { "Content-Length: 0" });

    FetchResult result;
    FetchError error;
    CHECK_FALSE(network.fetcher_.fetch("https://news.example.com/go", ARTICLE, {}, &result, &error));
    CHECK_EQ(error.code_, STATUS_ERROR);
}


TEST(StatusError) {
    Network network;
    network.transport_.addResponse("https://news.example.com/missing", 404, { "Content-Type: text/html" }, "<html>Not found</html>");

    FetchResult result;
    FetchError error;
    CHECK_FALSE(network.fetcher_.fetch("https://news.example.com/missing", ARTICLE, {}, &result, &error));
    CHECK_EQ(error.code_, STATUS_ERROR);
    CHECK_EQ(error.status_code_, 404u);
    CHECK_EQ(network.transport_.delivered_body_bytes_, 0u);
}


TEST(ConnectionFailure) {
    Network network;
    network.transport_.addConnectionFailure("https://news.example.com/");

    FetchResult result;
    FetchError error;
    CHECK_FALSE(network.fetcher_.fetch("https://news.example.com/", ARTICLE, {}, &result, &error));
    CHECK_EQ(error.code_, CONNECTION_FAILURE);
    CHECK_EQ(error.message_, "Connection refused");
}


TEST(ContentTypes) {
    Network network;
    network.transport_.addDocument("https://news.example.com/image", "image/png", "\x89PNG");
    network.transport_.addDocument("https://news.example.com/page", "Application/XHTML+XML", "<html/>");
    network.transport_.addResponse("https://news.example.com/untyped", 200, { }, "plain body");

    FetchResult result;
    FetchError error;
    CHECK_FALSE(network.fetcher_.fetch("https://news.example.com/image", ARTICLE, {}, &result, &error));
    CHECK_EQ(error.code_, UNSUPPORTED_CONTENT_TYPE);
    CHECK_EQ(network.transport_.delivered_body_bytes_, 0u);

    CHECK_TRUE(network.fetcher_.fetch("https://news.example.com/page", ARTICLE, {}, &result, &error));
    CHECK_EQ(result.content_type_, "application/xhtml+xml");

    // An HTML page is not a feed.
    CHECK_FALSE(network.fetcher_.fetch("https://news.example.com/page", FEED, {}, &result, &error));
    CHECK_EQ(error.code_, UNSUPPORTED_CONTENT_TYPE);

    CHECK_TRUE(network.fetcher_.fetch("https://news.example.com/untyped", FEED, {}, &result, &error));
    CHECK_EQ(result.content_type_, "");
    CHECK_EQ(result.body_, "plain body");

    CHECK_TRUE(SecureFetcher::IsAcceptableContentType("text/xml", FEED));
    CHECK_TRUE(SecureFetcher::IsAcceptableContentType("application/atom+xml", FEED));
    CHECK_FALSE(SecureFetcher::IsAcceptableContentType("application/json", FEED));
    CHECK_FALSE(SecureFetcher::IsAcceptableContentType("application/xml", ARTICLE));
}


TEST(TooLargeByContentLength) {
    Network network;
    network.config_.set("HTTP_MAX_BYTES", "100");
    network.transport_.addDocument("https://news.example.com/big", "text/html", std::string(500, 'x'));

    FetchResult result;
    FetchError error;
    CHECK_FALSE(network.fetcher_.fetch("https://news.example.com/big", ARTICLE, {}, &result, &error));
    CHECK_EQ(error.code_, TOO_LARGE);
    CHECK_EQ(network.transport_.delivered_body_bytes_, 0u);
}


TEST(TooLargeWhileStreaming) {
    Network network;
    network.config_.set("RSS_MAX_BYTES", "150");
    network.transport_.addResponse("https://news.example.com/feed", 200, { "Content-Type: application/rss+xml" },
                                   std::string(1000, 'x'), /* chunk_size = */ 64);

    FetchResult result;
    FetchError error;
    CHECK_FALSE(network.fetcher_.fetch("https://news.example.com/feed", FEED, {}, &result, &error));
    CHECK_EQ(error.code_, TOO_LARGE);
    CHECK_TRUE(result.body_.empty());
    CHECK_LE(network.transport_.delivered_body_bytes_, 192u);
}


TEST(BodyAtTheCeiling) {
    Network network;
    network.config_.set("RSS_MAX_BYTES", "128");
    network.transport_.addResponse("https://news.example.com/feed", 200, { "Content-Type: text/xml" }, std::string(128, 'x'),
                                   /* chunk_size = */ 64);

    FetchResult result;
    FetchError error;
    CHECK_TRUE(network.fetcher_.fetch("https://news.example.com/feed", FEED, {}, &result, &error));
    CHECK_EQ(result.body_.size(), 128u);
}


TEST_MAIN(SecureFetcher)

/** \brief Fetching of untrusted URLs with per-hop validation and size limits.
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
#include <stdexcept>
#include "StringUtil.h"
#include "Url.h"
#include "UrlUtil.h"
#include "util.h"


namespace ContentAcquisition {


std::string FetchErrorCodeToString(const FetchErrorCode code) {
    switch (code) {
    case REJECTED:
        return "REJECTED";
    case CONNECTION_FAILURE:
        return "CONNECTION_FAILURE";
    case STATUS_ERROR:
        return "STATUS_ERROR";
    case UNSUPPORTED_CONTENT_TYPE:
        return "UNSUPPORTED_CONTENT_TYPE";
    case TOO_LARGE:
        return "TOO_LARGE";
    case REDIRECT_LIMIT_EXCEEDED:
        return "REDIRECT_LIMIT_EXCEEDED";
    }

    throw std::runtime_error("in ContentAcquisition::FetchErrorCodeToString: unknown code " + std::to_string(code) + "!");
}


std::string FetchError::toString() const {
    std::string as_string(FetchErrorCodeToString(code_) + ": " + message_);
    if (not url_.empty())
        as_string += " (" + UrlUtil::SanitizeUrlForLogging(url_) + ")";
    return as_string;
}


const std::string SecureFetcher::USER_AGENT("Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36");


const std::vector<std::string> &SecureFetcher::GetContentTypePrefixes(const Purpose purpose) {
    static const std::vector<std::string> ARTICLE_PREFIXES{ "text/html", "application/xhtml", "text/plain" };
    static const std::vector<std::string> FEED_PREFIXES{ "application/rss", "application/atom", "application/xml", "text/xml",
                                                         "text/plain" };
    return purpose == FEED ? FEED_PREFIXES : ARTICLE_PREFIXES;
}


bool SecureFetcher::IsAcceptableContentType(const std::string &simplified_content_type, const Purpose purpose) {
    if (simplified_content_type.empty())
        return true;

    for (const auto &prefix : GetContentTypePrefixes(purpose)) {
        if (StringUtil::StartsWith(simplified_content_type, prefix))
            return true;
    }

    return false;
}


std::vector<std::string> SecureFetcher::GetDefaultHeaders(const Purpose purpose) {
    std::vector<std::string> headers{ "User-Agent: " + USER_AGENT };
    if (purpose == FEED)
        headers.emplace_back("Accept: application/rss+xml, application/atom+xml, application/xml;q=0.9, text/xml;q=0.9, "
                             "text/plain;q=0.5");
    else
        headers.emplace_back("Accept: text/html, application/xhtml+xml, text/plain;q=0.5");

    return headers;
}


namespace {


inline std::string GetHeaderName(const std::string &header) {
    return StringUtil::ToLower(StringUtil::TrimWhite(header.substr(0, header.find(':'))));
}


// Headers in "extra_headers" replace headers with the same (case-insensitive) name in "headers".
void MergeHeaders(const std::vector<std::string> &extra_headers, std::vector<std::string> * const headers) {
    for (const auto &extra_header : extra_headers) {
        const std::string name(GetHeaderName(extra_header));
        bool replaced(false);
        for (auto &header : *headers) {
            if (GetHeaderName(header) == name) {
                header = extra_header;
                replaced = true;
                break;
            }
        }
        if (not replaced)
            headers->emplace_back(extra_header);
    }
}


// Collects the response of a single hop.  The body is only read for successful responses with an acceptable content
// type and it never grows beyond "max_bytes".
class HopHandler : public HttpTransport::ResponseHandler {
    const Purpose purpose_;
    const size_t max_bytes_;
    bool have_header_;
    HttpHeader header_;
    std::string body_;
    bool exceeded_max_bytes_;
public:
    HopHandler(const Purpose purpose, const size_t max_bytes)
        : purpose_(purpose), max_bytes_(max_bytes), have_header_(false), exceeded_max_bytes_(false) { }

    bool onHeader(const HttpHeader &header) override;
    bool onBodyChunk(const char * const data, const size_t size) override;

    inline bool haveHeader() const { return have_header_; }
    inline const HttpHeader &getHeader() const { return header_; }
    inline std::string &getBody() { return body_; }
    inline bool exceededMaxBytes() const { return exceeded_max_bytes_; }
    inline bool contentLengthExceedsMaxBytes() const {
        return header_.hasContentLength() and header_.getContentLength() > max_bytes_;
    }
};


bool HopHandler::onHeader(const HttpHeader &header) {
    header_ = header;
    have_header_ = true;

    return header_.isSuccess() and SecureFetcher::IsAcceptableContentType(header_.getMediaType(), purpose_)
           and not contentLengthExceedsMaxBytes();
}


bool HopHandler::onBodyChunk(const char * const data, const size_t size) {
    if (body_.size() + size > max_bytes_) {
        exceeded_max_bytes_ = true;
        body_.clear();
        body_.shrink_to_fit();
        return false;
    }

    body_.append(data, size);
    return true;
}


inline bool Fail(const FetchErrorCode code, const std::string &url, const std::string &message, FetchError * const error) {
    *error = FetchError(code, url, message);
    return false;
}


} // unnamed namespace


bool SecureFetcher::fetch(const std::string &url, const Purpose purpose, const std::vector<std::string> &extra_headers,
                          FetchResult * const result, FetchError * const error)
{
    std::vector<std::string> headers(GetDefaultHeaders(purpose));
    MergeHeaders(extra_headers, &headers);

    const unsigned max_redirects(config_.getMaxRedirects());
    const size_t max_bytes(config_.getMaxBytes(purpose));
    std::string current_url(url);
    unsigned redirect_count(0);

    // Each iteration handles one hop.  Every redirect increments "redirect_count" and we give up once it exceeds
    // "max_redirects", so there are at most max_redirects + 1 iterations.
    for (;;) {
        HttpRequest request;
        Rejection rejection;
        if (not validator_.validate(current_url, purpose, &request.url_, &rejection)) {
            *error = FetchError(REJECTED, current_url, rejection.toString());
            error->rejection_ = rejection;
            return false;
        }

        request.headers_ = headers;
        request.connect_timeout_ = config_.connect_timeout_ * 1000;
        request.low_speed_timeout_ = config_.read_timeout_ * 1000;
        request.time_limit_ = config_.getTimeLimitPerHop();

        LOG_DEBUG("requesting " + UrlUtil::SanitizeUrlForLogging(request.url_.url_) + " (hop " + std::to_string(redirect_count) + ")");
        HopHandler hop_handler(purpose, max_bytes);
        std::string transport_error;
        const bool transfer_succeeded(transport_.perform(request, &hop_handler, &transport_error));

        if (not hop_handler.haveHeader())
            return Fail(CONNECTION_FAILURE, current_url,
                        transport_error.empty() ? std::string("no response header received") : transport_error, error);

        const HttpHeader &header(hop_handler.getHeader());
        if (header.isRedirect()) {
            if (max_redirects == 0)
                return Fail(REDIRECT_LIMIT_EXCEEDED, current_url,
                            "redirect (" + std::to_string(header.getStatusCode()) + ") but redirects are disabled", error);
            if (header.getLocation().empty())
                return Fail(STATUS_ERROR, current_url, "redirect (" + std::to_string(header.getStatusCode()) + ") without a Location",
                            error);

            std::string next_url;
            if (not Url(request.url_.url_).makeAbsolute(header.getLocation(), &next_url))
                next_url = header.getLocation(); // Rejected as malformed on the next iteration.

            ++redirect_count;
            if (redirect_count > max_redirects)
                return Fail(REDIRECT_LIMIT_EXCEEDED, next_url, "more than " + std::to_string(max_redirects) + " redirects", error);

            LOG_DEBUG("redirected to " + UrlUtil::SanitizeUrlForLogging(next_url));
            current_url = next_url;
            continue;
        }

        if (not header.isSuccess()) {
            Fail(STATUS_ERROR, current_url, "HTTP status " + std::to_string(header.getStatusCode()), error);
            error->status_code_ = header.getStatusCode();
            return false;
        }

        const std::string content_type(header.getMediaType());
        if (not IsAcceptableContentType(content_type, purpose))
            return Fail(UNSUPPORTED_CONTENT_TYPE, current_url, "unexpected content type \"" + content_type + "\"", error);

        if (hop_handler.contentLengthExceedsMaxBytes())
            return Fail(TOO_LARGE, current_url,
                        "Content-Length " + std::to_string(header.getContentLength()) + " exceeds " + std::to_string(max_bytes)
                            + " bytes",
                        error);
        if (hop_handler.exceededMaxBytes())
            return Fail(TOO_LARGE, current_url, "body exceeds " + std::to_string(max_bytes) + " bytes", error);

        if (not transfer_succeeded)
            return Fail(CONNECTION_FAILURE, current_url, transport_error, error);

        result->url_ = request.url_.url_;
        result->body_.swap(hop_handler.getBody());
        result->content_type_ = content_type;
        result->status_code_ = header.getStatusCode();
        result->redirect_count_ = redirect_count;
        LOG_DEBUG("fetched " + std::to_string(result->body_.size()) + " bytes from " + UrlUtil::SanitizeUrlForLogging(result->url_));

        return true;
    }
}


} // namespace ContentAcquisition

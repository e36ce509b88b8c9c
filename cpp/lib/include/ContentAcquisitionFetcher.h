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
#pragma once


#include <string>
#include <vector>
#include "ContentAcquisitionConfig.h"
#include "ContentAcquisitionUrlValidator.h"
#include "HttpHeader.h"


namespace ContentAcquisition {


struct HttpRequest {
    ValidatedUrl url_;
    std::vector<std::string> headers_; // "Name: value"
    unsigned connect_timeout_; // In ms.
    unsigned low_speed_timeout_; // In ms.  A transfer that stalls for this long is aborted.
    unsigned time_limit_; // In ms.  Covers the whole request.
public:
    HttpRequest(): connect_timeout_(0), low_speed_timeout_(0), time_limit_(0) { }
};


/** \class  HttpTransport
 *  \brief  Issues a single GET request.  Redirects are never followed and no proxy is used.
 */
class HttpTransport {
public:
    class ResponseHandler {
    public:
        virtual ~ResponseHandler() = default;

        /** \brief Called once with the final (non-1xx) response header.
         *  \return False if the body should not be read, which aborts the transfer.
         */
        virtual bool onHeader(const HttpHeader &header) = 0;

        /** \return False to abort the transfer. */
        virtual bool onBodyChunk(const char * const data, const size_t size) = 0;
    };
public:
    virtual ~HttpTransport() = default;

    /** \return False if the transfer failed or was aborted by "handler", in which case "error_message" will be set. */
    virtual bool perform(const HttpRequest &request, ResponseHandler * const handler, std::string * const error_message) = 0;
};


enum FetchErrorCode {
    REJECTED,
    CONNECTION_FAILURE,
    STATUS_ERROR,
    UNSUPPORTED_CONTENT_TYPE,
    TOO_LARGE,
    REDIRECT_LIMIT_EXCEEDED
};


std::string FetchErrorCodeToString(const FetchErrorCode code);


struct FetchError {
    FetchErrorCode code_;
    std::string url_; // The hop that failed.
    std::string message_;
    Rejection rejection_; // Only meaningful for REJECTED.
    unsigned status_code_; // Only meaningful for STATUS_ERROR.
public:
    FetchError(): code_(CONNECTION_FAILURE), status_code_(0) { }
    FetchError(const FetchErrorCode code, const std::string &url, const std::string &message)
        : code_(code), url_(url), message_(message), status_code_(0) { }

    std::string toString() const;
};


struct FetchResult {
    std::string url_; // After following all redirects.
    std::string body_;
    std::string content_type_; // Simplified, i.e. lowercase and without parameters.  May be empty.
    unsigned status_code_;
    unsigned redirect_count_;
public:
    FetchResult(): status_code_(0), redirect_count_(0) { }
};


/** \class  SecureFetcher
 *  \brief  Downloads a URL, following redirects manually so that every hop passes the UrlValidator before it is requested.
 *
 *  Bodies are only returned complete: a body that would exceed the byte ceiling of the purpose fails the fetch with
 *  TOO_LARGE, either as soon as the Content-Length header announces it or as soon as the streamed body crosses the ceiling.
 */
class SecureFetcher {
    const Config &config_;
    const UrlValidator &validator_;
    HttpTransport &transport_;
public:
    static const std::string USER_AGENT;

    SecureFetcher(const Config &config, const UrlValidator &validator, HttpTransport &transport)
        : config_(config), validator_(validator), transport_(transport) { }

    /** \param extra_headers  "Name: value" strings, replacing default headers with the same name.
     *  \return True on success, else false with "error" describing the failure.
     */
    bool fetch(const std::string &url, const Purpose purpose, const std::vector<std::string> &extra_headers, FetchResult * const result,
               FetchError * const error);

    /** \note An empty content type is accepted. */
    static bool IsAcceptableContentType(const std::string &simplified_content_type, const Purpose purpose);

    static const std::vector<std::string> &GetContentTypePrefixes(const Purpose purpose);
    static std::vector<std::string> GetDefaultHeaders(const Purpose purpose);
};


} // namespace ContentAcquisition

/** \file   Downloader.h
 *  \brief  HTTP(S) transport based on libcurl.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *
 *  \copyright 2005-2008 Project iVia.
 *  \copyright 2005-2008 The Regents of The University of California.
 *  \copyright 2015-2024 Universitätsbibliothek Tübingen.
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
#include <curl/curl.h>
#include "ContentAcquisitionFetcher.h"
#include "util.h"


/** \class  Downloader
 *  \brief  Performs single HTTP(S) GET requests with libcurl.
 *
 *  Only http and https are spoken, redirects are reported but never followed and proxies from the environment are
 *  ignored.  If the request carries resolved addresses, the connection is pinned to them so that libcurl does not
 *  perform a DNS lookup of its own.
 */
class Downloader : public ContentAcquisition::HttpTransport {
    CURL *easy_handle_;
    CURLcode curl_error_code_;
    char error_buffer_[CURL_ERROR_SIZE];
    std::string header_block_;
    ResponseHandler *handler_;
    bool aborted_by_handler_;
    bool final_header_delivered_; // Header blocks after the final header hold chunked-encoding trailers.
public:
    static constexpr long BUFFER_SIZE = 64 * 1024;
public:
    Downloader();
    Downloader(const Downloader &) = delete;
    Downloader &operator=(const Downloader &) = delete;
    virtual ~Downloader();

    bool perform(const ContentAcquisition::HttpRequest &request, ResponseHandler * const handler,
                 std::string * const error_message) override;

    /** \return A CURLOPT_RESOLVE entry like "example.com:443:192.0.2.1,[2001:db8::1]" or an empty string if
     *          "url" has no addresses or its host is an IP address literal.
     */
    static std::string GetResolveEntry(const ContentAcquisition::ValidatedUrl &url);
protected:
    // Resets the per-transfer state.
    void beginTransfer(ResponseHandler * const handler);

    size_t headerFunction(char *data, size_t size, size_t nmemb);
private:
    size_t writeFunction(char *data, size_t size, size_t nmemb);
    static size_t WriteFunction(char *data, size_t size, size_t nmemb, void *this_pointer);
    static size_t HeaderFunction(char *data, size_t size, size_t nmemb, void *this_pointer);
    template <typename OptionType>
    void curlEasySetopt(const CURLoption option, OptionType value, const std::string &caller_info) {
        if ((curl_error_code_ = ::curl_easy_setopt(easy_handle_, option, value)) != CURLE_OK)
            LOG_ERROR("curl_easy_setopt(" + caller_info + ") failed!");
    }
};

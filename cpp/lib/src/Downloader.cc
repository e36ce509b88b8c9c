/** \file    Downloader.cc
 *  \brief   Implementation of class Downloader.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2008 Project iVia.
 *  Copyright 2008 The Regents of The University of California.
 *  Copyright 2017-2024 Universitätsbibliothek Tübingen.
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as published
 *  by the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#include "Downloader.h"
#include <algorithm>
#include <cstdlib>
#include "Compiler.h"
#include "NetUtil.h"
#include "StringUtil.h"


namespace {


int GlobalInit() {
    if (unlikely(::curl_global_init(CURL_GLOBAL_ALL) != 0)) {
        const std::string error_message("curl_global_init(3) failed!\n");
        const ssize_t dummy = ::write(STDERR_FILENO, error_message.c_str(), error_message.length());
        (void)dummy;
        ::_exit(EXIT_FAILURE);
    }

    return 0;
}


int dummy(GlobalInit());


} // unnamed namespace


Downloader::Downloader(): curl_error_code_(CURLE_OK), handler_(nullptr), aborted_by_handler_(false), final_header_delivered_(false) {
    error_buffer_[0] = '\0';
    if ((easy_handle_ = ::curl_easy_init()) == nullptr)
        LOG_ERROR("curl_easy_init() failed!");
}


Downloader::~Downloader() {
    ::curl_easy_cleanup(easy_handle_);
}


std::string Downloader::GetResolveEntry(const ContentAcquisition::ValidatedUrl &url) {
    NetUtil::IPAddress literal;
    if (url.addresses_.empty() or NetUtil::IPAddress::Parse(url.host_, &literal))
        return "";

    std::string resolve_entry(url.host_ + ":" + std::to_string(url.port_) + ":");
    bool first(true);
    for (const auto &address : url.addresses_) {
        if (not first)
            resolve_entry += ',';
        first = false;

        if (address.find(':') != std::string::npos)
            resolve_entry += "[" + address + "]";
        else
            resolve_entry += address;
    }

    return resolve_entry;
}


void Downloader::beginTransfer(ResponseHandler * const handler) {
    header_block_.clear();
    handler_ = handler;
    aborted_by_handler_ = false;
    final_header_delivered_ = false;
    error_buffer_[0] = '\0';
}


bool Downloader::perform(const ContentAcquisition::HttpRequest &request, ResponseHandler * const handler,
                         std::string * const error_message)
{
    ::curl_easy_reset(easy_handle_);
    beginTransfer(handler);

    curlEasySetopt(CURLOPT_NOSIGNAL, 1L, "Downloader::perform:CURLOPT_NOSIGNAL");
    curlEasySetopt(CURLOPT_NOPROGRESS, 1L, "Downloader::perform:CURLOPT_NOPROGRESS");
    curlEasySetopt(CURLOPT_HTTPGET, 1L, "Downloader::perform:CURLOPT_HTTPGET");
    curlEasySetopt(CURLOPT_FOLLOWLOCATION, 0L, "Downloader::perform:CURLOPT_FOLLOWLOCATION");
#if LIBCURL_VERSION_NUM >= 0x075500
    curlEasySetopt(CURLOPT_PROTOCOLS_STR, "http,https", "Downloader::perform:CURLOPT_PROTOCOLS_STR");
#else
    curlEasySetopt(CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS), "Downloader::perform:CURLOPT_PROTOCOLS");
#endif
    curlEasySetopt(CURLOPT_PROXY, "", "Downloader::perform:CURLOPT_PROXY");
    curlEasySetopt(CURLOPT_NOPROXY, "*", "Downloader::perform:CURLOPT_NOPROXY");
    curlEasySetopt(CURLOPT_ACCEPT_ENCODING, "", "Downloader::perform:CURLOPT_ACCEPT_ENCODING");
    curlEasySetopt(CURLOPT_BUFFERSIZE, BUFFER_SIZE, "Downloader::perform:CURLOPT_BUFFERSIZE");
    curlEasySetopt(CURLOPT_ERRORBUFFER, error_buffer_, "Downloader::perform:CURLOPT_ERRORBUFFER");
    curlEasySetopt(CURLOPT_HEADERFUNCTION, HeaderFunction, "Downloader::perform:CURLOPT_HEADERFUNCTION");
    curlEasySetopt(CURLOPT_HEADERDATA, reinterpret_cast<void *>(this), "Downloader::perform:CURLOPT_HEADERDATA");
    curlEasySetopt(CURLOPT_WRITEFUNCTION, WriteFunction, "Downloader::perform:CURLOPT_WRITEFUNCTION");
    curlEasySetopt(CURLOPT_WRITEDATA, reinterpret_cast<void *>(this), "Downloader::perform:CURLOPT_WRITEDATA");

    curlEasySetopt(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout_),
                   "Downloader::perform:CURLOPT_CONNECTTIMEOUT_MS");
    curlEasySetopt(CURLOPT_TIMEOUT_MS, static_cast<long>(request.time_limit_), "Downloader::perform:CURLOPT_TIMEOUT_MS");

    // Less than one byte per second for "low_speed_timeout_" counts as a stalled transfer:
    curlEasySetopt(CURLOPT_LOW_SPEED_LIMIT, 1L, "Downloader::perform:CURLOPT_LOW_SPEED_LIMIT");
    curlEasySetopt(CURLOPT_LOW_SPEED_TIME, std::max(1L, static_cast<long>(request.low_speed_timeout_ / 1000)),
                   "Downloader::perform:CURLOPT_LOW_SPEED_TIME");

    curl_slist *http_headers(nullptr);
    for (const auto &header : request.headers_)
        http_headers = ::curl_slist_append(http_headers, header.c_str());
    curlEasySetopt(CURLOPT_HTTPHEADER, http_headers, "Downloader::perform:CURLOPT_HTTPHEADER");

    curl_slist *resolve_entries(nullptr);
    const std::string resolve_entry(GetResolveEntry(request.url_));
    if (not resolve_entry.empty()) {
        resolve_entries = ::curl_slist_append(resolve_entries, resolve_entry.c_str());
        curlEasySetopt(CURLOPT_RESOLVE, resolve_entries, "Downloader::perform:CURLOPT_RESOLVE");
    }

    curlEasySetopt(CURLOPT_URL, request.url_.url_.c_str(), "Downloader::perform:CURLOPT_URL");
    curl_error_code_ = ::curl_easy_perform(easy_handle_);

    ::curl_slist_free_all(http_headers);
    ::curl_slist_free_all(resolve_entries);
    handler_ = nullptr;

    if (curl_error_code_ == CURLE_OK)
        return true;

    if (aborted_by_handler_)
        *error_message = "transfer aborted";
    else if (error_buffer_[0] != '\0')
        *error_message = error_buffer_;
    else
        *error_message = ::curl_easy_strerror(curl_error_code_);

    return false;
}


size_t Downloader::writeFunction(char *data, size_t size, size_t nmemb) {
    const size_t total_size(size * nmemb);
    if (not handler_->onBodyChunk(data, total_size)) {
        aborted_by_handler_ = true;
        return 0;
    }

    return total_size;
}


size_t Downloader::WriteFunction(char *data, size_t size, size_t nmemb, void *this_pointer) {
    Downloader *downloader(reinterpret_cast<Downloader *>(this_pointer));
    return downloader->writeFunction(data, size, nmemb);
}


size_t Downloader::headerFunction(char *data, size_t size, size_t nmemb) {
    const size_t total_size(size * nmemb);
    const std::string line(data, total_size);
    if (not StringUtil::TrimWhite(line).empty()) {
        header_block_ += line;
        return total_size;
    }

    // An empty line terminates the header block.
    if (final_header_delivered_) {
        header_block_.clear();
        return total_size;
    }
    const HttpHeader header(header_block_);
    header_block_.clear();
    if (header.getStatusCode() >= 100 and header.getStatusCode() <= 199) // Interim responses like "100 Continue".
        return total_size;

    final_header_delivered_ = true;
    if (not handler_->onHeader(header)) {
        aborted_by_handler_ = true;
        return 0;
    }

    return total_size;
}


size_t Downloader::HeaderFunction(char *data, size_t size, size_t nmemb, void *this_pointer) {
    Downloader *downloader(reinterpret_cast<Downloader *>(this_pointer));
    return downloader->headerFunction(data, size, nmemb);
}

/** \file    DnsUtil.cc
 *  \brief   Implementation of DNS related utility functions.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2002-2009 Project iVia.
 *  Copyright 2002-2009 The Regents of The University of California.
 *  Copyright 2017-2024 Universitätsbibliothek Tübingen.
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2 of the License,
 *  or (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software Foundation, Inc.,
 *  59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#include "DnsUtil.h"
#include <algorithm>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>


namespace DnsUtil {


bool SystemResolver::resolve(const std::string &hostname, std::vector<std::string> * const ip_addresses,
                             std::string * const error_message) const
{
    ip_addresses->clear();
    error_message->clear();

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo *results(nullptr);
    const int retcode(::getaddrinfo(hostname.c_str(), nullptr, &hints, &results));
    if (retcode != 0) {
        *error_message = "getaddrinfo(3) failed for \"" + hostname + "\": " + std::string(::gai_strerror(retcode));
        return false;
    }

    for (const addrinfo *entry(results); entry != nullptr; entry = entry->ai_next) {
        if (entry->ai_family != AF_INET and entry->ai_family != AF_INET6)
            continue;

        char host[NI_MAXHOST];
        if (::getnameinfo(entry->ai_addr, entry->ai_addrlen, host, sizeof host, nullptr, 0, NI_NUMERICHOST) != 0)
            continue;

        const std::string ip_address(host);
        if (std::find(ip_addresses->cbegin(), ip_addresses->cend(), ip_address) == ip_addresses->cend())
            ip_addresses->emplace_back(ip_address);
    }

    ::freeaddrinfo(results);
    return true;
}


} // namespace DnsUtil

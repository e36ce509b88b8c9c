/** \file    DnsUtil.h
 *  \brief   Declarations for DNS utility functions and classes.
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

#ifndef DNS_UTIL_H
#define DNS_UTIL_H


#include <string>
#include <vector>


namespace DnsUtil {


/** \class  Resolver
 *  \brief  Maps host names to textual IP addresses.
 */
class Resolver {
public:
    virtual ~Resolver() = default;

    /** \brief  Looks up all IPv4 and IPv6 addresses of "hostname".
     *  \param  ip_addresses   The resolved addresses, in the order returned by the lookup and without duplicates.
     *  \param  error_message  If the lookup fails, a textual description will be returned here.
     *  \return False if the lookup failed, else true.  A successful lookup may return no addresses.
     */
    virtual bool resolve(const std::string &hostname, std::vector<std::string> * const ip_addresses,
                         std::string * const error_message) const = 0;
};


/** \class  SystemResolver
 *  \brief  A Resolver that uses getaddrinfo(3), i.e. the system's configured name services.
 */
class SystemResolver : public Resolver {
public:
    bool resolve(const std::string &hostname, std::vector<std::string> * const ip_addresses,
                 std::string * const error_message) const override;
};


} // namespace DnsUtil


#endif // ifndef DNS_UTIL_H

/** \file    Url.h
 *  \brief   Declaration of class Url, a parsed URL reference.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Jiangtao Hu
 */

/*
 *  Copyright 2003-2008 Project iVia.
 *  Copyright 2003-2008 The Regents of The University of California.
 *  Copyright 2024 Universitätsbibliothek Tübingen.
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

#ifndef URL_H
#define URL_H


#include <string>


/** \class  Url
 *  \brief  A class representing a URL (or more accurately: a URL reference).
 *
 *  The URL string is kept verbatim and, in addition, split into its generic components (RFC 3986).  A URL reference that
 *  has no scheme is considered to be relative and can be resolved against an absolute base URL with makeAbsolute().
 *  The host component is lowercased and, for IPv6 literals, returned without the enclosing square brackets.
 */
class Url {
    std::string url_;
    std::string scheme_, authority_, username_password_, host_, port_, path_, query_, fragment_;
    bool is_valid_;
    bool has_authority_, has_username_password_, has_query_, has_fragment_, host_is_ipv6_literal_;

public:
    explicit Url(const std::string &url);
    Url(const Url &rhs) = default;
    Url &operator=(const Url &rhs) = default;

    /** \return True if the URL reference could be parsed. */
    inline bool isValid() const { return is_valid_; }

    /** \return True if the URL has a scheme. */
    inline bool isAbsolute() const { return is_valid_ and not scheme_.empty(); }

    inline const std::string &toString() const { return url_; }
    inline operator const std::string &() const { return url_; }
    inline const char *c_str() const { return url_.c_str(); }

    /** \return The lowercased scheme. */
    inline const std::string &getScheme() const { return scheme_; }

    inline bool hasAuthority() const { return has_authority_; }

    /** \return The verbatim authority, i.e. user info, host and port. */
    inline const std::string &getAuthority() const { return authority_; }

    inline bool hasUsernamePassword() const { return has_username_password_; }
    inline const std::string &getUsernamePassword() const { return username_password_; }

    /** \return The lowercased host, IPv6 literals without brackets. */
    inline const std::string &getHost() const { return host_; }
    inline bool hostIsIPv6Literal() const { return host_is_ipv6_literal_; }

    inline const std::string &getPort() const { return port_; }

    /** \return The explicit port, or the default port for http and https, or 0 if there is neither. */
    unsigned short getPortNumber() const;

    inline const std::string &getPath() const { return path_; }
    inline bool hasQuery() const { return has_query_; }
    inline const std::string &getQuery() const { return query_; }
    inline bool hasFragment() const { return has_fragment_; }
    inline const std::string &getFragment() const { return fragment_; }

    /** \brief  Resolves a URL reference against this (absolute) URL.
     *  \param  reference     An absolute or relative URL reference, e.g. the contents of an HTTP "Location" header.
     *  \param  absolute_url  Where to store the result.
     *  \return False if this URL is not absolute or "reference" can't be parsed, else true.
     *  \note   Dot segments are removed as described in RFC 3986, section 5.2.4.  An absolute "reference" is returned as is.
     */
    bool makeAbsolute(const std::string &reference, std::string * const absolute_url) const;

    /** \brief Assembles a URL from its components.  An empty query or fragment is omitted. */
    static std::string MakeUrl(const std::string &scheme, const std::string &authority, const std::string &path,
                               const std::string &query, const std::string &fragment);

private:
    bool parse();
};


#endif // ifndef URL_H

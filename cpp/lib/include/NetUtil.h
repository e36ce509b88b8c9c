/** \file    NetUtil.h
 *  \brief   Declaration of network-related utility functions.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2002-2009 Project iVia.
 *  Copyright 2002-2009 The Regents of The University of California.
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

#ifndef NETUTIL_H
#define NETUTIL_H


#include <functional>
#include <string>
#include <vector>


namespace NetUtil {


/** \class  IPAddress
 *  \brief  An IPv4 or IPv6 address in network byte order.
 */
class IPAddress {
public:
    enum Family { IPV4, IPV6 };
private:
    Family family_;
    unsigned char bytes_[16];
public:
    IPAddress();
    IPAddress(const IPAddress &rhs) = default;
    IPAddress &operator=(const IPAddress &rhs) = default;

    /** \brief  Parses a textual IPv4 (dotted quad) or IPv6 address.
     *  \note   An IPv6 zone index, e.g. "%eth0", is ignored.
     *  \return True if "s" was a valid address, else false.
     */
    static bool Parse(const std::string &s, IPAddress * const address);

    inline Family getFamily() const { return family_; }
    inline unsigned getByteCount() const { return family_ == IPV4 ? 4 : 16; }
    inline const unsigned char *getBytes() const { return bytes_; }

    /** \return True if this is an IPv6 address of the form ::ffff:a.b.c.d. */
    bool isIPv4Mapped() const;

    /** \return The embedded IPv4 address of an IPv4-mapped IPv6 address.
     *  \note   Throws an exception if isIPv4Mapped() would return false.
     */
    IPAddress getMappedIPv4Address() const;

    std::string toString() const;

    bool operator==(const IPAddress &rhs) const;
    inline bool operator!=(const IPAddress &rhs) const { return not operator==(rhs); }
};


/** \class  AddressBlock
 *  \brief  A CIDR address block like 10.0.0.0/8 or fe80::/10.
 */
class AddressBlock {
    IPAddress network_address_;
    unsigned prefix_length_;
public:
    AddressBlock(const IPAddress &network_address, const unsigned prefix_length);

    /** \return True if "address" is of the same family as the block and its leading "prefix_length" bits match. */
    bool contains(const IPAddress &address) const;

    inline const IPAddress &getNetworkAddress() const { return network_address_; }
    inline unsigned getPrefixLength() const { return prefix_length_; }
    std::string toString() const;
};


/** \brief  Expects strings of the form 138.23.0.0/16 or fc00::/7 which get parsed into an address block.
 *  \return True on success and false upon failure.
 */
bool StringToAddressBlock(const std::string &s, AddressBlock * const address_block);


/** \brief  Expects strings of the form 138.23.0.0/16 or fc00::/7 which get parsed into an address block.
 *  \note   Throws an exception if "s" is not a valid CIDR block.
 */
AddressBlock StringToAddressBlock(const std::string &s);


/** \class  AddressRanges
 *  \brief  An ordered list of named predicates over IP addresses.
 *
 *  IPv4-mapped IPv6 addresses are converted to their IPv4 form before any predicate is applied.
 */
class AddressRanges {
public:
    struct Range {
        std::string name_;
        std::function<bool(const IPAddress &)> matches_;

        Range(const std::string &name, const std::function<bool(const IPAddress &)> &matches): name_(name), matches_(matches) { }
    };
private:
    std::vector<Range> ranges_;
public:
    AddressRanges() = default;

    void addRange(const std::string &name, const std::function<bool(const IPAddress &)> &matches);

    /** \brief Adds a CIDR block, e.g. "169.254.0.0/16", named after itself.  Throws on a malformed block. */
    void addBlock(const std::string &cidr_block);

    /** \param  range_name  If non-NULL, the name of the first matching range will be returned here.
     *  \return True if any range contains "address".
     */
    bool contains(const IPAddress &address, std::string * const range_name = nullptr) const;

    inline size_t size() const { return ranges_.size(); }
    inline std::vector<Range>::const_iterator begin() const { return ranges_.cbegin(); }
    inline std::vector<Range>::const_iterator end() const { return ranges_.cend(); }
};


/** \return The unspecified, loopback, link-local, private, shared, reserved, documentation and multicast ranges of
 *          IPv4 and IPv6.
 */
const AddressRanges &GetNonPublicAddressRanges();


/** \brief  Checks a textual address against GetNonPublicAddressRanges().
 *  \param  reason  If non-NULL, the name of the matching range or a parse failure message will be stored here.
 *  \return True if "address" is blocked.  Addresses that can't be parsed are blocked, too.
 */
bool IsBlockedAddress(const std::string &address, std::string * const reason = nullptr);


} // namespace NetUtil


#endif

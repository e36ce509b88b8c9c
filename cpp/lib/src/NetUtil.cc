/** \file    NetUtil.cc
 *  \brief   Implementation of network-related utility functions.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
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

#include "NetUtil.h"
#include <stdexcept>
#include <cstring>
#include <arpa/inet.h>
#include "Compiler.h"
#include "StringUtil.h"


namespace NetUtil {


IPAddress::IPAddress(): family_(IPV4) {
    std::memset(bytes_, 0, sizeof bytes_);
}


bool IPAddress::Parse(const std::string &s, IPAddress * const address) {
    const std::string without_zone_index(s.substr(0, s.find('%')));
    IPAddress new_address;
    if (::inet_pton(AF_INET, without_zone_index.c_str(), new_address.bytes_) == 1)
        new_address.family_ = IPV4;
    else if (::inet_pton(AF_INET6, without_zone_index.c_str(), new_address.bytes_) == 1)
        new_address.family_ = IPV6;
    else
        return false;

    *address = new_address;
    return true;
}


bool IPAddress::isIPv4Mapped() const {
    if (family_ != IPV6)
        return false;

    for (unsigned i(0); i < 10; ++i) {
        if (bytes_[i] != 0)
            return false;
    }

    return bytes_[10] == 0xFF and bytes_[11] == 0xFF;
}


IPAddress IPAddress::getMappedIPv4Address() const {
    if (unlikely(not isIPv4Mapped()))
        throw std::runtime_error("in NetUtil::IPAddress::getMappedIPv4Address: " + toString() + " is not an IPv4-mapped address!");

    IPAddress ipv4_address;
    std::memcpy(ipv4_address.bytes_, bytes_ + 12, 4);
    return ipv4_address;
}


std::string IPAddress::toString() const {
    char buf[INET6_ADDRSTRLEN];
    if (unlikely(::inet_ntop(family_ == IPV4 ? AF_INET : AF_INET6, bytes_, buf, sizeof buf) == nullptr))
        throw std::runtime_error("in NetUtil::IPAddress::toString: inet_ntop(3) failed!");

    return buf;
}


bool IPAddress::operator==(const IPAddress &rhs) const {
    return family_ == rhs.family_ and std::memcmp(bytes_, rhs.bytes_, getByteCount()) == 0;
}


AddressBlock::AddressBlock(const IPAddress &network_address, const unsigned prefix_length)
    : network_address_(network_address), prefix_length_(prefix_length)
{
    if (unlikely(prefix_length_ > network_address_.getByteCount() * 8))
        throw std::runtime_error("in NetUtil::AddressBlock::AddressBlock: prefix length " + std::to_string(prefix_length_)
                                 + " is too large for " + network_address_.toString() + "!");
}


bool AddressBlock::contains(const IPAddress &address) const {
    if (address.getFamily() != network_address_.getFamily())
        return false;

    const unsigned char * const block_bytes(network_address_.getBytes());
    const unsigned char * const address_bytes(address.getBytes());
    const unsigned full_bytes(prefix_length_ / 8);
    if (std::memcmp(block_bytes, address_bytes, full_bytes) != 0)
        return false;

    const unsigned remaining_bits(prefix_length_ % 8);
    if (remaining_bits == 0)
        return true;

    const unsigned char mask(static_cast<unsigned char>(0xFFu << (8u - remaining_bits)));
    return (block_bytes[full_bytes] & mask) == (address_bytes[full_bytes] & mask);
}


std::string AddressBlock::toString() const {
    return network_address_.toString() + "/" + std::to_string(prefix_length_);
}


bool StringToAddressBlock(const std::string &s, AddressBlock * const address_block) {
    const std::string::size_type slash_pos(s.find('/'));
    if (slash_pos == std::string::npos)
        return false;

    IPAddress network_address;
    if (not IPAddress::Parse(s.substr(0, slash_pos), &network_address))
        return false;

    const std::string prefix_length_string(s.substr(slash_pos + 1));
    unsigned prefix_length;
    if (prefix_length_string.empty() or not StringUtil::IsDigit(prefix_length_string[0])
        or not StringUtil::ToUnsigned(prefix_length_string, &prefix_length) or prefix_length > network_address.getByteCount() * 8)
        return false;

    *address_block = AddressBlock(network_address, prefix_length);
    return true;
}


AddressBlock StringToAddressBlock(const std::string &s) {
    AddressBlock address_block(IPAddress(), 0);
    if (likely(StringToAddressBlock(s, &address_block)))
        return address_block;

    throw std::runtime_error("in NetUtil::StringToAddressBlock: \"" + s + "\" is not a valid CIDR address block!");
}


void AddressRanges::addRange(const std::string &name, const std::function<bool(const IPAddress &)> &matches) {
    ranges_.emplace_back(name, matches);
}


void AddressRanges::addBlock(const std::string &cidr_block) {
    const AddressBlock address_block(StringToAddressBlock(cidr_block));
    addRange(cidr_block, [address_block](const IPAddress &address) { return address_block.contains(address); });
}


bool AddressRanges::contains(const IPAddress &address, std::string * const range_name) const {
    const IPAddress effective_address(address.isIPv4Mapped() ? address.getMappedIPv4Address() : address);
    for (const auto &range : ranges_) {
        if (range.matches_(effective_address)) {
            if (range_name != nullptr)
                *range_name = range.name_;
            return true;
        }
    }

    return false;
}


namespace {


const char * const NON_PUBLIC_IPV4_BLOCKS[] = {
    "0.0.0.0/8",       // "this" network
    "10.0.0.0/8",      // private
    "100.64.0.0/10",   // shared address space (carrier-grade NAT)
    "127.0.0.0/8",     // loopback
    "169.254.0.0/16",  // link-local
    "172.16.0.0/12",   // private
    "192.0.0.0/24",    // IETF protocol assignments
    "192.0.2.0/24",    // TEST-NET-1
    "192.168.0.0/16",  // private
    "198.18.0.0/15",   // benchmarking
    "198.51.100.0/24", // TEST-NET-2
    "203.0.113.0/24",  // TEST-NET-3
    "224.0.0.0/4",     // multicast
    "240.0.0.0/4",     // reserved, includes the limited broadcast address
};


const char * const NON_PUBLIC_IPV6_BLOCKS[] = {
    "::/128",    // unspecified
    "::1/128",   // loopback
    "fe80::/10", // link-local
    "fc00::/7",  // unique local
    "ff00::/8",  // multicast
};


AddressRanges MakeNonPublicAddressRanges() {
    AddressRanges address_ranges;
    for (unsigned i(0); i < DIM(NON_PUBLIC_IPV4_BLOCKS); ++i)
        address_ranges.addBlock(NON_PUBLIC_IPV4_BLOCKS[i]);
    for (unsigned i(0); i < DIM(NON_PUBLIC_IPV6_BLOCKS); ++i)
        address_ranges.addBlock(NON_PUBLIC_IPV6_BLOCKS[i]);

    return address_ranges;
}


} // unnamed namespace


const AddressRanges &GetNonPublicAddressRanges() {
    static const AddressRanges non_public_address_ranges(MakeNonPublicAddressRanges());
    return non_public_address_ranges;
}


bool IsBlockedAddress(const std::string &address, std::string * const reason) {
    IPAddress ip_address;
    if (unlikely(not IPAddress::Parse(address, &ip_address))) {
        if (reason != nullptr)
            *reason = "unparsable address";
        return true;
    }

    return GetNonPublicAddressRanges().contains(ip_address, reason);
}


} // namespace NetUtil

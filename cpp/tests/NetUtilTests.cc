/** \brief Test cases for the address range checks in NetUtil
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
#include "NetUtil.h"
#include "UnitTest.h"


TEST(ParseAddresses) {
    NetUtil::IPAddress address;
    CHECK_TRUE(NetUtil::IPAddress::Parse("192.0.2.1", &address));
    CHECK_EQ(address.getFamily(), NetUtil::IPAddress::IPV4);
    CHECK_EQ(address.toString(), "192.0.2.1");

    CHECK_TRUE(NetUtil::IPAddress::Parse("fe80::1%eth0", &address));
    CHECK_EQ(address.getFamily(), NetUtil::IPAddress::IPV6);
    CHECK_EQ(address.toString(), "fe80::1");

    CHECK_FALSE(NetUtil::IPAddress::Parse("example.com", &address));
    CHECK_FALSE(NetUtil::IPAddress::Parse("256.1.1.1", &address));
    CHECK_FALSE(NetUtil::IPAddress::Parse("", &address));
}


TEST(IPv4MappedAddresses) {
    NetUtil::IPAddress address;
    CHECK_TRUE(NetUtil::IPAddress::Parse("::ffff:127.0.0.1", &address));
    CHECK_TRUE(address.isIPv4Mapped());
    CHECK_EQ(address.getMappedIPv4Address().toString(), "127.0.0.1");

    CHECK_TRUE(NetUtil::IPAddress::Parse("::ffff:7f00:1", &address));
    CHECK_TRUE(address.isIPv4Mapped());

    CHECK_TRUE(NetUtil::IPAddress::Parse("2001:db8::1", &address));
    CHECK_FALSE(address.isIPv4Mapped());
}


TEST(AddressBlocks) {
    const NetUtil::AddressBlock block(NetUtil::StringToAddressBlock("172.16.0.0/12"));
    NetUtil::IPAddress address;
    NetUtil::IPAddress::Parse("172.31.255.255", &address);
    CHECK_TRUE(block.contains(address));
    NetUtil::IPAddress::Parse("172.32.0.0", &address);
    CHECK_FALSE(block.contains(address));

    NetUtil::AddressBlock address_block(NetUtil::IPAddress(), 0);
    CHECK_FALSE(NetUtil::StringToAddressBlock("10.0.0.0/33", &address_block));
    CHECK_FALSE(NetUtil::StringToAddressBlock("10.0.0.0", &address_block));
    CHECK_TRUE(NetUtil::StringToAddressBlock("fc00::/7", &address_block));
    CHECK_EQ(address_block.getPrefixLength(), 7u);
}


TEST(BlockedAddresses) {
    for (const auto &address : { "0.1.2.3", "10.1.2.3", "100.64.0.1", "127.0.0.1", "127.255.255.254", "169.254.169.254",
                                 "172.16.0.1", "192.0.0.8", "192.0.2.55", "192.168.1.1", "198.18.0.1", "198.51.100.7",
                                 "203.0.113.9", "224.0.0.251", "239.255.255.250", "240.0.0.1", "255.255.255.255", "::", "::1",
                                 "fe80::1", "fc00::1", "fd12:3456::1", "ff02::1", "::ffff:127.0.0.1", "::ffff:10.0.0.1",
                                 "::ffff:169.254.169.254", "::ffff:192.168.0.1" })
    {
        std::string reason;
        const bool blocked(NetUtil::IsBlockedAddress(address, &reason));
        if (not blocked)
            std::cerr << "\t" << address << " should be blocked\n";
        CHECK_TRUE(blocked);
        CHECK_FALSE(reason.empty());
    }
}


TEST(PublicAddresses) {
    for (const auto &address : { "93.184.216.34", "8.8.8.8", "1.1.1.1", "172.32.0.1", "100.128.0.1", "2606:2800:220:1::1",
                                 "2001:4860:4860::8888", "::ffff:93.184.216.34" })
    {
        const bool blocked(NetUtil::IsBlockedAddress(address));
        if (blocked)
            std::cerr << "\t" << address << " should not be blocked\n";
        CHECK_FALSE(blocked);
    }
}


TEST(UnparsableAddressesAreBlocked) {
    std::string reason;
    CHECK_TRUE(NetUtil::IsBlockedAddress("not-an-address", &reason));
    CHECK_EQ(reason, "unparsable address");
}


TEST(CustomRanges) {
    NetUtil::AddressRanges ranges;
    ranges.addBlock("198.51.100.0/24");
    ranges.addRange("documentation port", [](const NetUtil::IPAddress &address) {
        return address.getFamily() == NetUtil::IPAddress::IPV4 and address.getBytes()[0] == 203;
    });
    CHECK_EQ(ranges.size(), 2u);

    NetUtil::IPAddress address;
    NetUtil::IPAddress::Parse("203.0.113.1", &address);
    std::string range_name;
    CHECK_TRUE(ranges.contains(address, &range_name));
    CHECK_EQ(range_name, "documentation port");

    NetUtil::IPAddress::Parse("::ffff:198.51.100.1", &address);
    CHECK_TRUE(ranges.contains(address));
}


TEST_MAIN(NetUtil)

#include <gtest/gtest.h>
#include "topology.hpp"
#include "test_support.hpp"

static VirtualNetworkSite make_site(const std::string& name, const std::string& space, const std::string& subnet) {
    VirtualNetworkSite site;
    site.name = name;
    site.affinity_group = "Group1";
    site.address_space = {space};
    site.subnets = {{"Subnet-1", subnet}};
    return site;
}

TEST(Identifier, CaseInsensitive) {
    EXPECT_TRUE(same_identifier("VNet-One", "vnet-one"));
    EXPECT_TRUE(same_identifier("", ""));
    EXPECT_FALSE(same_identifier("vnet1", "vnet11"));
    EXPECT_FALSE(same_identifier("vnet1", "vnet2"));
}

TEST(Identifier, DnsServerNamePattern) {
    EXPECT_TRUE(is_valid_dns_server_name("a"));
    EXPECT_TRUE(is_valid_dns_server_name("Dns-1"));
    EXPECT_TRUE(is_valid_dns_server_name("a1234567890123456789"));
    EXPECT_FALSE(is_valid_dns_server_name("a12345678901234567890"));
    EXPECT_FALSE(is_valid_dns_server_name("1dns"));
    EXPECT_FALSE(is_valid_dns_server_name("-dns"));
    EXPECT_FALSE(is_valid_dns_server_name("dns_1"));
    EXPECT_FALSE(is_valid_dns_server_name(""));
}

TEST(NetworkConfiguration, DuplicateDnsNameDiffersOnlyInCase) {
    NetworkConfiguration config;
    config.add_dns_server({"Dns1", "10.0.0.4"});
    EXPECT_NET_ERROR(config.add_dns_server({"DNS1", "10.0.0.5"}), ErrorKind::DUPLICATE_ENTITY);
    EXPECT_EQ(1u, config.dns_servers.size());
}

TEST(NetworkConfiguration, DuplicateDnsIpAfterCanonicalization) {
    NetworkConfiguration config;
    config.add_dns_server({"Dns1", "10.0.0.10"});
    EXPECT_NET_ERROR(config.add_dns_server({"Dns2", "10.0.0.010"}), ErrorKind::DUPLICATE_ENTITY);
    ASSERT_NE(nullptr, config.find_dns_server_by_ip("010.0.0.10"));
}

TEST(NetworkConfiguration, DuplicateSiteName) {
    NetworkConfiguration config;
    config.add_site(make_site("VNet", "10.0.0.0/8", "10.0.0.0/11"));
    EXPECT_NET_ERROR(config.add_site(make_site("vnet", "192.168.0.0/16", "192.168.0.0/19")),
                     ErrorKind::DUPLICATE_ENTITY);
}

TEST(NetworkConfiguration, FindAndRemove) {
    NetworkConfiguration config;
    EXPECT_TRUE(config.empty());
    config.add_dns_server({"Dns1", "10.0.0.4"});
    VirtualNetworkSite site = make_site("VNet", "10.0.0.0/8", "10.0.0.0/11");
    site.dns_servers_ref = {{"dns1"}};
    config.add_site(site);

    ASSERT_NE(nullptr, config.find_site_referencing("DNS1"));
    EXPECT_EQ("VNet", config.find_site_referencing("DNS1")->name);
    EXPECT_EQ(nullptr, config.find_site_referencing("Dns2"));

    EXPECT_TRUE(config.remove_site("vnet"));
    EXPECT_FALSE(config.remove_site("vnet"));
    EXPECT_TRUE(config.remove_dns_server("DNS1"));
    EXPECT_TRUE(config.empty());
}

TEST(NetworkConfiguration, ValidDocumentPasses) {
    NetworkConfiguration config;
    config.add_dns_server({"Dns1", "10.0.0.4"});
    VirtualNetworkSite site = make_site("VNet", "10.0.0.0/8", "10.0.0.0/11");
    site.address_space.push_back("172.16.0.0/12");
    site.subnets.push_back({"Subnet-2", "172.16.4.0/24"});
    site.dns_servers_ref = {{"Dns1"}};
    config.add_site(site);
    config.validate();
}

TEST(NetworkConfiguration, SubnetOutsideAddressSpace) {
    NetworkConfiguration config;
    config.virtual_network_sites.push_back(make_site("VNet", "10.0.0.0/16", "10.1.0.0/24"));
    EXPECT_NET_ERROR(config.validate(), ErrorKind::OUT_OF_RANGE);

    config.virtual_network_sites[0].subnets[0].address_prefix = "10.0.0.0/15";
    EXPECT_NET_ERROR(config.validate(), ErrorKind::OUT_OF_RANGE);
}

TEST(NetworkConfiguration, DanglingDnsReference) {
    NetworkConfiguration config;
    config.add_dns_server({"Dns1", "10.0.0.4"});
    VirtualNetworkSite site = make_site("VNet", "10.0.0.0/8", "10.0.0.0/11");
    site.dns_servers_ref = {{"Dns2"}};
    config.virtual_network_sites.push_back(site);

    try {
        config.validate();
        FAIL() << "expected an error";
    } catch (const NetConfigError& ex) {
        EXPECT_EQ(ErrorKind::NOT_FOUND, ex.kind());
        ASSERT_EQ(1u, ex.diagnostics().size());
        EXPECT_EQ("Dns1 (10.0.0.4)", ex.diagnostics()[0]);
    }
}

TEST(NetworkConfiguration, ValidateCatchesRawDuplicates) {
    NetworkConfiguration config;
    config.dns_servers = {{"Dns1", "10.0.0.4"}, {"dns1", "10.0.0.5"}};
    EXPECT_NET_ERROR(config.validate(), ErrorKind::DUPLICATE_ENTITY);

    config.dns_servers = {{"Dns1", "10.0.0.4"}, {"Dns2", "10.0.0.4"}};
    EXPECT_NET_ERROR(config.validate(), ErrorKind::DUPLICATE_ENTITY);

    config.dns_servers = {{"Dns1", "10.0.0.300"}};
    EXPECT_NET_ERROR(config.validate(), ErrorKind::INVALID_FORMAT);

    config.dns_servers.clear();
    config.virtual_network_sites = {make_site("A", "10.0.0.0/8", "10.0.0.0/11"),
                                    make_site("a", "192.168.0.0/16", "192.168.0.0/19")};
    EXPECT_NET_ERROR(config.validate(), ErrorKind::DUPLICATE_ENTITY);
}

TEST(NetworkConfiguration, DuplicateSubnetNamesInSite) {
    NetworkConfiguration config;
    VirtualNetworkSite site = make_site("VNet", "10.0.0.0/8", "10.0.0.0/11");
    site.subnets.push_back({"subnet-1", "10.32.0.0/11"});
    config.virtual_network_sites.push_back(site);
    EXPECT_NET_ERROR(config.validate(), ErrorKind::DUPLICATE_ENTITY);
}

#include <gtest/gtest.h>
#include <regex>
#include "operations.hpp"
#include "state_manager.hpp"
#include "test_support.hpp"

static Settings make_settings() {
    Settings settings;
    settings.affinity_groups = {{"Group1", "West US", {"PersistentVMRole"}},
                                {"Legacy", "West US", {"WebRole"}}};
    settings.locations = {{"West US", {"PersistentVMRole"}}, {"North Europe", {"PersistentVMRole"}}};
    return settings;
}

class OperationsTest : public ::testing::Test {
protected:
    MemoryConfigurationStore store;
    Settings settings = make_settings();
    CatalogAffinityResolver resolver{settings.affinity_groups, settings.locations,
                                     settings.required_capability, 1};
    ServiceContext ctx{store, resolver, settings, 42};

    static CreateVirtualNetworkRequest create_request(const std::string& name) {
        CreateVirtualNetworkRequest request;
        request.name = name;
        request.affinity.affinity_group = "Group1";
        return request;
    }

    void seed_dns_and_site() {
        NetworkOperations::register_dns_server(ctx, "10.0.0.4", std::string("dns1"));
        CreateVirtualNetworkRequest request = create_request("VNet1");
        request.dns_server_id = "DNS1";
        NetworkOperations::create_virtual_network(ctx, request);
    }
};

TEST_F(OperationsTest, EmptyStoreListsNothing) {
    EXPECT_TRUE(NetworkOperations::list_dns_servers(ctx).empty());
    EXPECT_TRUE(NetworkOperations::list_virtual_networks(ctx).empty());
    EXPECT_EQ(0, store.replace_count);
}

TEST_F(OperationsTest, FetchFailurePropagates) {
    store.fail_fetch = true;
    EXPECT_NET_ERROR(NetworkOperations::list_dns_servers(ctx), ErrorKind::STORE_FAILURE);
}

TEST_F(OperationsTest, RegisterWithName) {
    DnsServer server = NetworkOperations::register_dns_server(ctx, "10.0.0.4", std::string("Dns1"));
    EXPECT_EQ("Dns1", server.name);
    EXPECT_EQ("10.0.0.4", server.ip_address);
    EXPECT_EQ(1, store.replace_count);
    ASSERT_EQ(1u, store.stored->dns_servers.size());
    EXPECT_EQ("Dns1", store.stored->dns_servers[0].name);
}

TEST_F(OperationsTest, RegisterGeneratesName) {
    DnsServer server = NetworkOperations::register_dns_server(ctx, "10.0.0.5", std::nullopt);
    EXPECT_TRUE(std::regex_match(server.name, std::regex("DNS-[0-9a-f]{8}"))) << server.name;
    EXPECT_TRUE(is_valid_dns_server_name(server.name));

    DnsServer second = NetworkOperations::register_dns_server(ctx, "10.0.0.6", std::nullopt);
    EXPECT_FALSE(same_identifier(server.name, second.name));
    EXPECT_EQ(2u, NetworkOperations::list_dns_servers(ctx).size());
}

TEST_F(OperationsTest, RegisterDuplicates) {
    NetworkOperations::register_dns_server(ctx, "10.0.0.10", std::string("Dns1"));
    EXPECT_NET_ERROR(NetworkOperations::register_dns_server(ctx, "10.0.0.11", std::string("DNS1")),
                     ErrorKind::DUPLICATE_ENTITY);
    EXPECT_NET_ERROR(NetworkOperations::register_dns_server(ctx, "10.0.0.010", std::string("Dns2")),
                     ErrorKind::DUPLICATE_ENTITY);
    EXPECT_EQ(1, store.replace_count);
}

TEST_F(OperationsTest, RegisterRejectsBadInput) {
    EXPECT_NET_ERROR(NetworkOperations::register_dns_server(ctx, "10.0.0.4", std::string("1bad")),
                     ErrorKind::INVALID_ARGUMENT);
    EXPECT_NET_ERROR(NetworkOperations::register_dns_server(ctx, "10.0.0.256", std::string("Dns1")),
                     ErrorKind::INVALID_FORMAT);
    EXPECT_EQ(0, store.fetch_count);
    EXPECT_EQ(0, store.replace_count);
}

TEST_F(OperationsTest, UnregisterByNameOrIp) {
    NetworkOperations::register_dns_server(ctx, "10.0.0.4", std::string("Dns1"));
    NetworkOperations::register_dns_server(ctx, "10.0.0.5", std::string("Dns2"));

    EXPECT_EQ("Dns1", NetworkOperations::unregister_dns_server(ctx, std::string("dns1"), std::nullopt).name);
    EXPECT_EQ("Dns2", NetworkOperations::unregister_dns_server(ctx, std::nullopt, std::string("10.0.0.05")).name);
    EXPECT_TRUE(store.stored->dns_servers.empty());
}

TEST_F(OperationsTest, UnregisterSelectorRules) {
    EXPECT_NET_ERROR(NetworkOperations::unregister_dns_server(ctx, std::string("Dns1"), std::string("10.0.0.4")),
                     ErrorKind::MUTUALLY_EXCLUSIVE_PARAMETERS);
    EXPECT_NET_ERROR(NetworkOperations::unregister_dns_server(ctx, std::nullopt, std::nullopt),
                     ErrorKind::MISSING_DEPENDENT_PARAMETERS);
}

TEST_F(OperationsTest, UnregisterUnknownListsRegistered) {
    NetworkOperations::register_dns_server(ctx, "10.0.0.4", std::string("Dns1"));
    try {
        NetworkOperations::unregister_dns_server(ctx, std::string("Dns9"), std::nullopt);
        FAIL() << "expected an error";
    } catch (const NetConfigError& ex) {
        EXPECT_EQ(ErrorKind::NOT_FOUND, ex.kind());
        ASSERT_EQ(1u, ex.diagnostics().size());
        EXPECT_EQ("Dns1 (10.0.0.4)", ex.diagnostics()[0]);
    }
}

TEST_F(OperationsTest, UnregisterReferencedServerIsBlocked) {
    seed_dns_and_site();
    int replaces = store.replace_count;
    std::string before = StateManager::dump(*store.stored);

    EXPECT_NET_ERROR(NetworkOperations::unregister_dns_server(ctx, std::string("Dns1"), std::nullopt),
                     ErrorKind::REFERENCED_ENTITY);
    EXPECT_EQ(replaces, store.replace_count);
    EXPECT_EQ(before, StateManager::dump(*store.stored));
}

TEST_F(OperationsTest, CreateWithDefaults) {
    CreateVirtualNetworkResult result = NetworkOperations::create_virtual_network(ctx, create_request("VNet1"));
    EXPECT_EQ("Group1", result.affinity_group.name);
    EXPECT_FALSE(result.affinity_group.is_newly_created);

    ASSERT_EQ(1u, store.stored->virtual_network_sites.size());
    const VirtualNetworkSite& site = store.stored->virtual_network_sites[0];
    EXPECT_EQ("VNet1", site.name);
    EXPECT_EQ("Group1", site.affinity_group);
    ASSERT_EQ(1u, site.address_space.size());
    EXPECT_EQ("10.0.0.0/8", site.address_space[0]);
    ASSERT_EQ(1u, site.subnets.size());
    EXPECT_EQ("Subnet-1", site.subnets[0].name);
    EXPECT_EQ("10.0.0.0/11", site.subnets[0].address_prefix);
    EXPECT_TRUE(site.dns_servers_ref.empty());
}

TEST_F(OperationsTest, CreateReferencesRegisteredName) {
    seed_dns_and_site();
    const VirtualNetworkSite& site = store.stored->virtual_network_sites[0];
    ASSERT_EQ(1u, site.dns_servers_ref.size());
    EXPECT_EQ("dns1", site.dns_servers_ref[0].name);
}

TEST_F(OperationsTest, CreateWithExplicitLayout) {
    CreateVirtualNetworkRequest request = create_request("VNet1");
    request.addressing.address_space = "192.168.0.0";
    request.addressing.max_vm_count = "1000";
    request.addressing.subnet_start_ip = "192.168.2.0";
    request.addressing.subnet_cidr = "24";
    request.addressing.subnet_name = "Front";
    NetworkOperations::create_virtual_network(ctx, request);

    const VirtualNetworkSite& site = store.stored->virtual_network_sites[0];
    EXPECT_EQ("192.168.0.0/22", site.address_space[0]);
    EXPECT_EQ("Front", site.subnets[0].name);
    EXPECT_EQ("192.168.2.0/24", site.subnets[0].address_prefix);
}

TEST_F(OperationsTest, CreateDuplicateName) {
    NetworkOperations::create_virtual_network(ctx, create_request("VNet1"));
    EXPECT_NET_ERROR(NetworkOperations::create_virtual_network(ctx, create_request("vnet1")),
                     ErrorKind::DUPLICATE_ENTITY);
    EXPECT_EQ(1, store.replace_count);
}

TEST_F(OperationsTest, CreateWithUnknownDnsServer) {
    NetworkOperations::register_dns_server(ctx, "10.0.0.4", std::string("dns1"));
    CreateVirtualNetworkRequest request = create_request("VNet1");
    request.dns_server_id = "dns2";
    try {
        NetworkOperations::create_virtual_network(ctx, request);
        FAIL() << "expected an error";
    } catch (const NetConfigError& ex) {
        EXPECT_EQ(ErrorKind::NOT_FOUND, ex.kind());
        ASSERT_EQ(1u, ex.diagnostics().size());
        EXPECT_EQ("dns1 (10.0.0.4)", ex.diagnostics()[0]);
    }
    EXPECT_TRUE(store.stored->virtual_network_sites.empty());
}

TEST_F(OperationsTest, CreateChecksOptionsBeforeFetching) {
    CreateVirtualNetworkRequest request = create_request("VNet1");
    request.addressing.subnet_start_ip = "10.0.0.0";
    EXPECT_NET_ERROR(NetworkOperations::create_virtual_network(ctx, request),
                     ErrorKind::MISSING_DEPENDENT_PARAMETERS);
    EXPECT_EQ(0, store.fetch_count);
}

TEST_F(OperationsTest, CreateWithUnsupportedAffinityGroupStoresNothing) {
    CreateVirtualNetworkRequest request = create_request("VNet1");
    request.affinity.affinity_group = "Legacy";
    EXPECT_NET_ERROR(NetworkOperations::create_virtual_network(ctx, request),
                     ErrorKind::UNSUPPORTED_CAPABILITY);
    EXPECT_EQ(0, store.replace_count);
    EXPECT_FALSE(store.stored.has_value());
}

TEST_F(OperationsTest, CreateByLocation) {
    CreateVirtualNetworkRequest request;
    request.name = "VNet1";
    request.affinity.location = "West US";
    CreateVirtualNetworkResult result = NetworkOperations::create_virtual_network(ctx, request);
    EXPECT_EQ("Group1", result.site.affinity_group);
}

TEST_F(OperationsTest, NewAffinityGroupKeptOnlyWhenStored) {
    CreateVirtualNetworkRequest request;
    request.name = "VNet1";
    request.affinity.location = "North Europe";

    store.fail_replace = true;
    EXPECT_NET_ERROR(NetworkOperations::create_virtual_network(ctx, request), ErrorKind::STORE_FAILURE);
    EXPECT_EQ(2u, resolver.get_groups().size());

    store.fail_replace = false;
    CreateVirtualNetworkResult result = NetworkOperations::create_virtual_network(ctx, request);
    EXPECT_TRUE(result.affinity_group.is_newly_created);
    ASSERT_EQ(3u, resolver.get_groups().size());
    EXPECT_EQ(result.site.affinity_group, resolver.get_groups().back().name);
}

TEST_F(OperationsTest, DeleteWithNoSites) {
    EXPECT_EQ(DeleteOutcome::NO_SITES, NetworkOperations::delete_virtual_network(ctx, "VNet1"));
    EXPECT_EQ(0, store.replace_count);
}

TEST_F(OperationsTest, DeleteUnknownSite) {
    NetworkOperations::create_virtual_network(ctx, create_request("VNet1"));
    EXPECT_NET_ERROR(NetworkOperations::delete_virtual_network(ctx, "Test"), ErrorKind::NOT_FOUND);
    EXPECT_EQ(1u, store.stored->virtual_network_sites.size());
}

TEST_F(OperationsTest, DeleteMatchesWithoutCase) {
    NetworkOperations::create_virtual_network(ctx, create_request("VNet1"));
    EXPECT_EQ(DeleteOutcome::DELETED, NetworkOperations::delete_virtual_network(ctx, "VNET1"));
    EXPECT_TRUE(store.stored->virtual_network_sites.empty());
    EXPECT_NET_ERROR(NetworkOperations::show_virtual_network(ctx, "VNet1"), ErrorKind::NOT_FOUND);
}

TEST_F(OperationsTest, FailedReplaceLeavesDocument) {
    NetworkOperations::register_dns_server(ctx, "10.0.0.4", std::string("Dns1"));
    std::string before = StateManager::dump(*store.stored);

    store.fail_replace = true;
    EXPECT_NET_ERROR(NetworkOperations::register_dns_server(ctx, "10.0.0.5", std::string("Dns2")),
                     ErrorKind::STORE_FAILURE);
    EXPECT_EQ(before, StateManager::dump(*store.stored));
}

TEST_F(OperationsTest, MutationKeepsUnrelatedSiteFields) {
    store.stored = StateManager::parse(R"({
      "VirtualNetworkConfiguration": {
        "VirtualNetworkSites": [ {
          "Name": "Edge", "AffinityGroup": "Group1", "AddressSpace": [ "10.0.0.0/8" ],
          "Subnets": [ { "Name": "GatewaySubnet", "AddressPrefix": "10.0.0.0/29" } ],
          "Gateway": { "Profile": "Small" }
        } ]
      }
    })", "stored");

    NetworkOperations::register_dns_server(ctx, "10.0.0.4", std::string("dns1"));
    nlohmann::ordered_json site = StateManager::to_json(*store.stored)["VirtualNetworkConfiguration"]
                                                                      ["VirtualNetworkSites"][0];
    EXPECT_EQ("Small", site["Gateway"]["Profile"].get<std::string>());
    EXPECT_FALSE(site.contains("DnsServersRef"));
}

TEST_F(OperationsTest, ShowVirtualNetwork) {
    NetworkOperations::create_virtual_network(ctx, create_request("VNet1"));
    EXPECT_EQ("VNet1", NetworkOperations::show_virtual_network(ctx, "vnet1").name);
}

TEST_F(OperationsTest, ExportThenImport) {
    TempDir dir;
    seed_dns_and_site();
    NetworkOperations::export_configuration(ctx, dir.file("export.json"));

    MemoryConfigurationStore other;
    ServiceContext other_ctx(other, resolver, settings, 1);
    NetworkOperations::import_configuration(other_ctx, dir.file("export.json"));
    ASSERT_TRUE(other.stored.has_value());
    EXPECT_EQ(StateManager::dump(*store.stored), StateManager::dump(*other.stored));
}

TEST_F(OperationsTest, ImportInvalidDocumentReplacesNothing) {
    TempDir dir;
    NetworkConfiguration broken;
    VirtualNetworkSite site;
    site.name = "VNet1";
    site.affinity_group = "Group1";
    site.address_space.push_back("10.0.0.0/16");
    site.subnets.push_back({"Subnet-1", "10.1.0.0/24"});
    broken.virtual_network_sites.push_back(site);
    StateManager::save(broken, dir.file("broken.json"));

    EXPECT_NET_ERROR(NetworkOperations::import_configuration(ctx, dir.file("broken.json")),
                     ErrorKind::OUT_OF_RANGE);
    EXPECT_EQ(0, store.replace_count);
}

#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "allocator.hpp"
#include "affinity.hpp"
#include "colors.hpp"
#include "config_store.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "operations.hpp"
#include "settings.hpp"
#include "state_manager.hpp"

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

struct CommandLine {
    std::string settings_path = DEFAULT_SETTINGS_FILE;
    bool settings_given = false;
    std::optional<std::string> store_path;
    bool verbose = false;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
};

void print_usage() {
    std::cout << Color::BOLD << "Usage:" << Color::RESET
              << " vnetcfg [--settings FILE] [--store FILE] [-v] <group> <action> [options]\n\n"
              << "  dns list\n"
              << "  dns register --ip IP [--name NAME]\n"
              << "  dns unregister (--name NAME | --ip IP)\n"
              << "  vnet list\n"
              << "  vnet show NAME\n"
              << "  vnet create NAME [--address-space IP] [--cidr N | --max-vm-count N]\n"
              << "                   [--subnet-start-ip IP] [--subnet-cidr N | --subnet-vm-count N]\n"
              << "                   [--subnet-name NAME] [--dns-server-id NAME]\n"
              << "                   (--affinity-group NAME | --location NAME)\n"
              << "  vnet delete NAME\n"
              << "  config show\n"
              << "  config export FILE\n"
              << "  config import FILE\n";
}

CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine cl;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            cl.verbose = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            cl.positional.push_back(arg);
            continue;
        }
        if (i + 1 >= argc) {
            throw UsageError(arg + " needs a value");
        }
        std::string value = argv[++i];
        if (arg == "--settings") {
            cl.settings_path = value;
            cl.settings_given = true;
        } else if (arg == "--store") {
            cl.store_path = value;
        } else if (!cl.options.emplace(arg, value).second) {
            throw UsageError(arg + " given more than once");
        }
    }
    return cl;
}

// Helper: reject options the command does not know
void expect_options(const CommandLine& cl, const std::set<std::string>& allowed) {
    for (const auto& option : cl.options) {
        if (!allowed.count(option.first)) {
            throw UsageError("unknown option " + option.first);
        }
    }
}

// Helper: positional argument after <group> <action>
std::string argument(const CommandLine& cl, const std::string& what) {
    if (cl.positional.size() < 3) {
        throw UsageError(cl.positional[0] + " " + cl.positional[1] + " needs " + what);
    }
    if (cl.positional.size() > 3) {
        throw UsageError("unexpected argument " + cl.positional[3]);
    }
    return cl.positional[2];
}

std::optional<std::string> option(const CommandLine& cl, const std::string& name) {
    auto it = cl.options.find(name);
    if (it == cl.options.end()) return std::nullopt;
    return it->second;
}

void print_dns_servers(const std::vector<DnsServer>& servers) {
    if (servers.empty()) {
        std::cout << Color::YELLOW << "No DNS servers registered." << Color::RESET << "\n";
        return;
    }
    std::cout << Color::MAGENTA << Color::BOLD << "DNS servers" << Color::RESET << "\n";
    for (const auto& s : servers) {
        std::cout << Icon::TREE << s.name << "  " << Color::CYAN << s.ip_address << Color::RESET << "\n";
    }
}

void print_site(const VirtualNetworkSite& site) {
    std::cout << Color::BOLD << site.name << Color::RESET << " (affinity group " << site.affinity_group << ")\n";
    for (const auto& block : site.address_space) {
        std::cout << "    Address space: " << Color::CYAN << block << Color::RESET << "\n";
    }
    for (const auto& subnet : site.subnets) {
        std::cout << "    " << Icon::TREE << subnet.name << "  " << Color::CYAN << subnet.address_prefix
                  << Color::RESET << "\n";
    }
    for (const auto& ref : site.dns_servers_ref) {
        std::cout << "    DNS server: " << ref.name << "\n";
    }
}

void print_sites(const std::vector<VirtualNetworkSite>& sites) {
    if (sites.empty()) {
        std::cout << Color::YELLOW << "No virtual networks defined." << Color::RESET << "\n";
        return;
    }
    std::cout << Color::MAGENTA << Color::BOLD << "Virtual networks" << Color::RESET << "\n";
    for (const auto& site : sites) print_site(site);
}

void print_error(const NetConfigError& ex) {
    std::cerr << Color::RED << Icon::CROSS << error_kind_name(ex.kind()) << ": " << ex.what() << Color::RESET << "\n";
    if (!ex.diagnostics().empty()) {
        std::cerr << "Available:\n";
        for (const auto& item : ex.diagnostics()) {
            std::cerr << "  " << Icon::TREE << item << "\n";
        }
    }
}

int run_dns(ServiceContext& ctx, const CommandLine& cl, const std::string& action) {
    if (action == "list") {
        expect_options(cl, {});
        print_dns_servers(NetworkOperations::list_dns_servers(ctx));
    } else if (action == "register") {
        expect_options(cl, {"--ip", "--name"});
        std::optional<std::string> ip = option(cl, "--ip");
        if (!ip) throw UsageError("dns register needs --ip");
        DnsServer server = NetworkOperations::register_dns_server(ctx, *ip, option(cl, "--name"));
        std::cout << Color::GREEN << Icon::CHECK << "Registered DNS server " << server.name << " ("
                  << server.ip_address << ")." << Color::RESET << "\n";
    } else if (action == "unregister") {
        expect_options(cl, {"--ip", "--name"});
        DnsServer server = NetworkOperations::unregister_dns_server(ctx, option(cl, "--name"), option(cl, "--ip"));
        std::cout << Color::GREEN << Icon::CHECK << "Unregistered DNS server " << server.name << "."
                  << Color::RESET << "\n";
    } else {
        throw UsageError("unknown dns action '" + action + "'");
    }
    return 0;
}

int run_vnet(ServiceContext& ctx, const CommandLine& cl, const std::string& action) {
    if (action == "list") {
        expect_options(cl, {});
        print_sites(NetworkOperations::list_virtual_networks(ctx));
    } else if (action == "show") {
        expect_options(cl, {});
        print_site(NetworkOperations::show_virtual_network(ctx, argument(cl, "a virtual network name")));
    } else if (action == "create") {
        expect_options(cl, {Option::ADDRESS_SPACE, Option::CIDR, Option::MAX_VM_COUNT, Option::SUBNET_START_IP,
                            Option::SUBNET_CIDR, Option::SUBNET_VM_COUNT, Option::SUBNET_NAME,
                            "--dns-server-id", "--affinity-group", "--location"});
        CreateVirtualNetworkRequest request;
        request.name = argument(cl, "a virtual network name");
        request.addressing.address_space = option(cl, Option::ADDRESS_SPACE);
        request.addressing.cidr = option(cl, Option::CIDR);
        request.addressing.max_vm_count = option(cl, Option::MAX_VM_COUNT);
        request.addressing.subnet_start_ip = option(cl, Option::SUBNET_START_IP);
        request.addressing.subnet_cidr = option(cl, Option::SUBNET_CIDR);
        request.addressing.subnet_vm_count = option(cl, Option::SUBNET_VM_COUNT);
        request.addressing.subnet_name = option(cl, Option::SUBNET_NAME);
        request.dns_server_id = option(cl, "--dns-server-id");
        request.affinity.affinity_group = option(cl, "--affinity-group");
        request.affinity.location = option(cl, "--location");

        CreateVirtualNetworkResult result = NetworkOperations::create_virtual_network(ctx, request);
        if (result.affinity_group.is_newly_created) {
            std::cout << Color::YELLOW << "Created affinity group " << result.affinity_group.name << " in "
                      << result.affinity_group.location << "." << Color::RESET << "\n";
        }
        std::cout << Color::GREEN << Icon::CHECK << "Created virtual network:" << Color::RESET << "\n";
        print_site(result.site);
    } else if (action == "delete") {
        expect_options(cl, {});
        std::string name = argument(cl, "a virtual network name");
        if (NetworkOperations::delete_virtual_network(ctx, name) == DeleteOutcome::NO_SITES) {
            std::cout << Color::YELLOW << Icon::WARN << "No virtual networks defined, nothing deleted."
                      << Color::RESET << "\n";
        } else {
            std::cout << Color::GREEN << Icon::CHECK << "Deleted virtual network " << name << "." << Color::RESET
                      << "\n";
        }
    } else {
        throw UsageError("unknown vnet action '" + action + "'");
    }
    return 0;
}

int run_config(ServiceContext& ctx, const CommandLine& cl, const std::string& action) {
    expect_options(cl, {});
    if (action == "show") {
        std::cout << StateManager::dump(ctx.fetch_configuration()) << "\n";
    } else if (action == "export") {
        std::string path = argument(cl, "a file name");
        NetworkOperations::export_configuration(ctx, path);
        std::cout << Color::GREEN << Icon::CHECK << "Network configuration exported to " << path << "."
                  << Color::RESET << "\n";
    } else if (action == "import") {
        std::string path = argument(cl, "a file name");
        NetworkOperations::import_configuration(ctx, path);
        std::cout << Color::GREEN << Icon::CHECK << "Network configuration imported from " << path << "."
                  << Color::RESET << "\n";
    } else {
        throw UsageError("unknown config action '" + action + "'");
    }
    return 0;
}

int run_command(ServiceContext& ctx, const CommandLine& cl) {
    if (cl.positional.size() < 2) {
        throw UsageError("missing command");
    }
    const std::string& group = cl.positional[0];
    const std::string& action = cl.positional[1];
    if (cl.positional.size() > 2 && action != "show" && action != "create" && action != "delete" &&
        action != "export" && action != "import") {
        throw UsageError("unexpected argument " + cl.positional[2]);
    }

    if (group == "dns") return run_dns(ctx, cl, action);
    if (group == "vnet") return run_vnet(ctx, cl, action);
    if (group == "config") return run_config(ctx, cl, action);
    throw UsageError("unknown command group '" + group + "'");
}

int main(int argc, char* argv[]) {
    try {
        CommandLine cl = parse_command_line(argc, argv);

        Settings settings = Settings::load(cl.settings_path, cl.settings_given);
        if (cl.store_path) settings.store_path = *cl.store_path;

        activate_logging(cl.verbose ? spdlog::level::debug : settings.log_level);
        activate_file_logging(settings.log_file, settings.log_level);
        FileConfigurationStore store(settings.store_path);
        logger->debug("Using network configuration {}", store.get_path());

        CatalogAffinityResolver affinity(settings.affinity_groups, settings.locations, settings.required_capability);
        ServiceContext ctx(store, affinity, settings);
        return run_command(ctx, cl);
    } catch (const UsageError& ex) {
        std::cerr << Color::RED << "Error: " << ex.what() << Color::RESET << "\n\n";
        print_usage();
        return 2;
    } catch (const NetConfigError& ex) {
        logger->debug("Command failed with {}", error_kind_name(ex.kind()));
        print_error(ex);
        return 1;
    } catch (const std::exception& ex) {
        logger->error("Unexpected failure: {}", ex.what());
        return 1;
    }
}

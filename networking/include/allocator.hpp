#ifndef ALLOCATOR_HPP
#define ALLOCATOR_HPP

#include <optional>
#include <set>
#include <string>
#include "network.hpp"
#include "address_space.hpp"

namespace Option {
    const std::string ADDRESS_SPACE   = "--address-space";
    const std::string CIDR            = "--cidr";
    const std::string MAX_VM_COUNT    = "--max-vm-count";
    const std::string SUBNET_START_IP = "--subnet-start-ip";
    const std::string SUBNET_CIDR     = "--subnet-cidr";
    const std::string SUBNET_VM_COUNT = "--subnet-vm-count";
    const std::string SUBNET_NAME     = "--subnet-name";
}

// Raw option values for a new virtual network, as typed by the operator
struct AllocationRequest {
    std::optional<std::string> address_space;
    std::optional<std::string> cidr;
    std::optional<std::string> max_vm_count;
    std::optional<std::string> subnet_start_ip;
    std::optional<std::string> subnet_cidr;
    std::optional<std::string> subnet_vm_count;
    std::optional<std::string> subnet_name;

    std::set<std::string> present_options() const;
};

struct AllocatorDefaults {
    std::string address_space = "10.0.0.0";
    int subnet_cidr_offset = DEFAULT_SUBNET_CIDR_OFFSET;
    std::string subnet_name = "Subnet-1";
};

// Fully resolved address layout of a virtual network with one subnet
struct AddressLayout {
    std::string address_space;
    int cidr = 0;
    std::string subnet_start_ip;
    int subnet_cidr = 0;
    std::string subnet_name;

    std::string address_space_prefix() const;
    std::string subnet_prefix() const;
};

class AddressSpaceAllocator
{
private:
    AllocatorDefaults defaults;

public:
    explicit AddressSpaceAllocator(AllocatorDefaults defaults = AllocatorDefaults());

    // Option combinations are checked before any address is parsed.
    // Throws NetConfigError for the first invalid input.
    AddressLayout resolve(const AllocationRequest& request) const;
};

#endif

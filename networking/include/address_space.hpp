#ifndef ADDRESS_SPACE_HPP
#define ADDRESS_SPACE_HPP

#include <string>
#include <vector>
#include "network.hpp"

// A block of private IPv4 space virtual networks may be carved from
struct PrivateAddressSpace {
    std::string name;
    Octets start;
    Octets end;
    int default_cidr;
    CidrInterval allowed_cidr;

    bool contains(const Octets& address) const;
};

// The three RFC 1918 blocks
const std::vector<PrivateAddressSpace>& private_address_spaces();

// nullptr when the address is not in any private block
const PrivateAddressSpace* classify_private_address_space(const Octets& address);

#endif

#ifndef NETWORK_HPP
#define NETWORK_HPP
#include <array>
#include <cstdint>
#include <string>
#define IPV4_NET_BITS 32
#define DEFAULT_SUBNET_CIDR_OFFSET 3

using Octets = std::array<std::uint8_t, 4>;

struct IpRange {
    Octets start;
    Octets end;
};

// Inclusive interval of allowed CIDR prefixes
struct CidrInterval {
    int start;
    int end;
};

// A start address plus prefix length. The stored address is always the
// network address (host bits cleared).
class Network
{
private:
    std::uint32_t address;
    std::uint32_t mask;
    int slash;
    std::uint32_t broadcast;

public:
    Network();
    Network(const Octets& start, int slash);

    std::uint32_t get_address() const;
    std::uint32_t get_mask() const;
    int get_slash() const;
    std::uint32_t get_broadcast() const;

    void set_address(std::uint32_t address);
    void set_slash(int slash);

    IpRange range() const;
    bool contains(const Octets& candidate) const;
    bool contains(const Network& other) const;

    // "a.b.c.d/n"
    std::string to_string() const;
};

std::uint32_t octets_to_uint(const Octets& octets);
Octets uint_to_octets(std::uint32_t value);

std::string address_to_str(const Octets& octets);
std::string address_to_str(std::uint32_t address);

// Dotted decimal, 1-3 digits per octet. Throws INVALID_FORMAT naming parameter.
Octets parse_ipv4(const std::string& text, const std::string& parameter);

// 0-32 as decimal text. Throws INVALID_ARGUMENT naming parameter.
int parse_cidr(const std::string& text, const std::string& parameter);

// Positive decimal integer. Throws INVALID_ARGUMENT naming parameter.
std::uint64_t parse_host_count(const std::string& text, const std::string& parameter);

Octets network_mask(int cidr);
IpRange ip_range(const Octets& start, const Octets& mask);
bool is_in_range(const Octets& range_start, const Octets& range_end, const Octets& candidate);

int cidr_from_host_count(std::uint64_t host_count);
std::uint64_t host_count_for_cidr(int cidr);

// Throws OUT_OF_RANGE; origin names where cidr came from ("--cidr", "default CIDR", ...)
void verify_cidr(int cidr, const CidrInterval& allowed, const std::string& origin);

int default_subnet_cidr_from(int address_space_cidr, int offset = DEFAULT_SUBNET_CIDR_OFFSET);

#endif

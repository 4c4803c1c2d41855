#include <network.hpp>
#include <logging.hpp>
#include <errors.hpp>
#include <regex>
#include <algorithm>

#define IPV4_ADDRESS_PATTERN "([0-9]{1,3})\\.([0-9]{1,3})\\.([0-9]{1,3})\\.([0-9]{1,3})"

static std::uint32_t mask_for_slash(int slash)
{
    // Shifting a 32-bit value by 32 is undefined
    return slash == 0 ? 0u : (~0u) << (IPV4_NET_BITS - slash);
}

static void assert_slash(int slash)
{
    if (slash < 0 || slash > IPV4_NET_BITS)
        throw NetConfigError(ErrorKind::OUT_OF_RANGE,
                             "CIDR " + std::to_string(slash) + " is outside [0, 32]");
}

std::uint32_t octets_to_uint(const Octets& octets)
{
    return (static_cast<std::uint32_t>(octets[0]) << 24) |
           (static_cast<std::uint32_t>(octets[1]) << 16) |
           (static_cast<std::uint32_t>(octets[2]) << 8) |
           static_cast<std::uint32_t>(octets[3]);
}

Octets uint_to_octets(std::uint32_t value)
{
    return Octets{static_cast<std::uint8_t>(value >> 24), static_cast<std::uint8_t>(value >> 16),
                  static_cast<std::uint8_t>(value >> 8), static_cast<std::uint8_t>(value)};
}

std::string address_to_str(std::uint32_t address)
{
    std::string str_address;
    int bits = 24;
    while(bits > -1)
    {
        str_address.append(std::to_string((address >> bits) & 255));
        str_address.append((bits -= 8) > -1 ? "." : "");
    }
    return str_address;
}

std::string address_to_str(const Octets& octets)
{
    return address_to_str(octets_to_uint(octets));
}

Octets parse_ipv4(const std::string& text, const std::string& parameter)
{
    logger->trace("Parsing [{}] value [{}] as IPv4 address...", parameter, text);
    static const std::regex pattern(IPV4_ADDRESS_PATTERN);
    std::smatch match;
    if (!std::regex_match(text, match, pattern))
    {
        throw NetConfigError(ErrorKind::INVALID_FORMAT,
                             parameter + ": '" + text + "' is not a valid IPv4 address");
    }

    Octets octets{};
    for (int i = 0; i < 4; ++i)
    {
        int value = std::stoi(match[i + 1].str());
        if (value > 255)
        {
            throw NetConfigError(ErrorKind::INVALID_FORMAT,
                                 parameter + ": octet " + std::to_string(i + 1) + " of '" + text +
                                 "' is greater than 255");
        }
        octets[i] = static_cast<std::uint8_t>(value);
    }
    return octets;
}

int parse_cidr(const std::string& text, const std::string& parameter)
{
    static const std::regex pattern("[0-9]{1,2}");
    if (!std::regex_match(text, pattern))
        throw NetConfigError(ErrorKind::INVALID_ARGUMENT,
                             parameter + ": '" + text + "' is not a valid CIDR prefix length");

    int cidr = std::stoi(text);
    if (cidr > IPV4_NET_BITS)
        throw NetConfigError(ErrorKind::INVALID_ARGUMENT,
                             parameter + ": CIDR " + text + " is greater than 32");
    return cidr;
}

std::uint64_t parse_host_count(const std::string& text, const std::string& parameter)
{
    // More than 10 digits can never fit into an IPv4 address space
    static const std::regex pattern("[0-9]{1,10}");
    if (!std::regex_match(text, pattern))
        throw NetConfigError(ErrorKind::INVALID_ARGUMENT,
                             parameter + ": '" + text + "' is not a positive integer");

    std::uint64_t count = std::stoull(text);
    if (count == 0)
        throw NetConfigError(ErrorKind::INVALID_ARGUMENT,
                             parameter + ": host count must be greater than zero");
    return count;
}

Octets network_mask(int cidr)
{
    assert_slash(cidr);
    return uint_to_octets(mask_for_slash(cidr));
}

IpRange ip_range(const Octets& start, const Octets& mask)
{
    IpRange range;
    for (int i = 0; i < 4; ++i)
    {
        range.start[i] = static_cast<std::uint8_t>(start[i] & mask[i]);
        range.end[i] = static_cast<std::uint8_t>(range.start[i] | static_cast<std::uint8_t>(~mask[i]));
    }
    return range;
}

bool is_in_range(const Octets& range_start, const Octets& range_end, const Octets& candidate)
{
    std::uint32_t value = octets_to_uint(candidate);
    return value >= octets_to_uint(range_start) && value <= octets_to_uint(range_end);
}

int cidr_from_host_count(std::uint64_t host_count)
{
    const std::uint64_t address_space = std::uint64_t(1) << IPV4_NET_BITS;
    if (host_count == 0)
        throw NetConfigError(ErrorKind::INVALID_ARGUMENT, "host count must be greater than zero");
    if (host_count + 2 > address_space)
        throw NetConfigError(ErrorKind::INVALID_ARGUMENT,
                             "host count " + std::to_string(host_count) +
                             " does not fit into the IPv4 address space");

    // Most specific prefix whose block still holds the hosts plus network and broadcast
    int cidr = IPV4_NET_BITS;
    while ((std::uint64_t(1) << (IPV4_NET_BITS - cidr)) < host_count + 2)
        --cidr;

    logger->debug("host count {} -> CIDR {}", host_count, cidr);
    return cidr;
}

std::uint64_t host_count_for_cidr(int cidr)
{
    assert_slash(cidr);
    if (cidr >= 31)
        return 0;
    return (std::uint64_t(1) << (IPV4_NET_BITS - cidr)) - 2;
}

void verify_cidr(int cidr, const CidrInterval& allowed, const std::string& origin)
{
    if (cidr < allowed.start || cidr > allowed.end)
    {
        throw NetConfigError(ErrorKind::OUT_OF_RANGE,
                             origin + " " + std::to_string(cidr) + " is outside the allowed CIDR range [" +
                             std::to_string(allowed.start) + ", " + std::to_string(allowed.end) + "]");
    }
}

int default_subnet_cidr_from(int address_space_cidr, int offset)
{
    return std::min(address_space_cidr + offset, IPV4_NET_BITS);
}

// Network class definition

Network::Network() : address(0), mask(0), slash(0), broadcast(~0u) {}

Network::Network(const Octets& start, int slash) : Network()
{
    set_slash(slash);
    set_address(octets_to_uint(start));
}

std::uint32_t Network::get_address() const
{
    return this->address;
}

std::uint32_t Network::get_mask() const
{
    return this->mask;
}

int Network::get_slash() const
{
    return this->slash;
}

std::uint32_t Network::get_broadcast() const
{
    return this->broadcast;
}

void Network::set_address(std::uint32_t address)
{
    this->address = address & this->mask;
    this->broadcast = this->address | ~this->mask;
}

void Network::set_slash(int slash)
{
    assert_slash(slash);
    this->slash = slash;
    this->mask = mask_for_slash(slash);
    set_address(this->address);
}

IpRange Network::range() const
{
    return IpRange{uint_to_octets(address), uint_to_octets(broadcast)};
}

bool Network::contains(const Octets& candidate) const
{
    IpRange own = range();
    return is_in_range(own.start, own.end, candidate);
}

bool Network::contains(const Network& other) const
{
    IpRange inner = other.range();
    return contains(inner.start) && contains(inner.end);
}

std::string Network::to_string() const
{
    return address_to_str(address) + "/" + std::to_string(slash);
}

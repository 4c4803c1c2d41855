#include <netparser.hpp>
#include <logging.hpp>
#include <errors.hpp>
#include <regex>
#include <bitset>

#define IPV4_NET_PATTERN "[0-9]{1,3}(\\.[0-9]{1,3}){3}/[0-9]{1,2}"


NetParser::NetParser(const std::string& str_net, const std::string& parameter)
{
    assert_network(str_net, parameter);
    std::string::size_type slash_index = str_net.find('/');
    start_address = parse_ipv4(str_net.substr(0, slash_index), parameter);
    int slash = extract_slash(str_net, parameter);

    network = Network(start_address, slash);
    logger->debug("Mask for [{}]: {}", str_net, std::bitset<IPV4_NET_BITS>(network.get_mask()).to_string());
}

const Network& NetParser::get_network() const
{
    return this->network;
}

const Octets& NetParser::get_start_address() const
{
    return this->start_address;
}

bool NetParser::is_aligned() const
{
    return octets_to_uint(start_address) == network.get_address();
}

void NetParser::assert_network(const std::string& str_net, const std::string& parameter)
{
    logger->trace("Validating the [{}] string network...", str_net);
    static const std::regex pattern(IPV4_NET_PATTERN);
    if (!std::regex_match(str_net, pattern))
    {
        logger->debug("Error parsing network [{}]", str_net);
        throw NetConfigError(ErrorKind::INVALID_FORMAT,
                             parameter + ": '" + str_net + "' is not a valid CIDR block (expected x.x.x.x/yy)");
    }
    logger->trace("Network string [{}] OK", str_net);
}

int NetParser::extract_slash(const std::string& str_net, const std::string& parameter)
{
    logger->trace("Extracting slash value...");
    std::string::size_type slash_index = str_net.find('/') + 1;
    int slash = parse_cidr(str_net.substr(slash_index), parameter);
    logger->debug("slash_value={}", slash);

    return slash;
}

#ifndef NETPARSER_HPP
#define NETPARSER_HPP
#include <string>
#include "network.hpp"

// Parses "a.b.c.d/n" blocks as found in AddressSpace and AddressPrefix values.
class NetParser
{
private:
    Network network;
    Octets start_address;

    void assert_network(const std::string& str_net, const std::string& parameter);
    int extract_slash(const std::string& str_net, const std::string& parameter);

public:
    NetParser(const std::string& str_net, const std::string& parameter);

    const Network& get_network() const;

    // Address as written, before host bits are cleared
    const Octets& get_start_address() const;

    // True when the written address already is the network address
    bool is_aligned() const;
};

#endif

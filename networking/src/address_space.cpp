#include <address_space.hpp>

// +-----------------+-----------------+---------+----------+
// | Block           | Last address    | Default | Allowed  |
// +-----------------+-----------------+---------+----------+
// | 10.0.0.0/8      | 10.255.255.255  | /8      | /8-/29   |
// | 172.16.0.0/12   | 172.31.255.255  | /12     | /12-/29  |
// | 192.168.0.0/16  | 192.168.255.255 | /16     | /16-/29  |
// +-----------------+-----------------+---------+----------+

bool PrivateAddressSpace::contains(const Octets& address) const
{
    return is_in_range(start, end, address);
}

const std::vector<PrivateAddressSpace>& private_address_spaces()
{
    static const std::vector<PrivateAddressSpace> spaces = {
        {"10.0.0.0/8", {10, 0, 0, 0}, {10, 255, 255, 255}, 8, {8, 29}},
        {"172.16.0.0/12", {172, 16, 0, 0}, {172, 31, 255, 255}, 12, {12, 29}},
        {"192.168.0.0/16", {192, 168, 0, 0}, {192, 168, 255, 255}, 16, {16, 29}},
    };
    return spaces;
}

const PrivateAddressSpace* classify_private_address_space(const Octets& address)
{
    for (const auto& space : private_address_spaces()) {
        if (space.contains(address))
            return &space;
    }
    return nullptr;
}

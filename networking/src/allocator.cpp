#include <allocator.hpp>
#include <requirements.hpp>
#include <errors.hpp>
#include <logging.hpp>
#include <utilities.hpp>
#include <algorithm>
#include <utility>
#include <vector>

// Which options only make sense together with which others
static const RequirementValidator& option_rules()
{
    static const RequirementValidator rules = [] {
        RequirementValidator v;
        Requirement address_space = Requirement::parameter(Option::ADDRESS_SPACE);
        Requirement address_space_size = Requirement::any_of({Requirement::parameter(Option::CIDR),
                                                              Requirement::parameter(Option::MAX_VM_COUNT)});
        Requirement subnet_start = Requirement::parameter(Option::SUBNET_START_IP);

        v.add_exclusive({Option::CIDR, Option::MAX_VM_COUNT})
         .add_exclusive({Option::SUBNET_CIDR, Option::SUBNET_VM_COUNT})
         .add_rule(Option::CIDR, Requirement::all({address_space}))
         .add_rule(Option::MAX_VM_COUNT, Requirement::all({address_space}))
         .add_rule(Option::SUBNET_START_IP, Requirement::all({address_space, address_space_size}))
         .add_rule(Option::SUBNET_CIDR, Requirement::all({address_space, address_space_size, subnet_start}))
         .add_rule(Option::SUBNET_VM_COUNT, Requirement::all({address_space, address_space_size, subnet_start}));
        return v;
    }();
    return rules;
}

// Host count option -> CIDR, with the option named in every failure
static int cidr_from_host_count_option(const std::string& text, const std::string& parameter)
{
    std::uint64_t count = parse_host_count(text, parameter);
    try
    {
        return cidr_from_host_count(count);
    }
    catch (const NetConfigError& ex)
    {
        throw NetConfigError(ex.kind(), parameter + ": " + ex.what());
    }
}

static std::string range_to_str(const IpRange& range)
{
    return "[" + address_to_str(range.start) + ", " + address_to_str(range.end) + "]";
}

std::set<std::string> AllocationRequest::present_options() const
{
    std::set<std::string> present;
    const std::pair<const std::optional<std::string>*, const std::string*> options[] = {
        {&address_space, &Option::ADDRESS_SPACE},
        {&cidr, &Option::CIDR},
        {&max_vm_count, &Option::MAX_VM_COUNT},
        {&subnet_start_ip, &Option::SUBNET_START_IP},
        {&subnet_cidr, &Option::SUBNET_CIDR},
        {&subnet_vm_count, &Option::SUBNET_VM_COUNT},
        {&subnet_name, &Option::SUBNET_NAME},
    };
    for (const auto& option : options)
    {
        if (option.first->has_value())
            present.insert(*option.second);
    }
    return present;
}

std::string AddressLayout::address_space_prefix() const
{
    return address_space + "/" + std::to_string(cidr);
}

std::string AddressLayout::subnet_prefix() const
{
    return subnet_start_ip + "/" + std::to_string(subnet_cidr);
}

AddressSpaceAllocator::AddressSpaceAllocator(AllocatorDefaults defaults) : defaults(std::move(defaults)) {}

AddressLayout AddressSpaceAllocator::resolve(const AllocationRequest& request) const
{
    option_rules().check(request.present_options());

    // Address space start
    const std::string address_space_origin = request.address_space ? Option::ADDRESS_SPACE : "default address space";
    Octets start = parse_ipv4(request.address_space.value_or(defaults.address_space), address_space_origin);
    const PrivateAddressSpace* space = classify_private_address_space(start);
    if (!space)
    {
        std::vector<std::string> names;
        for (const auto& s : private_address_spaces())
            names.push_back(s.name);
        throw NetConfigError(ErrorKind::OUT_OF_RANGE,
                             address_space_origin + " " + address_to_str(start) +
                             " is not inside a private address range (" + join(names, ", ") + ")");
    }
    logger->debug("Address space {} belongs to {}", address_to_str(start), space->name);

    // Address space CIDR
    int cidr;
    if (request.max_vm_count)
    {
        cidr = cidr_from_host_count_option(*request.max_vm_count, Option::MAX_VM_COUNT);
        verify_cidr(cidr, space->allowed_cidr, "CIDR calculated from " + Option::MAX_VM_COUNT);
    }
    else if (request.cidr)
    {
        cidr = parse_cidr(*request.cidr, Option::CIDR);
        verify_cidr(cidr, space->allowed_cidr, Option::CIDR);
    }
    else
    {
        cidr = space->default_cidr;
        verify_cidr(cidr, space->allowed_cidr, "default CIDR");
    }

    IpRange address_range = ip_range(start, network_mask(cidr));
    logger->debug("Address space range {}", range_to_str(address_range));

    // Subnet start
    Octets subnet_start = address_range.start;
    if (request.subnet_start_ip)
    {
        subnet_start = parse_ipv4(*request.subnet_start_ip, Option::SUBNET_START_IP);
        if (!is_in_range(address_range.start, address_range.end, subnet_start))
        {
            throw NetConfigError(ErrorKind::OUT_OF_RANGE,
                                 Option::SUBNET_START_IP + " " + address_to_str(subnet_start) +
                                 " is outside the address space range " + range_to_str(address_range));
        }
    }

    // Subnet CIDR: at least as specific as the address space
    CidrInterval subnet_allowed{cidr, space->allowed_cidr.end};
    int subnet_cidr;
    if (request.subnet_vm_count)
    {
        subnet_cidr = cidr_from_host_count_option(*request.subnet_vm_count, Option::SUBNET_VM_COUNT);
        verify_cidr(subnet_cidr, subnet_allowed, "subnet CIDR calculated from " + Option::SUBNET_VM_COUNT);
    }
    else if (request.subnet_cidr)
    {
        subnet_cidr = parse_cidr(*request.subnet_cidr, Option::SUBNET_CIDR);
        verify_cidr(subnet_cidr, subnet_allowed, Option::SUBNET_CIDR);
    }
    else
    {
        subnet_cidr = std::min(default_subnet_cidr_from(cidr, defaults.subnet_cidr_offset), subnet_allowed.end);
        verify_cidr(subnet_cidr, subnet_allowed, "default subnet CIDR");
    }

    if (request.subnet_name && request.subnet_name->empty())
        throw NetConfigError(ErrorKind::INVALID_ARGUMENT, Option::SUBNET_NAME + " cannot be empty");

    IpRange subnet_range = ip_range(subnet_start, network_mask(subnet_cidr));

    AddressLayout layout;
    layout.address_space = address_to_str(address_range.start);
    layout.cidr = cidr;
    layout.subnet_start_ip = address_to_str(subnet_range.start);
    layout.subnet_cidr = subnet_cidr;
    layout.subnet_name = request.subnet_name.value_or(defaults.subnet_name);

    logger->debug("Resolved layout: address space {}, subnet {} {}",
                  layout.address_space_prefix(), layout.subnet_name, layout.subnet_prefix());
    return layout;
}

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace sustainbot::cloud {

struct InstanceInfo {
    std::string id;
    std::string name;
    std::string state;          // AWS state or OpenStack status
    std::string type;           // instance type / flavor
    std::string image;
    std::string architecture;
    std::string address;
};

struct AwsCreateRequest {
    std::string region;
    std::string name;
    std::string imageId;
    std::string instanceType{"t3.micro"};
    std::string requestedBy;
};

enum class AwsAction : std::uint8_t {
    Start,
    Stop,
    Reboot,
};

struct OpenStackCreateRequest {
    std::string name;
    std::string imageId;
    std::string flavor;
    std::string network;
    std::string requestedBy;
};

// Raised by gateways when the provider rejects or fails a call.
class CloudError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Narrow boundary to the cloud provider SDKs. Implementations may block and
// report failures by throwing (CloudError or any std::exception).
class ICloudGateway {
public:
    virtual ~ICloudGateway() = default;

    // Empty state/type filters match everything.
    virtual std::vector<InstanceInfo> list_aws_instances(const std::string& region,
                                                         const std::string& state,
                                                         const std::string& type) = 0;

    virtual InstanceInfo create_aws_instance(const AwsCreateRequest& req) = 0;

    // Returns the instance's state after the action.
    virtual std::string modify_aws_instance(const std::string& region,
                                            const std::string& instanceId,
                                            AwsAction action) = 0;

    virtual std::vector<InstanceInfo> list_openstack_servers(const std::string& status) = 0;

    virtual InstanceInfo create_openstack_server(const OpenStackCreateRequest& req) = 0;
};

// Deterministic in-memory provider for the console app and tests.
// Instances are kept per region; ids are sequential ("i-0001", "os-0001").
class StubCloudGateway final : public ICloudGateway {
public:
    std::vector<InstanceInfo> list_aws_instances(const std::string& region,
                                                 const std::string& state,
                                                 const std::string& type) override;

    InstanceInfo create_aws_instance(const AwsCreateRequest& req) override;

    std::string modify_aws_instance(const std::string& region,
                                    const std::string& instanceId,
                                    AwsAction action) override;

    std::vector<InstanceInfo> list_openstack_servers(const std::string& status) override;

    InstanceInfo create_openstack_server(const OpenStackCreateRequest& req) override;

private:
    std::mutex _mx;
    std::uint32_t _nextAws{0};
    std::uint32_t _nextOs{0};
    std::map<std::string, std::vector<InstanceInfo>> _aws;   // region -> instances
    std::vector<InstanceInfo> _openstack;
};

const char* to_string(AwsAction a);

// "start" | "stop" | "reboot"; false for anything else.
bool parse_aws_action(const std::string& s, AwsAction& out);

} // namespace sustainbot::cloud

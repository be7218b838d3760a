#include "sustainbot/cloud/cloud_gateway.h"

#include "sustainbot/core/logging.h"

#include <cstdio>

namespace sustainbot::cloud {

using sustainbot::log::Level;
static constexpr const char* TAG = "cloud";

static std::string make_id(const char* prefix, std::uint32_t n)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s-%04u", prefix, static_cast<unsigned>(n));
    return buf;
}

const char* to_string(AwsAction a)
{
    switch (a) {
    case AwsAction::Start:  return "start";
    case AwsAction::Stop:   return "stop";
    case AwsAction::Reboot: return "reboot";
    }
    return "unknown";
}

bool parse_aws_action(const std::string& s, AwsAction& out)
{
    if (s == "start")  { out = AwsAction::Start;  return true; }
    if (s == "stop")   { out = AwsAction::Stop;   return true; }
    if (s == "reboot") { out = AwsAction::Reboot; return true; }
    return false;
}

std::vector<InstanceInfo> StubCloudGateway::list_aws_instances(const std::string& region,
                                                               const std::string& state,
                                                               const std::string& type)
{
    std::lock_guard<std::mutex> g(_mx);

    std::vector<InstanceInfo> out;
    auto it = _aws.find(region);
    if (it == _aws.end()) {
        return out;
    }
    for (const auto& inst : it->second) {
        if (!state.empty() && inst.state != state) continue;
        if (!type.empty() && inst.type != type) continue;
        out.push_back(inst);
    }
    return out;
}

InstanceInfo StubCloudGateway::create_aws_instance(const AwsCreateRequest& req)
{
    if (req.imageId.empty()) {
        throw CloudError("no image id given");
    }

    std::lock_guard<std::mutex> g(_mx);

    InstanceInfo inst;
    inst.id           = make_id("i", ++_nextAws);
    inst.name         = req.name.empty() ? inst.id : req.name;
    inst.state        = "running";
    inst.type         = req.instanceType;
    inst.image        = req.imageId;
    inst.architecture = "x86_64";
    inst.address      = "10.0.0." + std::to_string(_nextAws);

    _aws[req.region].push_back(inst);
    SB_LOGI(TAG, "Created AWS instance %s in %s for '%s'",
            inst.id.c_str(), req.region.c_str(), req.requestedBy.c_str());
    return inst;
}

std::string StubCloudGateway::modify_aws_instance(const std::string& region,
                                                  const std::string& instanceId,
                                                  AwsAction action)
{
    std::lock_guard<std::mutex> g(_mx);

    auto it = _aws.find(region);
    if (it != _aws.end()) {
        for (auto& inst : it->second) {
            if (inst.id != instanceId) continue;
            switch (action) {
            case AwsAction::Start:  inst.state = "running"; break;
            case AwsAction::Stop:   inst.state = "stopped"; break;
            case AwsAction::Reboot: inst.state = "running"; break;
            }
            return inst.state;
        }
    }
    throw CloudError("instance '" + instanceId + "' not found in " + region);
}

std::vector<InstanceInfo> StubCloudGateway::list_openstack_servers(const std::string& status)
{
    std::lock_guard<std::mutex> g(_mx);

    std::vector<InstanceInfo> out;
    for (const auto& s : _openstack) {
        if (!status.empty() && s.state != status) continue;
        out.push_back(s);
    }
    return out;
}

InstanceInfo StubCloudGateway::create_openstack_server(const OpenStackCreateRequest& req)
{
    if (req.name.empty()) {
        throw CloudError("server name is required");
    }

    std::lock_guard<std::mutex> g(_mx);

    InstanceInfo s;
    s.id      = make_id("os", ++_nextOs);
    s.name    = req.name;
    s.state   = "ACTIVE";
    s.type    = req.flavor;
    s.image   = req.imageId;
    s.address = req.network;

    _openstack.push_back(s);
    SB_LOGI(TAG, "Created OpenStack server %s (%s) for '%s'",
            s.id.c_str(), s.name.c_str(), req.requestedBy.c_str());
    return s;
}

} // namespace sustainbot::cloud

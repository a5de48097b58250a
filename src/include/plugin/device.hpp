#pragma once
/**
 * @file device.hpp
 * @brief A device (thing) exposed by an adapter.
 */
#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace gwbridge::plugin
{

struct Device
{
    std::string id;
    std::string name;
    std::string type;
    /// property name -> current value
    std::map<std::string, nlohmann::json> properties;
    /// action name -> description
    std::map<std::string, nlohmann::json> actions;
};

} // namespace gwbridge::plugin

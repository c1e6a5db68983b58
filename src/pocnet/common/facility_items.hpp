/**
 * @file facility_items.hpp
 * @brief Value types for the facility hierarchy: toolsets, equipment, PoCs.
 */
#pragma once
#include "pocnet/common/common.hpp"
#include "pocnet/common/network_enums.hpp"

namespace pocnet
{

/**
 * @brief A point of contact on a piece of equipment.
 *
 * @details
 * Each PoC is backed by one network node. `utility_no` is empty when the PoC
 * has no utility assignment; `markers` and `reference` are empty strings when
 * missing.
 */
struct EquipmentPoc
{
    std::int64_t poc_id{0};
    std::int64_t equipment_id{0};
    std::string code;
    NodeId node_id{0};
    std::optional<std::int64_t> utility_no;
    std::string markers;
    std::string reference;
    std::string material;
    FlowDirection flow{FlowDirection::Unknown};
    bool is_used{false};
    bool is_active{true};
    bool is_loopback{false};
};

/**
 * @brief A piece of equipment and its points of contact.
 */
struct Equipment
{
    std::int64_t equipment_id{0};
    std::string guid;
    std::string name;
    std::string toolset_code;
    /// Equipment kind, e.g. "PROCESSING"; also used as the sampling category.
    std::string kind;
    bool is_active{true};
    std::vector<EquipmentPoc> pocs;
};

/**
 * @brief A named group of equipment within a fab and phase.
 */
struct Toolset
{
    /// Integer id matching `NetworkNode::toolset_id`.
    std::int64_t toolset_id{0};
    std::string code;
    std::string fab;
    std::int64_t model_no{0};
    std::int64_t phase_no{0};
    std::string name;
    bool is_active{true};
    std::vector<Equipment> equipment;
};

/**
 * @brief PoC attributes joined with the owning equipment, as read by validation.
 */
struct PocInfo
{
    EquipmentPoc poc;
    std::string equipment_guid;
    std::string equipment_kind;
};

} // namespace pocnet

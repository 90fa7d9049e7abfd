#pragma once

#include "net/MiniJson.h"
#include "net/Url.h"
#include "upstream/Upstream.h"
#include <cstdint>
#include <optional>
#include <string>

// Inbound request shapes and their upstream translation. Every parse_*
// function throws gateway::GatewayError (ValidationError) on bad input, so a
// request that fails here never reaches the upstream.
namespace gateway {

// Category every created resource is filed under.
constexpr int64_t kResourceTypeId = 25;
constexpr int64_t kServiceOfferingId = 8;
constexpr const char* kDefaultExternalId = "9";
constexpr const char* kCancelledStatus = "CANCELLED";
constexpr const char* kEventIdPrefix = "event_";

struct ResourceListQuery {
    bool active_only = true;
    std::optional<std::string> resource_type;
    std::optional<std::string> service_offering;
};

struct ResourceCreateRequest {
    std::string name;
    std::string description;
    std::string external_id = kDefaultExternalId;
};

struct ScheduleCreateRequest {
    int64_t resource_id = 0;
    JsonValue start;
    JsonValue end;
};

struct ScheduleStatusUpdateRequest {
    int64_t schedule_id = 0;
    std::string status;
};

struct ScheduleListQuery {
    int64_t page = 1;
    std::string sort = "id,asc";
};

ResourceListQuery parse_resource_list_query(const QueryParams& q);
ResourceCreateRequest parse_resource_create(const std::string& body);
ScheduleCreateRequest parse_schedule_create(const std::string& body);
ScheduleStatusUpdateRequest parse_schedule_status_update(const std::string& raw_schedule_id, const std::string& body);
ScheduleListQuery parse_schedule_list_query(const QueryParams& q);

upstream::UpstreamRequest to_upstream(const ResourceListQuery& q);
upstream::UpstreamRequest to_upstream(const ResourceCreateRequest& r);
upstream::UpstreamRequest to_upstream(const ScheduleCreateRequest& r);
upstream::UpstreamRequest to_upstream(const ScheduleStatusUpdateRequest& r);
upstream::UpstreamRequest to_upstream(const ScheduleListQuery& q);

// "event_42" and "42" both yield 42; anything else is a ValidationError
// naming the raw value.
int64_t parse_schedule_id(const std::string& raw);

// Accepts true/false/1/0/yes/no/on/off in any case.
std::optional<bool> parse_bool_param(const std::string& s);

}

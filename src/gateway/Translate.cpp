#include "Translate.h"
#include "GatewayError.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace http = boost::beast::http;

namespace gateway {

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e - b);
}

static JsonValue parse_body_object(const std::string& body) {
    auto doc = json_try_parse(body);
    if (!doc || !doc->is_object()) throw GatewayError::validation("Invalid JSON body");
    return std::move(*doc);
}

// Absent, null and "" are all "missing"; a non-string value is rejected.
static std::optional<std::string> string_field(const JsonValue& obj, const std::string& key) {
    const JsonValue* v = obj.find(key);
    if (!v || v->is_null()) return std::nullopt;
    if (!v->is_string()) throw GatewayError::validation(key + " must be a string");
    if (v->as_string().empty()) return std::nullopt;
    return v->as_string();
}

static std::optional<int64_t> coerce_int(const JsonValue& v) {
    if (v.is_integer()) return v.as_int();
    if (v.is_number()) {
        double d = std::trunc(v.as_double());
        if (!std::isfinite(d) || d < -9.2e18 || d > 9.2e18) return std::nullopt;
        return static_cast<int64_t>(d);
    }
    if (v.is_string()) return parse_int64_strict_sv(trim(v.as_string()));
    return std::nullopt;
}

std::optional<bool> parse_bool_param(const std::string& s) {
    std::string l = s;
    std::transform(l.begin(), l.end(), l.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (l == "true" || l == "1" || l == "yes" || l == "on") return true;
    if (l == "false" || l == "0" || l == "no" || l == "off") return false;
    return std::nullopt;
}

ResourceListQuery parse_resource_list_query(const QueryParams& q) {
    ResourceListQuery out;
    if (auto v = q.get("activeOnly")) {
        auto b = parse_bool_param(*v);
        if (!b) throw GatewayError::validation("activeOnly must be a boolean, got: " + *v);
        out.active_only = *b;
    }
    if (auto v = q.get("resourceType"); v && !v->empty()) out.resource_type = *v;
    if (auto v = q.get("serviceOffering"); v && !v->empty()) out.service_offering = *v;
    return out;
}

ResourceCreateRequest parse_resource_create(const std::string& body) {
    JsonValue doc = parse_body_object(body);
    ResourceCreateRequest out;
    auto name = string_field(doc, "name");
    if (!name) throw GatewayError::validation("Resource name is required");
    auto description = string_field(doc, "description");
    if (!description) throw GatewayError::validation("Resource description is required");
    out.name = *name;
    out.description = *description;
    if (auto ext = string_field(doc, "externalId")) out.external_id = *ext;
    return out;
}

ScheduleCreateRequest parse_schedule_create(const std::string& body) {
    JsonValue doc = parse_body_object(body);
    const JsonValue* resources = doc.find("resources");
    if (!resources || !resources->is_array() || resources->size() == 0) {
        throw GatewayError::validation("At least one resource is required");
    }
    const JsonValue* timeslot = doc.find("timeslot");
    if (!timeslot || timeslot->is_null()) throw GatewayError::validation("Timeslot is required");
    if (!timeslot->is_object()) throw GatewayError::validation("Timeslot must be an object");

    const JsonValue& first = resources->as_array().front();
    const JsonValue* id = first.find("id");
    if (!id || id->is_null()) throw GatewayError::validation("Resource id is required");
    auto coerced = coerce_int(*id);
    if (!coerced) {
        throw GatewayError::validation("Invalid resource id: " + (id->is_string() ? id->as_string() : json_dump(*id)));
    }

    const JsonValue* start = timeslot->find("start");
    const JsonValue* end = timeslot->find("end");
    if (!start || !end) throw GatewayError::validation("Timeslot start and end are required");

    ScheduleCreateRequest out;
    out.resource_id = *coerced;
    out.start = *start;
    out.end = *end;
    return out;
}

int64_t parse_schedule_id(const std::string& raw) {
    std::string_view digits(raw);
    std::string_view prefix(kEventIdPrefix);
    if (digits.substr(0, prefix.size()) == prefix) digits.remove_prefix(prefix.size());
    auto id = parse_int64_strict_sv(digits);
    if (!id) throw GatewayError::validation("Invalid schedule ID format: " + raw);
    return *id;
}

ScheduleStatusUpdateRequest parse_schedule_status_update(const std::string& raw_schedule_id, const std::string& body) {
    JsonValue doc = parse_body_object(body);
    const JsonValue* status = doc.find("status");
    if (!status || status->is_null()) throw GatewayError::validation("Status is required");
    if (!status->is_string() || status->as_string() != kCancelledStatus) {
        throw GatewayError::validation("Only CANCELLED status is supported");
    }
    ScheduleStatusUpdateRequest out;
    out.schedule_id = parse_schedule_id(raw_schedule_id);
    out.status = kCancelledStatus;
    return out;
}

ScheduleListQuery parse_schedule_list_query(const QueryParams& q) {
    ScheduleListQuery out;
    if (auto v = q.get("page")) {
        auto page = parse_int64_strict_sv(trim(*v));
        if (!page) throw GatewayError::validation("page must be an integer, got: " + *v);
        out.page = *page;
    }
    if (auto v = q.get("sort")) out.sort = *v;
    return out;
}

static std::string with_query(const std::string& path, const QueryParams& q) {
    if (q.empty()) return path;
    return path + "?" + q.encode();
}

upstream::UpstreamRequest to_upstream(const ResourceListQuery& q) {
    QueryParams params;
    params.add("activeOnly", q.active_only ? "true" : "false");
    if (q.resource_type) params.add("resourceType", *q.resource_type);
    if (q.service_offering) params.add("serviceOffering", *q.service_offering);
    return {http::verb::get, with_query("/api/resources", params), std::string()};
}

upstream::UpstreamRequest to_upstream(const ResourceCreateRequest& r) {
    JsonValue payload = JsonValue::object();
    payload.set("name", r.name);
    payload.set("description", r.description);
    payload.set("externalId", r.external_id);
    payload.set("resourceType", JsonValue::object().set("id", kResourceTypeId));
    payload.set("serviceOffering", JsonValue::object().set("id", kServiceOfferingId));
    return {http::verb::post, "/api/resources", json_dump(payload)};
}

upstream::UpstreamRequest to_upstream(const ScheduleCreateRequest& r) {
    JsonValue resources = JsonValue::array();
    resources.push_back(JsonValue::object().set("id", r.resource_id));
    JsonValue timeslot = JsonValue::object();
    timeslot.set("start", r.start);
    timeslot.set("end", r.end);
    JsonValue payload = JsonValue::object();
    payload.set("resources", std::move(resources));
    payload.set("timeslot", std::move(timeslot));
    return {http::verb::post, "/api/schedules", json_dump(payload)};
}

upstream::UpstreamRequest to_upstream(const ScheduleStatusUpdateRequest& r) {
    JsonValue payload = JsonValue::object();
    payload.set("id", r.schedule_id);
    payload.set("status", r.status);
    return {http::verb::put, "/api/schedules/" + std::to_string(r.schedule_id) + "/status", json_dump(payload)};
}

upstream::UpstreamRequest to_upstream(const ScheduleListQuery& q) {
    QueryParams params;
    params.add("page", std::to_string(q.page));
    params.add("sort", q.sort);
    return {http::verb::get, with_query("/api/schedules", params), std::string()};
}

}

#include <functional>
#include <iostream>
#include <string>
#include "gateway/Translate.h"
#include "gateway/GatewayError.h"

using namespace gateway;
namespace http = boost::beast::http;

// Returns the validation message fn raised, or "" when it raised nothing.
static std::string validation_message(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const GatewayError& e) {
        if (e.kind() != ErrorKind::Validation || e.status() != 400) return "<wrong kind>";
        return e.detail().as_string();
    }
    return std::string();
}

static int expect_rejected(const char* label, const std::function<void()>& fn, const std::string& want) {
    std::string got = validation_message(fn);
    if (got != want) {
        std::cerr << label << ": expected \"" << want << "\" got \"" << got << "\"\n";
        return 1;
    }
    return 0;
}

int main() {
    int failures = 0;

    // resource listing
    {
        auto up = to_upstream(parse_resource_list_query(QueryParams()));
        if (up.method != http::verb::get || up.target != "/api/resources?activeOnly=true" || !up.body.empty()) {
            std::cerr << "default resource list mismatch: " << up.target << "\n"; return 1;
        }
        auto filtered = to_upstream(parse_resource_list_query(QueryParams::parse("activeOnly=False&resourceType=25&serviceOffering=")));
        if (filtered.target != "/api/resources?activeOnly=false&resourceType=25") {
            std::cerr << "filtered resource list mismatch: " << filtered.target << "\n"; return 1;
        }
        // identical inbound queries produce identical upstream targets
        auto again = to_upstream(parse_resource_list_query(QueryParams::parse("activeOnly=False&resourceType=25&serviceOffering=")));
        if (again.target != filtered.target) { std::cerr << "resource list translation not deterministic\n"; return 1; }
        failures += expect_rejected("activeOnly", [] { parse_resource_list_query(QueryParams::parse("activeOnly=maybe")); },
                                    "activeOnly must be a boolean, got: maybe");
    }
    if (parse_bool_param("ON") != true || parse_bool_param("0") != false || parse_bool_param("")) {
        std::cerr << "parse_bool_param mismatch\n"; return 1;
    }

    // resource creation
    {
        auto up = to_upstream(parse_resource_create("{\"name\":\"Room A\",\"description\":\"Big room\",\"extra\":1}"));
        std::string want = "{\"name\":\"Room A\",\"description\":\"Big room\",\"externalId\":\"9\","
                           "\"resourceType\":{\"id\":25},\"serviceOffering\":{\"id\":8}}";
        if (up.method != http::verb::post || up.target != "/api/resources" || up.body != want) {
            std::cerr << "resource create payload mismatch: " << up.body << "\n"; return 1;
        }
        auto ext = parse_resource_create("{\"name\":\"n\",\"description\":\"d\",\"externalId\":\"abc\"}");
        if (ext.external_id != "abc") { std::cerr << "externalId override ignored\n"; return 1; }
        auto blank_ext = parse_resource_create("{\"name\":\"n\",\"description\":\"d\",\"externalId\":\"\"}");
        if (blank_ext.external_id != "9") { std::cerr << "empty externalId should default\n"; return 1; }
    }
    failures += expect_rejected("create: not json", [] { parse_resource_create("not json"); }, "Invalid JSON body");
    failures += expect_rejected("create: array body", [] { parse_resource_create("[1]"); }, "Invalid JSON body");
    failures += expect_rejected("create: no name", [] { parse_resource_create("{\"description\":\"d\"}"); }, "Resource name is required");
    failures += expect_rejected("create: empty name", [] { parse_resource_create("{\"name\":\"\",\"description\":\"d\"}"); }, "Resource name is required");
    failures += expect_rejected("create: no description", [] { parse_resource_create("{\"name\":\"n\"}"); }, "Resource description is required");
    failures += expect_rejected("create: numeric name", [] { parse_resource_create("{\"name\":5,\"description\":\"d\"}"); }, "name must be a string");

    // schedule creation
    {
        auto up = to_upstream(parse_schedule_create(
            "{\"resources\":[{\"id\":\"17\",\"name\":\"x\"},{\"id\":3}],\"timeslot\":{\"start\":\"2024-05-01T10:00:00Z\",\"end\":\"2024-05-01T11:00:00Z\",\"tz\":\"UTC\"},\"note\":\"drop me\"}"));
        std::string want = "{\"resources\":[{\"id\":17}],\"timeslot\":{\"start\":\"2024-05-01T10:00:00Z\",\"end\":\"2024-05-01T11:00:00Z\"}}";
        if (up.method != http::verb::post || up.target != "/api/schedules" || up.body != want) {
            std::cerr << "schedule create payload mismatch: " << up.body << "\n"; return 1;
        }
        auto trunc = parse_schedule_create("{\"resources\":[{\"id\":7.9}],\"timeslot\":{\"start\":1,\"end\":2}}");
        if (trunc.resource_id != 7) { std::cerr << "fractional id should truncate, got " << trunc.resource_id << "\n"; return 1; }
        auto padded = parse_schedule_create("{\"resources\":[{\"id\":\" 12 \"}],\"timeslot\":{\"start\":null,\"end\":null}}");
        if (padded.resource_id != 12) { std::cerr << "padded string id not accepted\n"; return 1; }
    }
    failures += expect_rejected("schedule: no resources", [] { parse_schedule_create("{\"timeslot\":{\"start\":1,\"end\":2}}"); },
                                "At least one resource is required");
    failures += expect_rejected("schedule: empty resources", [] { parse_schedule_create("{\"resources\":[],\"timeslot\":{}}"); },
                                "At least one resource is required");
    failures += expect_rejected("schedule: no timeslot", [] { parse_schedule_create("{\"resources\":[{\"id\":1}]}"); },
                                "Timeslot is required");
    failures += expect_rejected("schedule: scalar timeslot", [] { parse_schedule_create("{\"resources\":[{\"id\":1}],\"timeslot\":\"now\"}"); },
                                "Timeslot must be an object");
    failures += expect_rejected("schedule: missing id", [] { parse_schedule_create("{\"resources\":[{\"name\":\"x\"}],\"timeslot\":{\"start\":1,\"end\":2}}"); },
                                "Resource id is required");
    failures += expect_rejected("schedule: bad id", [] { parse_schedule_create("{\"resources\":[{\"id\":\"abc\"}],\"timeslot\":{\"start\":1,\"end\":2}}"); },
                                "Invalid resource id: abc");
    failures += expect_rejected("schedule: bool id", [] { parse_schedule_create("{\"resources\":[{\"id\":true}],\"timeslot\":{\"start\":1,\"end\":2}}"); },
                                "Invalid resource id: true");
    failures += expect_rejected("schedule: no end", [] { parse_schedule_create("{\"resources\":[{\"id\":1}],\"timeslot\":{\"start\":1}}"); },
                                "Timeslot start and end are required");

    // status update
    {
        auto up = to_upstream(parse_schedule_status_update("event_42", "{\"status\":\"CANCELLED\"}"));
        if (up.method != http::verb::put || up.target != "/api/schedules/42/status" || up.body != "{\"id\":42,\"status\":\"CANCELLED\"}") {
            std::cerr << "status update mismatch: " << up.target << " " << up.body << "\n"; return 1;
        }
        if (parse_schedule_id("42") != 42 || parse_schedule_id("event_7") != 7) { std::cerr << "schedule id parsing mismatch\n"; return 1; }
    }
    failures += expect_rejected("status: missing", [] { parse_schedule_status_update("1", "{}"); }, "Status is required");
    failures += expect_rejected("status: other", [] { parse_schedule_status_update("1", "{\"status\":\"CONFIRMED\"}"); }, "Only CANCELLED status is supported");
    failures += expect_rejected("status: lowercase", [] { parse_schedule_status_update("1", "{\"status\":\"cancelled\"}"); }, "Only CANCELLED status is supported");
    failures += expect_rejected("status: bad id", [] { parse_schedule_status_update("abc", "{\"status\":\"CANCELLED\"}"); }, "Invalid schedule ID format: abc");
    failures += expect_rejected("status: bad prefix", [] { parse_schedule_status_update("evt_3", "{\"status\":\"CANCELLED\"}"); }, "Invalid schedule ID format: evt_3");
    failures += expect_rejected("status: body before id", [] { parse_schedule_status_update("abc", "{\"status\":\"DONE\"}"); }, "Only CANCELLED status is supported");
    failures += expect_rejected("status: invalid body", [] { parse_schedule_status_update("1", "{"); }, "Invalid JSON body");

    // schedule listing
    {
        auto up = to_upstream(parse_schedule_list_query(QueryParams()));
        if (up.method != http::verb::get || up.target != "/api/schedules?page=1&sort=id%2Casc") {
            std::cerr << "default schedule list mismatch: " << up.target << "\n"; return 1;
        }
        auto custom = to_upstream(parse_schedule_list_query(QueryParams::parse("page=3&sort=start%2Cdesc")));
        if (custom.target != "/api/schedules?page=3&sort=start%2Cdesc") { std::cerr << "custom schedule list mismatch: " << custom.target << "\n"; return 1; }
    }
    failures += expect_rejected("page", [] { parse_schedule_list_query(QueryParams::parse("page=two")); }, "page must be an integer, got: two");

    if (failures) return 1;
    std::cout << "translate_unit ok\n";
    return 0;
}

#include <doctest/doctest.h>
#include <trellis/policy.hpp>

using namespace trellis;

TEST_CASE("parse_duration accepts compound durations") {
    CHECK(parse_duration("250ms").millis == 250);
    CHECK(parse_duration("1s").millis == 1000);
    CHECK(parse_duration("1m30s").millis == 90000);
    CHECK(parse_duration("1.5h").millis == 5400000);
    CHECK(parse_duration("2H").millis == 7200000);

    auto inf = parse_duration("infinity");
    CHECK(inf.ok);
    CHECK(inf.infinite);
    CHECK(parse_duration("Infinite").infinite);
}

TEST_CASE("parse_duration rejects malformed durations") {
    for (const char* bad : {"", "10", "ms", "1x", "1..2s", "-5s", "1s garbage"}) {
        CAPTURE(bad);
        auto r = parse_duration(bad);
        CHECK_FALSE(r.ok);
        CHECK_FALSE(r.error.empty());
    }
}

TEST_CASE("timeout_setting_to_string") {
    TimeoutSetting t;
    CHECK(timeout_setting_to_string(t) == "default");
    t.mode = TimeoutSetting::Mode::Disabled;
    CHECK(timeout_setting_to_string(t) == "disabled");
    t.mode = TimeoutSetting::Mode::Value;
    t.millis = 1500;
    CHECK(timeout_setting_to_string(t) == "1500ms");
}

TEST_CASE("build_retry_policy keeps valid settings") {
    StatusCollector status;
    RetryPolicySpec spec;
    spec.count = 3;
    spec.per_try_timeout = "2s";
    spec.retry_on = {"5xx", "reset"};

    auto policy = build_retry_policy(spec, status);
    CHECK(policy.count == 3);
    CHECK(policy.per_try_timeout.mode == TimeoutSetting::Mode::Value);
    CHECK(policy.per_try_timeout.millis == 2000);
    CHECK(policy.retry_on == "5xx,reset");
    CHECK_FALSE(status.has_warnings());
}

TEST_CASE("build_retry_policy falls back per field") {
    StatusCollector status;
    RetryPolicySpec spec;
    spec.count = -2;
    spec.per_try_timeout = "soon";
    spec.retry_on = {"sometimes"};

    auto policy = build_retry_policy(spec, status);
    CHECK(policy.count == 1);
    CHECK(policy.per_try_timeout.mode == TimeoutSetting::Mode::Default);
    CHECK(policy.retry_on == "5xx");

    auto conds = status.conditions();
    CHECK(conds.size() == 3);
    for (const auto& c : conds) {
        CHECK(c.reason == "RetryPolicyNotValid");
        CHECK(c.severity == Severity::Warning);
    }
    CHECK_FALSE(status.has_errors());
}

TEST_CASE("a zero retry count means one retry") {
    StatusCollector status;
    RetryPolicySpec spec;
    spec.count = 0;
    CHECK(build_retry_policy(spec, status).count == 1);
    CHECK_FALSE(status.has_warnings());
}

TEST_CASE("build_timeout_policy") {
    StatusCollector status;

    CHECK(build_timeout_policy(std::nullopt, status).response.mode == TimeoutSetting::Mode::Default);

    TimeoutPolicySpec spec;
    spec.response = "30s";
    spec.idle = "infinity";
    auto policy = build_timeout_policy(spec, status);
    CHECK(policy.response.millis == 30000);
    CHECK(policy.idle.mode == TimeoutSetting::Mode::Disabled);
    CHECK_FALSE(status.has_warnings());

    spec.response = "never";
    policy = build_timeout_policy(spec, status);
    CHECK(policy.response.mode == TimeoutSetting::Mode::Default);
    REQUIRE(status.conditions().size() == 1);
    CHECK(status.conditions()[0].reason == "TimeoutPolicyNotValid");
}

TEST_CASE("header names are canonicalized and validated") {
    CHECK(canonical_header_name("x-request-id") == "X-Request-Id");
    CHECK(canonical_header_name("HOST") == "Host");
    CHECK(is_valid_header_name("X-Custom_1"));
    CHECK_FALSE(is_valid_header_name(""));
    CHECK_FALSE(is_valid_header_name("bad header"));
    CHECK_FALSE(is_valid_header_name("x:y"));
}

TEST_CASE("build_headers_policy sets and removes headers") {
    StatusCollector status;
    HeadersPolicySpec spec;
    spec.set = {{"x-b", "1"}, {"x-a", "2"}};
    spec.remove = {"x-z", "X-Y"};

    auto policy = build_headers_policy(spec, true, "request", status);
    REQUIRE(policy.set.size() == 2);
    CHECK(policy.set[0].name == "X-B");
    CHECK(policy.set[1].name == "X-A");
    CHECK(policy.remove == std::vector<std::string>{"X-Y", "X-Z"});
    CHECK(policy.host_rewrite.empty());
    CHECK_FALSE(policy.empty());
    CHECK_FALSE(status.has_warnings());
}

TEST_CASE("build_headers_policy warns on bad entries") {
    StatusCollector status;
    HeadersPolicySpec spec;
    spec.set = {{"x-a", "1"}, {"X-A", "2"}, {"bad header", "3"}};
    spec.remove = {"x-gone", "x-gone"};

    auto policy = build_headers_policy(spec, true, "response", status);
    REQUIRE(policy.set.size() == 1);
    CHECK(policy.set[0].value == "1");
    CHECK(policy.remove == std::vector<std::string>{"X-Gone"});

    auto conds = status.conditions();
    CHECK(conds.size() == 3);
    CHECK(conds[0].message.find("response headers policy") == 0);
}

TEST_CASE("only request policies may rewrite Host") {
    HeadersPolicySpec spec;
    spec.set = {{"host", "internal.example.com"}};

    StatusCollector request_status;
    auto request = build_headers_policy(spec, true, "request", request_status);
    CHECK(request.host_rewrite == "internal.example.com");
    CHECK(request.set.empty());

    StatusCollector response_status;
    auto response = build_headers_policy(spec, false, "response", response_status);
    CHECK(response.host_rewrite.empty());
    CHECK(response.empty());
    CHECK(response_status.has_warnings());
}

TEST_CASE("build_tls_min_version") {
    StatusCollector status;
    CHECK(build_tls_min_version("", status) == "1.2");
    CHECK(build_tls_min_version("1.3", status) == "1.3");
    CHECK_FALSE(status.has_warnings());

    CHECK(build_tls_min_version("1.0", status) == "1.2");
    REQUIRE(status.conditions().size() == 1);
    CHECK(status.conditions()[0].type == ConditionType::TLSError);
    CHECK(status.conditions()[0].reason == "TLSVersionNotValid");
}

#include <catch2/catch.hpp>
#include <reroute/core/request_context.hpp>

using namespace reroute;
using Field = RequestProxy::Field;

TEST_CASE("RequestContext defaults", "[request_context]") {
    RequestContext request;
    REQUIRE(request.scheme() == "http");
    REQUIRE(request.host() == "localhost");
    REQUIRE(request.port() == 80);
    REQUIRE(request.script_name().empty());
    REQUIRE(request.path_info() == "/");
    REQUIRE(request.path_params().empty());
}

TEST_CASE("RequestProxy overrides", "[request_context]") {
    RequestContext request;
    request.set_host("example.com").set_path_info("/current").set_query_string("a=1");

    SECTION("no overrides reads through") {
        RequestProxy proxy(request, {});
        REQUIRE(proxy.host() == "example.com");
        REQUIRE(proxy.path_info() == "/current");
        REQUIRE(proxy.query_string() == "a=1");
    }

    SECTION("overridden fields win") {
        RequestProxy proxy(request, {{Field::PathInfo, "/people/1"}, {Field::QueryString, ""}});
        REQUIRE(proxy.host() == "example.com");
        REQUIRE(proxy.path_info() == "/people/1");
        REQUIRE(proxy.query_string().empty());
    }

    SECTION("port override is parsed") {
        RequestProxy proxy(request, {{Field::Port, "8080"}});
        REQUIRE(proxy.port() == 8080);
    }

    SECTION("malformed port falls back to the request") {
        RequestProxy proxy(request, {{Field::Port, "80a"}});
        REQUIRE(proxy.port() == 80);
    }
}

TEST_CASE("Reconstructing paths and URLs", "[request_context]") {
    RequestContext request;
    request.set_host("example.com").set_script_name("/app");

    SECTION("path with query") {
        RequestProxy proxy(request, {{Field::PathInfo, "/people"}, {Field::QueryString, "page=2"}});
        REQUIRE(reconstruct_path(proxy) == "/app/people?page=2");
    }

    SECTION("path without query") {
        RequestProxy proxy(request, {{Field::PathInfo, "/people"}});
        REQUIRE(reconstruct_path(proxy) == "/app/people");
    }

    SECTION("default http port is omitted") {
        RequestProxy proxy(request, {{Field::PathInfo, "/dashboard"}});
        REQUIRE(reconstruct_url(proxy) == "http://example.com/app/dashboard");
    }

    SECTION("default https port is omitted") {
        request.set_scheme("https").set_port(443);
        RequestProxy proxy(request, {});
        REQUIRE(reconstruct_url(proxy) == "https://example.com/app/");
    }

    SECTION("other ports are shown") {
        request.set_port(3000);
        RequestProxy proxy(request, {{Field::Host, "api.example.com"}});
        REQUIRE(reconstruct_url(proxy) == "http://api.example.com:3000/app/");
    }

    SECTION("https on port 80 shows the port") {
        request.set_scheme("https");
        RequestProxy proxy(request, {});
        REQUIRE(reconstruct_url(proxy) == "https://example.com:80/app/");
    }
}

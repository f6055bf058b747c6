/**
 * reroute - URL Generation Example
 *
 * Registers a small catalogue, then generates URLs by name and by
 * parameters, the way a view helper would.
 */

#include <reroute/reroute.hpp>
#include <iostream>
#include <vector>

using namespace reroute;

namespace {

void print(std::string_view label, const expected<std::string, Error>& url) {
    if (url) {
        std::cout << label << ": " << *url << "\n";
    } else {
        std::cout << label << ": " << url.error().to_string() << "\n";
    }
}

} // anonymous namespace

int main() {
    RouteSet routes(RouteSetOptions::from_env());

    // =========================================================================
    // Routes
    // =========================================================================

    std::vector<RouteDefinition> definitions = {
        {.path = "/people",
         .name = "people",
         .defaults = {{"controller", "people"}, {"action", "index"}}},

        // Optional format suffix
        {.path = "/people/:id(.:format)",
         .name = "person",
         .defaults = {{"controller", "people"}, {"action", "show"}},
         .requirements = {{"id", "[0-9]+"}}},

        {.path = "/people/:id/edit",
         .defaults = {{"controller", "people"}, {"action", "edit"}}},

        // Host condition
        {.path = "/account",
         .host = ":subdomain.example.com",
         .name = "account",
         .defaults = {{"controller", "accounts"}, {"action", "show"}}},

        {.path = "/dashboard", .name = "dashboard"},
    };

    for (auto& definition : definitions) {
        auto added = routes.add_route(std::move(definition));
        if (!added) {
            std::cerr << added.error().to_string() << "\n";
            return 1;
        }
    }

    routes.freeze();

    // =========================================================================
    // Generation
    // =========================================================================

    RequestContext request;
    request.set_host("example.com");

    print("people", routes.url(request, "people"));
    print("person", routes.url(request, "person", {{"id", 1}}));
    print("person.json", routes.url(request, "person", {{"id", 1}, {"format", "json"}}));
    print("edit", routes.url(request, {{"controller", "people"}, {"action", "edit"}, {"id", 1}}));
    print("dashboard", routes.url(request, "dashboard", {{"only_path", false}}));
    print("account", routes.url(request, "account", {{"subdomain", "alice"}, {"only_path", false}}));
    print("paged", routes.url(request, "people", {{"page", 2}}));
    print("invalid", routes.url(request, "person", {{"id", "abc"}}));

    return 0;
}

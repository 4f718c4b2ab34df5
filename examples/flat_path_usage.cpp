// flat_path usage example
// A flat C++ record mapped onto a nested JSON document.

#include <FlatJson/flat_json.hpp>
#include <FlatJson/error_formatting.hpp>
#include <iostream>
#include <string>
#include <variant>

using namespace FlatJson;
using namespace FlatJson::options;

struct Deployment {
    std::string name;
    A<std::string, flat_path<"server", "host">> host;
    A<int, flat_path<"network", "ports", "http">> port;
    A<bool, flat_path<"features", "tls", "enabled">, skip_if_default> tls;
};

struct Local {
    A<std::string, flat_path<"fs", "root">> root;
};

struct Remote {
    A<std::string, flat_path<"s3", "bucket">> bucket;
    A<std::string, flat_path<"auth", "region">> region;
};

struct Storage {
    A<std::variant<Local, Remote>, variant_tags<"local", "remote">> backend;
};

int main() {
    const char* json = R"({
        "name": "api",
        "server": {"host": "10.0.0.5"},
        "network": {"ports": {"http": 8080}},
        "features": {"tls": {"enabled": true}}
    })";

    Deployment d;
    auto result = Parse(d, std::string_view(json));
    if (!result) {
        std::cout << ParseResultToString<Deployment>(result, std::string_view(json)) << std::endl;
        return 1;
    }
    std::cout << d.name << " -> " << d.host.get() << ":" << d.port.get()
              << (d.tls.get() ? " (tls)" : "") << std::endl;

    d.tls = false;
    std::string out;
    if (auto res = Serialize(d, out); !res) {
        std::cout << SerializeResultToString(res) << std::endl;
        return 1;
    }
    // {"name":"api","server":{"host":"10.0.0.5"},"network":{"ports":{"http":8080}},"features":{"tls":{}}}
    std::cout << out << std::endl;

    const char* bad = R"({"network": {"ports": {"http": "eighty"}}})";
    Deployment broken;
    auto err = Parse(broken, std::string_view(bad));
    // When parsing $.network.ports.http, parsing error 'NON_NUMERIC_IN_NUMERIC_STORAGE': ...
    std::cout << ParseResultToString<Deployment>(err, std::string_view(bad)) << std::endl;

    // Each alternative of a tagged union is a record of its own, with its own chains
    Storage s;
    s.backend = Remote{{"logs"}, {"eu-west-1"}};
    std::string storageJson;
    if (!Serialize(s, storageJson)) {
        return 1;
    }
    // {"backend":{"remote":{"s3":{"bucket":"logs"},"auth":{"region":"eu-west-1"}}}}
    std::cout << storageJson << std::endl;

    return 0;
}

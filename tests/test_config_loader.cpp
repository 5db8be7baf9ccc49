#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace keygate;
using namespace std::chrono_literals;

namespace {

const std::string kMinimalToml = R"(
[upstream]
url = "http://127.0.0.1:8080"

[oidc]
discovery_url = "https://idp.example.com/realms/main"
client_id = "keygate"
client_secret = "s3cret"
redirection_url = "https://app.example.com"

[session]
encryption_key = "0123456789abcdef0123456789abcdef"
)";

bool has_error(const std::string& message, const std::string& fragment) {
    return message.find(fragment) != std::string::npos;
}

std::string write_temp(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

} // anonymous namespace

TEST_CASE("Minimal TOML config gets defaults", "[config]") {
    auto result = ConfigLoader::load_from_string(kMinimalToml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.server.host == "0.0.0.0");
    CHECK(cfg.server.port == 3000);
    CHECK_FALSE(cfg.server.tls.enabled);
    CHECK(cfg.upstream.url == "http://127.0.0.1:8080");
    CHECK(cfg.upstream.verify_tls);
    CHECK(cfg.oidc.client_id == "keygate");
    CHECK(cfg.oidc.scopes.empty());
    CHECK(cfg.oidc.bootstrap_timeout == 30s);
    CHECK(cfg.oidc.retry_interval == 3000ms);
    CHECK(cfg.oidc.retry_multiplier == 1.0);
    CHECK(cfg.session.cookie_name == "kc-state");
    CHECK(cfg.session.lifetime == 3600s);
    CHECK(cfg.session.secure_cookie);
    CHECK(cfg.logging.level == "info");
}

TEST_CASE("Full TOML config overrides every section", "[config]") {
    const std::string toml = kMinimalToml + R"(
[server]
host = "127.0.0.1"
port = 8443
max_connections = 64
read_timeout_seconds = 2.5

[server.tls]
cert_file = "/etc/keygate/tls.crt"
key_file = "/etc/keygate/tls.key"

[logging]
level = "debug"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.server.host == "127.0.0.1");
    CHECK(cfg.server.port == 8443);
    CHECK(cfg.server.max_connections == 64);
    CHECK(cfg.server.read_timeout == 2500ms);
    // A cert_file enables TLS unless enabled = false
    CHECK(cfg.server.tls.enabled);
    CHECK(cfg.server.tls.key_file == "/etc/keygate/tls.key");
    CHECK(cfg.logging.level == "debug");
}

TEST_CASE("OIDC retry settings", "[config]") {
    const std::string toml = R"(
[upstream]
url = "https://backend.internal"
verify_tls = false
connect_timeout_seconds = 1

[oidc]
discovery_url = "https://idp.example.com"
client_id = "keygate"
redirection_url = "https://app.example.com"
scopes = ["groups", "offline_access"]
skip_tls_verify = true
bootstrap_timeout_seconds = 5
retry_interval_seconds = 0.5
retry_multiplier = 2
retry_max_interval_seconds = 8
request_timeout_seconds = 3

[session]
encryption_key = "0123456789abcdef"
lifetime_seconds = 600
secure_cookie = false
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK_FALSE(cfg.upstream.verify_tls);
    CHECK(cfg.upstream.connect_timeout == 1000ms);
    CHECK(cfg.oidc.scopes == std::vector<std::string>{"groups", "offline_access"});
    CHECK(cfg.oidc.skip_tls_verify);
    CHECK(cfg.oidc.bootstrap_timeout == 5s);
    CHECK(cfg.oidc.retry_interval == 500ms);
    CHECK(cfg.oidc.retry_multiplier == 2.0);
    CHECK(cfg.oidc.retry_max_interval == 8000ms);
    CHECK(cfg.oidc.request_timeout == 3s);
    CHECK(cfg.session.lifetime == 600s);
    CHECK_FALSE(cfg.session.secure_cookie);
}

TEST_CASE("Environment variables are expanded in string values", "[config]") {
    ::setenv("KEYGATE_TEST_SECRET", "from-env", 1);
    ::setenv("KEYGATE_TEST_KEY", "fedcba9876543210", 1);
    ::unsetenv("KEYGATE_TEST_UNSET");

    const std::string toml = R"(
[upstream]
url = "http://127.0.0.1:8080"

[oidc]
discovery_url = "https://idp.example.com"
client_id = "keygate${KEYGATE_TEST_UNSET}"
client_secret = "${KEYGATE_TEST_SECRET}"
redirection_url = "https://app.example.com"
scopes = ["${KEYGATE_TEST_SECRET}"]

[session]
encryption_key = "${KEYGATE_TEST_KEY}"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.oidc.client_id == "keygate");
    CHECK(result.config.oidc.client_secret == "from-env");
    CHECK(result.config.oidc.scopes == std::vector<std::string>{"from-env"});
    CHECK(result.config.session.encryption_key == "fedcba9876543210");
}

TEST_CASE("Unclosed env substitution is an error", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[oidc]
client_id = "${BROKEN"
)");
    REQUIRE_FALSE(result.success);
    CHECK(has_error(result.error_message, "Unclosed env var"));
}

TEST_CASE("JSON config uses the same keys", "[config]") {
    const std::string json = R"({
        "server": {"port": 9000, "read_timeout_seconds": 1.5},
        "upstream": {"url": "ws://127.0.0.1:9001"},
        "oidc": {
            "discovery_url": "https://idp.example.com",
            "client_id": "keygate",
            "redirection_url": "https://app.example.com",
            "scopes": ["groups"],
            "retry_multiplier": 1.5
        },
        "session": {"encryption_key": "0123456789abcdef01234567", "lifetime_seconds": 120}
    })";
    auto result = ConfigLoader::load_from_json(json);
    REQUIRE(result.success);
    CHECK(result.config.server.port == 9000);
    CHECK(result.config.server.read_timeout == 1500ms);
    CHECK(result.config.upstream.url == "ws://127.0.0.1:9001");
    CHECK(result.config.oidc.scopes == std::vector<std::string>{"groups"});
    CHECK(result.config.oidc.retry_multiplier == 1.5);
    CHECK(result.config.session.lifetime == 120s);

    auto not_object = ConfigLoader::load_from_json("[1, 2]");
    CHECK_FALSE(not_object.success);
    auto broken = ConfigLoader::load_from_json("{\"server\": ");
    CHECK_FALSE(broken.success);
}

TEST_CASE("load_from_file picks the parser by extension", "[config]") {
    const auto toml_path = write_temp("keygate-config-test.toml", kMinimalToml);
    auto from_toml = ConfigLoader::load_from_file(toml_path);
    REQUIRE(from_toml.success);
    CHECK(from_toml.config.oidc.client_id == "keygate");

    const auto json_path = write_temp("keygate-config-test.JSON", R"({
        "upstream": {"url": "http://127.0.0.1:8080"},
        "oidc": {"discovery_url": "https://idp", "client_id": "json-client",
                 "redirection_url": "https://app"},
        "session": {"encryption_key": "0123456789abcdef"}
    })");
    auto from_json = ConfigLoader::load_from_file(json_path);
    REQUIRE(from_json.success);
    CHECK(from_json.config.oidc.client_id == "json-client");

    std::filesystem::remove(toml_path);
    std::filesystem::remove(json_path);

    auto missing = ConfigLoader::load_from_file("/nonexistent/keygate.toml");
    CHECK_FALSE(missing.success);
    auto missing_json = ConfigLoader::load_from_file("/nonexistent/keygate.json");
    CHECK_FALSE(missing_json.success);
}

TEST_CASE("Validation reports every problem", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[server]
port = 70000

[server.tls]
enabled = true

[upstream]
url = "backend:8080"

[oidc]
discovery_url = "idp"
retry_multiplier = 0.5

[session]
encryption_key = "too-short-secret"
cookie_name = ""
lifetime_seconds = 0
)");
    REQUIRE_FALSE(result.success);
    const auto& msg = result.error_message;
    CHECK(has_error(msg, "server.port"));
    CHECK(has_error(msg, "server.tls.cert_file"));
    CHECK(has_error(msg, "server.tls.key_file"));
    CHECK(has_error(msg, "upstream.url"));
    CHECK(has_error(msg, "oidc.discovery_url"));
    CHECK(has_error(msg, "oidc.client_id"));
    CHECK(has_error(msg, "oidc.redirection_url"));
    CHECK(has_error(msg, "oidc.retry_multiplier"));
    CHECK(has_error(msg, "session.cookie_name"));
    CHECK(has_error(msg, "session.lifetime_seconds"));
    // "too-short-secret" is 16 bytes, a valid AES-128 key
    CHECK_FALSE(has_error(msg, "session.encryption_key"));
}

TEST_CASE("Validation limits the upstream to web schemes", "[config]") {
    ProxyConfig cfg;
    cfg.oidc.discovery_url = "https://idp.example.com";
    cfg.oidc.client_id = "keygate";
    cfg.oidc.redirection_url = "https://app.example.com";
    cfg.session.encryption_key = "0123456789abcdef";

    for (const std::string url : {"http://b:1", "https://b", "ws://b:8080", "wss://b"}) {
        cfg.upstream.url = url;
        CHECK(ConfigLoader::validate_config(cfg).empty());
    }

    cfg.upstream.url = "ftp://backend";
    const auto errors = ConfigLoader::validate_config(cfg);
    REQUIRE(errors.size() == 1);
    CHECK(has_error(errors[0], "upstream.url scheme"));
}

TEST_CASE("Validation never echoes the session key", "[config]") {
    ProxyConfig cfg;
    cfg.upstream.url = "http://127.0.0.1:8080";
    cfg.oidc.discovery_url = "https://idp.example.com";
    cfg.oidc.client_id = "keygate";
    cfg.oidc.redirection_url = "https://app.example.com";
    cfg.session.encryption_key = "hunter2";

    const auto errors = ConfigLoader::validate_config(cfg);
    REQUIRE(errors.size() == 1);
    CHECK(has_error(errors[0], "session.encryption_key"));
    CHECK_FALSE(has_error(errors[0], "hunter2"));
}

#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace sqlmcp;

namespace {

const char* const kSqlEnvVars[] = {
    "SQL_SERVER_HOST", "SQL_SERVER_PORT", "SQL_SERVER_DATABASE", "SQL_DRIVER",
    "SQL_ENCRYPT", "SQL_TRUST_SERVER_CERTIFICATE", "SQL_CONNECTION_TIMEOUT",
    "SQL_APPLICATION_INTENT", "SQL_USERNAME", "SQL_PASSWORD",
    "SQL_ENFORCE_READONLY", "SQL_MAX_QUERY_CHARS", "SQL_MAX_ROWS", "SQL_QUERY_TIMEOUT",
};

// Clears the connection environment on entry and exit
struct CleanEnv {
    CleanEnv() { clear(); }
    ~CleanEnv() { clear(); }
    static void clear() {
        for (const char* name : kSqlEnvVars) ::unsetenv(name);
    }
};

bool has_error(const ConfigLoader::LoadResult& result, const std::string& needle) {
    return result.error_message.find(needle) != std::string::npos;
}

} // anonymous namespace

TEST_CASE("ConfigLoader: full TOML document", "[config]") {
    CleanEnv env;
    const std::string toml = R"(
[sql]
server = "db.internal\\PROD"
port = 1433
database = "Sales"
driver = "{ODBC Driver 18 for SQL Server}"
encrypt = false
trust_server_certificate = false
connection_timeout = 15
application_intent = "ReadOnly"
username = "svc_mcp"
password = "hunter2"
enforce_readonly = true
max_query_chars = 5000
max_rows = 200
query_timeout = 10

[server]
transport = "http"
host = "0.0.0.0"
port = 9090
workers = 8
max_queue = 16
shutdown_timeout_ms = 5000

[logging]
level = "warn"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.sql.server == "db.internal\\PROD");
    REQUIRE(cfg.sql.port.has_value());
    CHECK(*cfg.sql.port == "1433");
    CHECK(cfg.sql.database == "Sales");
    CHECK(cfg.sql.driver == "{ODBC Driver 18 for SQL Server}");
    CHECK_FALSE(cfg.sql.encrypt);
    CHECK_FALSE(cfg.sql.trust_server_certificate);
    CHECK(cfg.sql.connection_timeout_seconds == 15);
    REQUIRE(cfg.sql.application_intent.has_value());
    CHECK(*cfg.sql.application_intent == "ReadOnly");
    CHECK(cfg.sql.username == "svc_mcp");
    CHECK(cfg.sql.password == "hunter2");

    CHECK(cfg.policy.enforce_readonly);
    CHECK(cfg.policy.max_query_chars == 5000);
    CHECK(cfg.policy.max_rows == 200);
    CHECK(cfg.policy.query_timeout_seconds == 10);

    CHECK(cfg.server.transport == Transport::HTTP);
    CHECK(cfg.server.host == "0.0.0.0");
    CHECK(cfg.server.port == 9090);
    CHECK(cfg.server.workers == 8);
    CHECK(cfg.server.max_queue == 16);
    CHECK(cfg.server.shutdown_timeout_ms == 5000);

    CHECK(cfg.logging.level == "warn");
}

TEST_CASE("ConfigLoader: defaults when only the server is given", "[config]") {
    CleanEnv env;
    auto result = ConfigLoader::load_from_string("[sql]\nserver = \"localhost\"\n");
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.sql.database == "master");
    CHECK(cfg.sql.driver == "{ODBC Driver 17 for SQL Server}");
    CHECK(cfg.sql.encrypt);
    CHECK(cfg.sql.trust_server_certificate);
    CHECK(cfg.sql.connection_timeout_seconds == 30);
    CHECK_FALSE(cfg.sql.port.has_value());
    CHECK_FALSE(cfg.sql.application_intent.has_value());
    CHECK(cfg.sql.username.empty());

    CHECK(cfg.policy.enforce_readonly);
    CHECK(cfg.policy.max_query_chars == 20000);
    CHECK(cfg.policy.max_rows == 500);
    CHECK(cfg.policy.query_timeout_seconds == 30);

    CHECK(cfg.server.transport == Transport::STDIO);
    CHECK(cfg.logging.level == "info");
}

TEST_CASE("ConfigLoader: environment alone is enough", "[config][env]") {
    CleanEnv env;
    ::setenv("SQL_SERVER_HOST", "env-host", 1);
    ::setenv("SQL_SERVER_PORT", "14330", 1);
    ::setenv("SQL_SERVER_DATABASE", "Inventory", 1);
    ::setenv("SQL_ENCRYPT", "no", 1);
    ::setenv("SQL_USERNAME", "reader", 1);
    ::setenv("SQL_PASSWORD", "pw", 1);
    ::setenv("SQL_MAX_ROWS", "75", 1);
    ::setenv("SQL_QUERY_TIMEOUT", " 12 ", 1);
    ::setenv("SQL_ENFORCE_READONLY", "true", 1);

    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.sql.server == "env-host");
    REQUIRE(cfg.sql.port.has_value());
    CHECK(*cfg.sql.port == "14330");
    CHECK(cfg.sql.database == "Inventory");
    CHECK_FALSE(cfg.sql.encrypt);
    CHECK(cfg.sql.username == "reader");
    CHECK(cfg.sql.password == "pw");
    CHECK(cfg.policy.max_rows == 75);
    CHECK(cfg.policy.query_timeout_seconds == 12);
    CHECK(cfg.policy.enforce_readonly);
}

TEST_CASE("ConfigLoader: file values win over the environment", "[config][env]") {
    CleanEnv env;
    ::setenv("SQL_SERVER_HOST", "env-host", 1);
    ::setenv("SQL_MAX_ROWS", "75", 1);

    auto result = ConfigLoader::load_from_string("[sql]\nserver = \"file-host\"\nmax_rows = 10\n");
    REQUIRE(result.success);
    CHECK(result.config.sql.server == "file-host");
    CHECK(result.config.policy.max_rows == 10);
}

TEST_CASE("ConfigLoader: empty environment values count as absent", "[config][env]") {
    CleanEnv env;
    ::setenv("SQL_SERVER_HOST", "h", 1);
    ::setenv("SQL_SERVER_DATABASE", "", 1);
    ::setenv("SQL_MAX_ROWS", "", 1);

    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.sql.database == "master");
    CHECK(result.config.policy.max_rows == 500);
}

TEST_CASE("ConfigLoader: unparseable environment integers are ignored", "[config][env]") {
    CleanEnv env;
    ::setenv("SQL_SERVER_HOST", "h", 1);
    ::setenv("SQL_MAX_QUERY_CHARS", "lots", 1);

    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.policy.max_query_chars == 20000);
}

TEST_CASE("ConfigLoader: port may be a string", "[config]") {
    CleanEnv env;
    auto result = ConfigLoader::load_from_string("[sql]\nserver = \"h\"\nport = \"1444\"\n");
    REQUIRE(result.success);
    REQUIRE(result.config.sql.port.has_value());
    CHECK(*result.config.sql.port == "1444");
}

TEST_CASE("ConfigLoader: ${VAR} expansion in string values", "[config][env]") {
    CleanEnv env;
    ::setenv("TEST_SQLMCP_PASSWORD", "s3cret", 1);
    ::unsetenv("TEST_SQLMCP_MISSING_VAR");

    auto result = ConfigLoader::load_from_string(R"(
[sql]
server = "h"
password = "${TEST_SQLMCP_PASSWORD}"
username = "svc${TEST_SQLMCP_MISSING_VAR}"
)");
    REQUIRE(result.success);
    CHECK(result.config.sql.password == "s3cret");
    CHECK(result.config.sql.username == "svc");

    ::unsetenv("TEST_SQLMCP_PASSWORD");
}

TEST_CASE("ConfigLoader: unclosed ${ is a parse error", "[config][env]") {
    CleanEnv env;
    auto result = ConfigLoader::load_from_string("[sql]\nserver = \"h\"\npassword = \"${OOPS\"\n");
    REQUIRE_FALSE(result.success);
    CHECK(has_error(result, "Failed to parse config"));
    CHECK(has_error(result, "Unclosed env var substitution"));
}

TEST_CASE("ConfigLoader: missing server is reported", "[config][validation]") {
    CleanEnv env;
    auto result = ConfigLoader::load_from_string("");
    REQUIRE_FALSE(result.success);
    CHECK(has_error(result, "Config validation failed"));
    CHECK(has_error(result, "sql.server (or SQL_SERVER_HOST) is required"));
}

TEST_CASE("ConfigLoader: non-positive limits are reported together", "[config][validation]") {
    CleanEnv env;
    auto result = ConfigLoader::load_from_string(R"(
[sql]
server = "h"
max_rows = 0
max_query_chars = -1
query_timeout = 0
connection_timeout = -5
)");
    REQUIRE_FALSE(result.success);
    CHECK(has_error(result, "sql.max_rows must be > 0"));
    CHECK(has_error(result, "sql.max_query_chars must be > 0"));
    CHECK(has_error(result, "sql.query_timeout must be > 0"));
    CHECK(has_error(result, "sql.connection_timeout must be > 0"));
}

TEST_CASE("ConfigLoader: max_rows must fit a signed row count", "[config][validation]") {
    CleanEnv env;
    auto at_limit = ConfigLoader::load_from_string("[sql]\nserver = \"h\"\nmax_rows = 2147483647\n");
    REQUIRE(at_limit.success);
    CHECK(at_limit.config.policy.max_rows == 2147483647u);

    auto over = ConfigLoader::load_from_string("[sql]\nserver = \"h\"\nmax_rows = 2147483648\n");
    REQUIRE_FALSE(over.success);
    CHECK(has_error(over, "sql.max_rows must be <= 2147483647"));

    setenv("SQL_MAX_ROWS", "9000000000", 1);
    auto from_env = ConfigLoader::load_from_string("[sql]\nserver = \"h\"\n");
    REQUIRE_FALSE(from_env.success);
    CHECK(has_error(from_env, "sql.max_rows must be <="));
}

TEST_CASE("ConfigLoader: transport must be stdio or http", "[config][validation]") {
    CleanEnv env;
    auto result = ConfigLoader::load_from_string("[sql]\nserver = \"h\"\n[server]\ntransport = \"grpc\"\n");
    REQUIRE_FALSE(result.success);
    CHECK(has_error(result, "server.transport must be"));
}

TEST_CASE("ConfigLoader: HTTP settings are validated only for HTTP", "[config][validation]") {
    CleanEnv env;

    SECTION("bad port on stdio is ignored") {
        auto result = ConfigLoader::load_from_string(
            "[sql]\nserver = \"h\"\n[server]\ntransport = \"stdio\"\nport = 0\n");
        CHECK(result.success);
    }

    SECTION("bad port on http is rejected") {
        auto result = ConfigLoader::load_from_string(
            "[sql]\nserver = \"h\"\n[server]\ntransport = \"http\"\nport = 70000\n");
        REQUIRE_FALSE(result.success);
        CHECK(has_error(result, "server.port must be 1-65535"));
    }

    SECTION("TLS needs a certificate and key") {
        auto result = ConfigLoader::load_from_string(
            "[sql]\nserver = \"h\"\n[server]\ntransport = \"http\"\n[server.tls]\nenabled = true\n");
        REQUIRE_FALSE(result.success);
        CHECK(has_error(result, "server.tls.cert_file required"));
        CHECK(has_error(result, "server.tls.key_file required"));
    }
}

TEST_CASE("ConfigLoader: worker pool sizes must be positive", "[config][validation]") {
    CleanEnv env;
    auto result = ConfigLoader::load_from_string(
        "[sql]\nserver = \"h\"\n[server]\nworkers = 0\nmax_queue = -1\n");
    REQUIRE_FALSE(result.success);
    CHECK(has_error(result, "server.workers must be > 0"));
    CHECK(has_error(result, "server.max_queue must be > 0"));
}

TEST_CASE("ConfigLoader: logging level is checked", "[config][validation]") {
    CleanEnv env;
    auto ok = ConfigLoader::load_from_string("[sql]\nserver = \"h\"\n[logging]\nlevel = \"error\"\n");
    CHECK(ok.success);

    auto bad = ConfigLoader::load_from_string("[sql]\nserver = \"h\"\n[logging]\nlevel = \"verbose\"\n");
    REQUIRE_FALSE(bad.success);
    CHECK(has_error(bad, "logging.level"));
}

TEST_CASE("ConfigLoader: invalid TOML is a parse error", "[config]") {
    CleanEnv env;
    auto result = ConfigLoader::load_from_string("[sql\nserver = ");
    REQUIRE_FALSE(result.success);
    CHECK(has_error(result, "Failed to parse config"));
}

TEST_CASE("ConfigLoader: load_from_file", "[config]") {
    CleanEnv env;

    SECTION("missing file") {
        auto result = ConfigLoader::load_from_file("/nonexistent/sql_mcp.toml");
        REQUIRE_FALSE(result.success);
        CHECK(has_error(result, "Failed to load config"));
    }

    SECTION("file on disk") {
        const std::string path = "test_sqlmcp_config.toml";
        {
            std::ofstream out(path);
            out << "[sql]\nserver = \"disk-host\"\nmax_rows = 42\n";
        }
        auto result = ConfigLoader::load_from_file(path);
        std::remove(path.c_str());

        REQUIRE(result.success);
        CHECK(result.config.sql.server == "disk-host");
        CHECK(result.config.policy.max_rows == 42);
    }
}

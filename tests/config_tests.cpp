#include "test_common.hpp"

TEST_CASE("YAML config loading") {
    fs::path dir = make_temp_dir("cfg_yaml");
    fs::path cfg = dir / "cfg.yaml";
    write_file(cfg, "mode: rsync\n"
                    "port: 2222\n"
                    "verify: true\n"
                    "sentinel-value:\n"
                    "kill-grace: 5s\n");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--mode"] == "rsync");
    REQUIRE(opts["--port"] == "2222");
    REQUIRE(opts["--verify"] == "true");
    REQUIRE(opts.count("--sentinel-value"));
    REQUIRE(opts["--sentinel-value"].empty());
    REQUIRE(opts["--kill-grace"] == "5s");
    FS_REMOVE_ALL(dir);
}

TEST_CASE("YAML category sections are flattened") {
    fs::path dir = make_temp_dir("cfg_yaml_sections");
    fs::path cfg = dir / "cfg.yaml";
    write_file(cfg, "transfer:\n"
                    "  cipher: chacha20-poly1305@openssh.com\n"
                    "  ssh-bin: /opt/ssh\n"
                    "logging:\n"
                    "  log-level: debug\n"
                    "  json-log: yes\n");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--cipher"] == "chacha20-poly1305@openssh.com");
    REQUIRE(opts["--ssh-bin"] == "/opt/ssh");
    REQUIRE(opts["--log-level"] == "debug");
    REQUIRE(opts["--json-log"] == "yes");
    REQUIRE_FALSE(opts.count("--transfer"));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("JSON config loading") {
    fs::path dir = make_temp_dir("cfg_json");
    fs::path cfg = dir / "cfg.json";
    write_file(cfg, "{\n"
                    "  \"mode\": \"sftp\",\n"
                    "  \"port\": 2200,\n"
                    "  \"no-purge\": false,\n"
                    "  \"lock-file\": null,\n"
                    "  \"logging\": { \"log-rotate\": 3 }\n"
                    "}");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, err));
    REQUIRE(opts["--mode"] == "sftp");
    REQUIRE(opts["--port"] == "2200");
    REQUIRE(opts["--no-purge"] == "false");
    REQUIRE(opts["--lock-file"].empty());
    REQUIRE(opts["--log-rotate"] == "3");
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Missing config file is reported") {
    std::map<std::string, std::string> opts;
    std::string err;
    fs::path missing = fs::temp_directory_path() / "remotesync_no_such_config.yaml";
    REQUIRE_FALSE(load_yaml_config(missing.string(), opts, err));
    REQUIRE(err == "Failed to open file");
    err.clear();
    REQUIRE_FALSE(load_json_config(missing.string(), opts, err));
    REQUIRE(err == "Failed to open file");
}

TEST_CASE("YAML sequence value is rejected") {
    fs::path dir = make_temp_dir("cfg_yaml_seq");
    fs::path cfg = dir / "cfg.yaml";
    write_file(cfg, "port:\n  - 22\n  - 2222\n");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE_FALSE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(err.find("port") != std::string::npos);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("JSON nesting deeper than one section is rejected") {
    fs::path dir = make_temp_dir("cfg_json_deep");
    fs::path cfg = dir / "cfg.json";
    write_file(cfg, "{\n  \"logging\": {\n    \"log-level\": { \"x\": 1 }\n  }\n}");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE_FALSE(load_json_config(cfg.string(), opts, err));
    REQUIRE(err.find("log-level") != std::string::npos);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Malformed JSON is reported") {
    fs::path dir = make_temp_dir("cfg_json_bad");
    fs::path cfg = dir / "cfg.json";
    write_file(cfg, "{ \"mode\": ");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE_FALSE(load_json_config(cfg.string(), opts, err));
    REQUIRE_FALSE(err.empty());
    FS_REMOVE_ALL(dir);
}

TEST_CASE("JSON root must be an object") {
    fs::path dir = make_temp_dir("cfg_json_array");
    fs::path cfg = dir / "cfg.json";
    write_file(cfg, "[1, 2]");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE_FALSE(load_json_config(cfg.string(), opts, err));
    REQUIRE(err == "Root JSON value is not an object");
    FS_REMOVE_ALL(dir);
}

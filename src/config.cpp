#include "config.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace codebox {
using namespace std;
using namespace nlohmann;

size_t sandbox_config::max_artifact_bytes() const {
    return (size_t)max_artifact_size_mb << 20;
}

filesystem::path sandbox_config::scratch_root() const {
    if (scratch_dir.empty()) return filesystem::temp_directory_path();
    return scratch_dir;
}

configuration::configuration() {
    for (sandbox::language lang : sandbox::supported_languages())
        languages[lang] = sandbox::default_language_config(lang);
}

const sandbox::language_config &configuration::language(sandbox::language lang) const {
    auto it = languages.find(lang);
    if (it == languages.end())
        throw language_error("language " + sandbox::to_string(lang) + " is not configured");
    return it->second;
}

static bool is_plain_file_name(const string &name) {
    return !name.empty() && name != "." && name != ".." && name.find('/') == string::npos;
}

void configuration::validate() const {
    if (server.transport == "http")
        throw configuration_error("http transport is not available in this build, use stdio");
    if (server.transport != "stdio")
        throw configuration_error("unsupported transport: " + server.transport);
    if (server.http_port < 1 || server.http_port > 65535)
        throw configuration_error("server.http_port must be between 1 and 65535");
    if (server.workers < 1)
        throw configuration_error("server.workers must be at least 1");

    if (sandbox.backend != "docker" && sandbox.backend != "podman" && sandbox.backend != "local")
        throw configuration_error("unsupported backend: " + sandbox.backend);
    if (sandbox.backend == "local" && !sandbox.enable_local_backend)
        throw configuration_error("local backend provides no isolation and requires sandbox.enable_local_backend");
    if (sandbox.timeout_sec <= 0)
        throw configuration_error("sandbox.timeout_sec must be positive");
    if (sandbox.memory_mb <= 0)
        throw configuration_error("sandbox.memory_mb must be positive");
    if (sandbox.max_artifact_size_mb <= 0)
        throw configuration_error("sandbox.max_artifact_size_mb must be positive");
    if (sandbox.stop_grace_sec <= 0)
        throw configuration_error("sandbox.stop_grace_sec must be positive");
    if (sandbox.max_output_bytes == 0)
        throw configuration_error("sandbox.max_output_bytes must be positive");
    if (sandbox.pids_limit <= 0)
        throw configuration_error("sandbox.pids_limit must be positive");
    if (sandbox.file_size_limit_bytes <= 0)
        throw configuration_error("sandbox.file_size_limit_bytes must be positive");

    for (auto &[lang, config] : languages) {
        if (!is_plain_file_name(config.file_name))
            throw configuration_error(fmt::format("languages.{}.file_name must be a plain file name, got '{}'", sandbox::to_string(lang), config.file_name));
        if (config.run_cmd.empty())
            throw configuration_error(fmt::format("languages.{}.run_cmd must not be empty", sandbox::to_string(lang)));
        if (sandbox.backend != "local" && config.image.empty())
            throw configuration_error(fmt::format("languages.{}.image must not be empty", sandbox::to_string(lang)));
    }
}

void from_json(const json &j, server_config &config) {
    if (j.count("transport"))
        j.at("transport").get_to(config.transport);
    if (j.count("http_port"))
        j.at("http_port").get_to(config.http_port);
    if (j.count("workers"))
        j.at("workers").get_to(config.workers);
}

void from_json(const json &j, sandbox_config &config) {
    if (j.count("backend"))
        j.at("backend").get_to(config.backend);
    if (j.count("timeout_sec"))
        j.at("timeout_sec").get_to(config.timeout_sec);
    if (j.count("memory_mb"))
        j.at("memory_mb").get_to(config.memory_mb);
    if (j.count("max_artifact_size_mb"))
        j.at("max_artifact_size_mb").get_to(config.max_artifact_size_mb);
    if (j.count("network_enabled"))
        j.at("network_enabled").get_to(config.network_enabled);
    if (j.count("enable_local_backend"))
        j.at("enable_local_backend").get_to(config.enable_local_backend);
    if (j.count("scratch_dir"))
        config.scratch_dir = j.at("scratch_dir").get<string>();
    if (j.count("stop_grace_sec"))
        j.at("stop_grace_sec").get_to(config.stop_grace_sec);
    if (j.count("max_output_bytes"))
        j.at("max_output_bytes").get_to(config.max_output_bytes);
    if (j.count("pids_limit"))
        j.at("pids_limit").get_to(config.pids_limit);
    if (j.count("file_size_limit_bytes"))
        j.at("file_size_limit_bytes").get_to(config.file_size_limit_bytes);
    if (j.count("runtime_path"))
        j.at("runtime_path").get_to(config.runtime_path);
}

void from_json(const json &j, sandbox::language_config &config) {
    if (j.count("image"))
        j.at("image").get_to(config.image);
    if (j.count("file_name"))
        j.at("file_name").get_to(config.file_name);
    if (j.count("build_cmd"))
        j.at("build_cmd").get_to(config.build_cmd);
    if (j.count("run_cmd"))
        j.at("run_cmd").get_to(config.run_cmd);
    if (j.count("prefix_code"))
        j.at("prefix_code").get_to(config.prefix_code);
    if (j.count("postfix_code"))
        j.at("postfix_code").get_to(config.postfix_code);
    if (j.count("environment"))
        j.at("environment").get_to(config.environment);
    if (j.count("exclude_patterns"))
        j.at("exclude_patterns").get_to(config.exclude_patterns);
}

void from_json(const json &j, configuration &config) {
    if (j.count("server"))
        from_json(j.at("server"), config.server);
    if (j.count("sandbox"))
        from_json(j.at("sandbox"), config.sandbox);
    if (j.count("languages")) {
        for (auto &[name, value] : j.at("languages").items()) {
            // 缺省的字段保留内置默认值
            from_json(value, config.languages[sandbox::parse_language(name)]);
        }
    }
}

configuration parse_configuration(const json &j) {
    if (!j.is_object())
        throw configuration_error("configuration must be a JSON object");
    configuration config;
    try {
        from_json(j, config);
    } catch (json::exception &e) {
        throw configuration_error(string("malformed configuration: ") + e.what());
    } catch (language_error &e) {
        throw configuration_error(e.what());
    }
    config.validate();
    return config;
}

configuration load_configuration(const filesystem::path &path) {
    string content;
    try {
        content = read_file_content(path);
    } catch (system_error &e) {
        throw configuration_error(fmt::format("unable to read configuration file {}: {}", path.string(), e.what()));
    }

    json j;
    try {
        j = json::parse(content);
    } catch (json::parse_error &e) {
        throw configuration_error(fmt::format("configuration file {} is not valid JSON: {}", path.string(), e.what()));
    }
    return parse_configuration(j);
}

}  // namespace codebox

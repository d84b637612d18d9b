#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool is_json_path(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".json";
}

std::string validate(const AppConfig& cfg) {
    if (cfg.logging.log_file_size_mb < 0) {
        return "logging.log_file_size_mb must not be negative";
    }

    std::set<std::string> names;
    for (size_t i = 0; i < cfg.tasks.size(); ++i) {
        const auto& task = cfg.tasks[i];
        std::string where = "tasks[" + std::to_string(i) + "]";
        if (task.name.empty()) {
            return where + ": name is empty";
        }
        // The name becomes part of the process's log file name
        if (task.name.find('/') != std::string::npos || task.name.front() == '.') {
            return where + ": name '" + task.name + "' must not contain '/' or start with '.'";
        }
        if (!names.insert(task.name).second) {
            return where + ": duplicate name '" + task.name + "'";
        }
        if (task.start_path.empty()) {
            return where + " (" + task.name + "): start_path is empty";
        }
        if (task.start_delay_s < 0 || task.max_restarts < 0 || task.wait_for_exit_timeout_s < 0) {
            return where + " (" + task.name + "): negative delay, restart count or timeout";
        }
    }
    return "";
}

// ── YAML ────────────────────────────────────────────────────

// Absent or null keys fall back, present keys of the wrong type throw
template <typename T>
T read(const YAML::Node& node, const char* key, const T& fallback) {
    YAML::Node value = node[key];
    if (!value || value.IsNull()) return fallback;
    return value.as<T>();
}

AppConfig parse_yaml(const YAML::Node& root) {
    AppConfig cfg;
    if (!root.IsMap()) {
        throw YAML::Exception(YAML::Mark::null_mark(), "top level must be a map");
    }

    if (auto logging = root["logging"]) {
        cfg.logging.logs_folder = read(logging, "logs_folder", cfg.logging.logs_folder);
        cfg.logging.log_file_size_mb = read(logging, "log_file_size_mb", cfg.logging.log_file_size_mb);
        cfg.logging.log_debug_enabled = read(logging, "log_debug_enabled", cfg.logging.log_debug_enabled);
    }

    if (auto tasks = root["tasks"]) {
        if (!tasks.IsSequence()) {
            throw YAML::Exception(tasks.Mark(), "tasks must be a sequence");
        }
        for (const auto& t : tasks) {
            ProcessSpec spec;
            const std::vector<std::string> none;
            spec.name = read(t, "name", std::string());
            spec.start_path = read(t, "start_path", std::string());
            spec.start_args = read(t, "start_args", none);
            spec.start_delay_s = read(t, "start_delay_s", 0);
            spec.max_restarts = read(t, "max_restarts", 0);
            spec.wait_for_exit_timeout_s = read(t, "wait_for_exit_timeout_s", 0);
            spec.hide_window = read(t, "hide_window", false);
            spec.stop_path = read(t, "stop_path", std::string());
            spec.stop_args = read(t, "stop_args", none);
            cfg.tasks.push_back(std::move(spec));
        }
    }
    return cfg;
}

std::string emit_yaml(const AppConfig& cfg) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "logs_folder" << YAML::Value << cfg.logging.logs_folder;
    out << YAML::Key << "log_file_size_mb" << YAML::Value << cfg.logging.log_file_size_mb;
    out << YAML::Key << "log_debug_enabled" << YAML::Value << cfg.logging.log_debug_enabled;
    out << YAML::EndMap;

    out << YAML::Key << "tasks" << YAML::Value << YAML::BeginSeq;
    for (const auto& task : cfg.tasks) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << task.name;
        out << YAML::Key << "start_path" << YAML::Value << task.start_path;
        out << YAML::Key << "start_args" << YAML::Value << YAML::Flow << task.start_args;
        out << YAML::Key << "start_delay_s" << YAML::Value << task.start_delay_s;
        out << YAML::Key << "max_restarts" << YAML::Value << task.max_restarts;
        out << YAML::Key << "wait_for_exit_timeout_s" << YAML::Value << task.wait_for_exit_timeout_s;
        out << YAML::Key << "hide_window" << YAML::Value << task.hide_window;
        out << YAML::Key << "stop_path" << YAML::Value << task.stop_path;
        out << YAML::Key << "stop_args" << YAML::Value << YAML::Flow << task.stop_args;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
    return out.c_str();
}

// ── JSON ────────────────────────────────────────────────────

AppConfig parse_json(const json& root) {
    AppConfig cfg;
    if (!root.is_object()) {
        throw std::runtime_error("top level must be an object");
    }

    if (root.contains("logging")) {
        const auto& logging = root.at("logging");
        cfg.logging.logs_folder = logging.value("logs_folder", cfg.logging.logs_folder);
        cfg.logging.log_file_size_mb = logging.value("log_file_size_mb", cfg.logging.log_file_size_mb);
        cfg.logging.log_debug_enabled = logging.value("log_debug_enabled", cfg.logging.log_debug_enabled);
    }

    if (root.contains("tasks")) {
        const auto& tasks = root.at("tasks");
        if (!tasks.is_array()) {
            throw std::runtime_error("tasks must be an array");
        }
        for (const auto& t : tasks) {
            ProcessSpec spec;
            spec.name = t.value("name", "");
            spec.start_path = t.value("start_path", "");
            spec.start_args = t.value("start_args", std::vector<std::string>{});
            spec.start_delay_s = t.value("start_delay_s", 0);
            spec.max_restarts = t.value("max_restarts", 0);
            spec.wait_for_exit_timeout_s = t.value("wait_for_exit_timeout_s", 0);
            spec.hide_window = t.value("hide_window", false);
            spec.stop_path = t.value("stop_path", "");
            spec.stop_args = t.value("stop_args", std::vector<std::string>{});
            cfg.tasks.push_back(std::move(spec));
        }
    }
    return cfg;
}

std::string emit_json(const AppConfig& cfg) {
    json root;
    root["logging"] = {
        {"logs_folder", cfg.logging.logs_folder},
        {"log_file_size_mb", cfg.logging.log_file_size_mb},
        {"log_debug_enabled", cfg.logging.log_debug_enabled}
    };

    json tasks = json::array();
    for (const auto& task : cfg.tasks) {
        tasks.push_back({
            {"name", task.name},
            {"start_path", task.start_path},
            {"start_args", task.start_args},
            {"start_delay_s", task.start_delay_s},
            {"max_restarts", task.max_restarts},
            {"wait_for_exit_timeout_s", task.wait_for_exit_timeout_s},
            {"hide_window", task.hide_window},
            {"stop_path", task.stop_path},
            {"stop_args", task.stop_args}
        });
    }
    root["tasks"] = tasks;
    return root.dump(4) + "\n";
}

} // namespace

Config::Config() = default;

Config::~Config() = default;

std::string Config::default_config_path() {
    return "./pc-conf.json";
}

AppConfig Config::default_config() {
    AppConfig cfg;

    ProcessSpec sleeper;
    sleeper.name = "sleeper";
    sleeper.start_path = "/bin/sleep";
    sleeper.start_args = {"3600"};
    sleeper.max_restarts = 3;
    cfg.tasks.push_back(std::move(sleeper));

    ProcessSpec uptime;
    uptime.name = "uptime";
    uptime.start_path = "uptime";
    uptime.start_delay_s = 5;
    uptime.wait_for_exit_timeout_s = 10;
    uptime.hide_window = true;
    cfg.tasks.push_back(std::move(uptime));

    return cfg;
}

Config::LoadResult Config::load(const std::string& path) {
    if (path.empty() || !fs::exists(path)) {
        return {false, "config file not found: " + path};
    }

    AppConfig parsed;
    try {
        if (is_json_path(path)) {
            std::ifstream in(path);
            if (!in.is_open()) {
                return {false, "cannot open config file: " + path};
            }
            parsed = parse_json(json::parse(in));
        } else {
            parsed = parse_yaml(YAML::LoadFile(path));
        }
    } catch (const std::exception& e) {
        return {false, "cannot parse " + path + ": " + e.what()};
    }

    std::string err = validate(parsed);
    if (!err.empty()) {
        return {false, path + ": " + err};
    }

    config_ = std::move(parsed);
    return {true, ""};
}

bool Config::save(const std::string& path) const {
    if (path.empty()) return false;

    try {
        fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }

        std::ofstream fout(path);
        if (!fout.is_open()) return false;
        fout << (is_json_path(path) ? emit_json(config_) : emit_yaml(config_));
        return fout.good();
    } catch (...) {
        return false;
    }
}

bool Config::write_default(const std::string& path) {
    Config cfg;
    cfg.data() = default_config();
    return cfg.save(path);
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }

#include <acb/options.hpp>
#include <toml++/toml.hpp>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace acb {

static const std::set<std::string> k_top_level_keys = {
    "tag-name", "theme-file", "index-file", "app-title", "attributes",
    "no-cache", "destination", "working-dir", "verbose", "cache", "bundler",
};
static const std::set<std::string> k_cache_keys = {"dir", "namespace"};
static const std::set<std::string> k_bundler_keys = {"command", "timeout"};

static AcbError type_error(const std::string& key, const char* expected) {
    return AcbError{AcbError::Config,
        "option `" + key + "` must be " + expected};
}

static Status read_string(const toml::table& tbl, const std::string& prefix,
                          const char* key, std::string& out,
                          std::set<std::string>& seen) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    auto v = node->value_exact<std::string>();
    if (!v) return type_error(prefix + key, "a string");
    out = *v;
    seen.insert(prefix + key);
    return ok_status();
}

static Status read_bool(const toml::table& tbl, const std::string& prefix,
                        const char* key, bool& out, std::set<std::string>& seen) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    auto v = node->value_exact<bool>();
    if (!v) return type_error(prefix + key, "a boolean");
    out = *v;
    seen.insert(prefix + key);
    return ok_status();
}

static Status read_attributes(const toml::node& node,
                              std::optional<std::vector<Attribute>>& out) {
    const toml::array* arr = node.as_array();
    if (!arr) return type_error("attributes", "an array");

    std::vector<Attribute> attrs;
    for (const auto& elem : *arr) {
        if (auto s = elem.value_exact<std::string>()) {
            attrs.emplace_back(*s);
        } else if (const toml::table* tbl = elem.as_table()) {
            AttributeMap map;
            for (const auto& [key, val] : *tbl) {
                auto s = val.value_exact<std::string>();
                if (!s) {
                    return type_error("attributes." + std::string(key.str()),
                                      "a string");
                }
                map[std::string(key.str())] = *s;
            }
            attrs.emplace_back(std::move(map));
        } else {
            return type_error("attributes[]", "a string or an inline table");
        }
    }
    out = std::move(attrs);
    return ok_status();
}

static void collect_unknown(const toml::table& tbl, const std::string& prefix,
                            const std::set<std::string>& known,
                            std::vector<std::string>& out) {
    for (const auto& [key, val] : tbl) {
        std::string k(key.str());
        if (known.count(k) == 0) out.push_back(prefix + k);
    }
}

Result<BuilderOptions> BuilderOptions::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return AcbError{AcbError::Parse,
            std::string("options TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    BuilderOptions opts;
    auto& seen = opts.explicit_keys;

    ACB_TRY(read_string(doc, "", "tag-name", opts.tag_name, seen));
    ACB_TRY(read_string(doc, "", "theme-file", opts.theme_file, seen));
    ACB_TRY(read_string(doc, "", "index-file", opts.index_file, seen));
    ACB_TRY(read_string(doc, "", "app-title", opts.app_title, seen));
    ACB_TRY(read_bool(doc, "", "no-cache", opts.no_cache, seen));
    ACB_TRY(read_string(doc, "", "destination", opts.destination, seen));
    ACB_TRY(read_string(doc, "", "working-dir", opts.working_dir, seen));
    ACB_TRY(read_bool(doc, "", "verbose", opts.verbose, seen));

    if (const toml::node* attrs = doc.get("attributes")) {
        ACB_TRY(read_attributes(*attrs, opts.attributes));
        seen.insert("attributes");
    }

    // [cache]
    if (const toml::node* node = doc.get("cache")) {
        const toml::table* cache = node->as_table();
        if (!cache) return type_error("cache", "a table");
        ACB_TRY(read_string(*cache, "cache.", "dir", opts.cache.dir, seen));
        ACB_TRY(read_string(*cache, "cache.", "namespace", opts.cache.app_namespace, seen));
        collect_unknown(*cache, "cache.", k_cache_keys, opts.unknown_keys);
    }

    // [bundler]
    if (const toml::node* node = doc.get("bundler")) {
        const toml::table* bundler = node->as_table();
        if (!bundler) return type_error("bundler", "a table");

        if (const toml::node* cmd = bundler->get("command")) {
            const toml::array* arr = cmd->as_array();
            if (!arr) return type_error("bundler.command", "an array of strings");
            std::vector<std::string> argv;
            for (const auto& elem : *arr) {
                auto s = elem.value_exact<std::string>();
                if (!s) return type_error("bundler.command", "an array of strings");
                argv.push_back(*s);
            }
            opts.bundler.command = std::move(argv);
            seen.insert("bundler.command");
        }
        if (const toml::node* timeout = bundler->get("timeout")) {
            auto v = timeout->value_exact<int64_t>();
            if (!v) return type_error("bundler.timeout", "an integer");
            if (*v > std::numeric_limits<int>::max() || *v < std::numeric_limits<int>::min()) {
                return AcbError{AcbError::Config,
                    "option `bundler.timeout` is out of range: " + std::to_string(*v)};
            }
            opts.bundler.timeout_seconds = static_cast<int>(*v);
            seen.insert("bundler.timeout");
        }
        collect_unknown(*bundler, "bundler.", k_bundler_keys, opts.unknown_keys);
    }

    collect_unknown(doc, "", k_top_level_keys, opts.unknown_keys);

    return Result<BuilderOptions>::ok(std::move(opts));
}

Result<BuilderOptions> BuilderOptions::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return AcbError{AcbError::NotFound, "cannot open options file", "", path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto r = BuilderOptions::parse(ss.str());
    if (r.is_err() && r.error().file.empty()) {
        r.error().file = path;
    }
    return r;
}

void BuilderOptions::merge(const BuilderOptions& other) {
    auto set = [&](const char* key) { return other.explicit_keys.count(key) > 0; };

    if (set("tag-name")) tag_name = other.tag_name;
    if (set("theme-file")) theme_file = other.theme_file;
    if (set("index-file")) index_file = other.index_file;
    if (set("app-title")) app_title = other.app_title;
    if (set("attributes")) attributes = other.attributes;
    if (set("no-cache")) no_cache = other.no_cache;
    if (set("destination")) destination = other.destination;
    if (set("working-dir")) working_dir = other.working_dir;
    if (set("verbose")) verbose = other.verbose;
    if (set("cache.dir")) cache.dir = other.cache.dir;
    if (set("cache.namespace")) cache.app_namespace = other.cache.app_namespace;
    if (set("bundler.command")) bundler.command = other.bundler.command;
    if (set("bundler.timeout")) bundler.timeout_seconds = other.bundler.timeout_seconds;

    explicit_keys.insert(other.explicit_keys.begin(), other.explicit_keys.end());
    unknown_keys.insert(unknown_keys.end(),
                        other.unknown_keys.begin(), other.unknown_keys.end());
}

BuilderOptions BuilderOptions::effective(const std::optional<BuilderOptions>& global,
                                         const std::optional<BuilderOptions>& project) {
    BuilderOptions result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

std::optional<FoundAttribute> BuilderOptions::find_attribute(const std::string& name) const {
    if (!attributes.has_value()) return std::nullopt;

    for (const auto& attr : *attributes) {
        if (auto bare = std::get_if<std::string>(&attr)) {
            if (*bare == name) return FoundAttribute{name, std::nullopt};
        } else {
            const auto& map = std::get<AttributeMap>(attr);
            auto it = map.find(name);
            if (it != map.end()) return FoundAttribute{name, it->second};
        }
    }
    return std::nullopt;
}

ValidationReport BuilderOptions::validate() const {
    ValidationReport report;

    for (const auto& key : unknown_keys) {
        report.warnings.push_back("unknown option `" + key + "` is ignored");
    }

    if (destination.empty()) {
        report.errors.push_back("`destination` must not be empty");
    }

    if (attributes.has_value()) {
        for (size_t i = 0; i < attributes->size(); ++i) {
            const auto& attr = (*attributes)[i];
            if (auto bare = std::get_if<std::string>(&attr)) {
                if (bare->empty()) {
                    report.errors.push_back("attributes[" + std::to_string(i)
                                            + "] is an empty attribute name");
                }
                continue;
            }
            const auto& map = std::get<AttributeMap>(attr);
            if (map.empty()) {
                report.warnings.push_back("attributes[" + std::to_string(i)
                                          + "] is an empty table");
            }
            for (const auto& [k, v] : map) {
                if (k.empty()) {
                    report.errors.push_back("attributes[" + std::to_string(i)
                                            + "] has an empty attribute name");
                }
            }
        }
    }

    if (bundler.command.empty() || bundler.command.front().empty()) {
        report.errors.push_back("`bundler.command` must name a program");
    }
    if (bundler.timeout_seconds <= 0) {
        report.errors.push_back("`bundler.timeout` must be positive");
    }
    if (no_cache && (explicit_keys.count("cache.dir") || explicit_keys.count("cache.namespace"))) {
        report.warnings.push_back("[cache] settings have no effect with `no-cache`");
    }

    return report;
}

std::string global_options_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return "";
    return std::string(home) + "/.config/acb/config.toml";
}

} // namespace acb

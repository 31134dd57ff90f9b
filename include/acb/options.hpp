#pragma once

#include <acb/result.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace acb {

// One element of the `attributes` list: either a bare (boolean) attribute
// name or a map of attribute name -> value.
using AttributeMap = std::map<std::string, std::string>;
using Attribute = std::variant<std::string, AttributeMap>;

struct FoundAttribute {
    std::string name;
    std::optional<std::string> value;   // empty for bare attributes
};

// [cache] section
struct CacheConfig {
    std::string dir;                           // base dir override, empty = platform default
    std::string app_namespace = "api-console";
};

// [bundler] section
struct BundlerConfig {
    std::vector<std::string> command = {"node_modules/.bin/rollup", "-c", "rollup.config.js"};
    int timeout_seconds = 600;
};

struct ValidationReport {
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    bool ok() const { return errors.empty(); }
};

// Builder configuration, loaded from acb.toml.
//
// tag_name, theme_file, index_file, app_title and attributes influence the
// produced bundle and are the fields the build cache keys on.
struct BuilderOptions {
    std::string tag_name;
    std::string theme_file;
    std::string index_file;
    std::string app_title;
    std::optional<std::vector<Attribute>> attributes;
    bool no_cache = false;

    std::string destination = "build";
    std::string working_dir = ".";
    bool verbose = false;
    CacheConfig cache;
    BundlerConfig bundler;

    // Dotted keys present in the source document ("tag-name", "cache.dir").
    // Used by merge() so that only explicitly set values override.
    std::set<std::string> explicit_keys;
    std::vector<std::string> unknown_keys;

    static Result<BuilderOptions> parse(const std::string& toml_str);
    static Result<BuilderOptions> load(const std::string& path);

    // Values explicitly set in `other` override this
    void merge(const BuilderOptions& other);

    // global -> project
    static BuilderOptions effective(const std::optional<BuilderOptions>& global,
                                    const std::optional<BuilderOptions>& project);

    // First attribute named `name`, searching bare names and map keys in order
    std::optional<FoundAttribute> find_attribute(const std::string& name) const;

    ValidationReport validate() const;
};

// ~/.config/acb/config.toml, or "" when HOME is unset
std::string global_options_path();

} // namespace acb

#pragma once

#include <acb/options.hpp>
#include <string>
#include <vector>

namespace acb {

// One piece of cache-key material, in fixed field order.
struct KeyFragment {
    enum class State {
        Present,   // contributes name and value to the key
        Absent,    // field not set
        Omitted    // set, but could not be serialized; skipped
    };

    std::string name;   // "tn", "tf", "if", "at", "a"
    State state = State::Absent;
    std::string value;

    // <name>:<byte length>:<value>; for Present, "" otherwise
    std::string encode() const;
};

// Derives the build cache key from the options that shape the bundle output.
// Untracked options (destination, verbosity, no-cache, ...) never influence it.
class CacheKeyBuilder {
public:
    static std::vector<KeyFragment> fragments(const BuilderOptions& opts);
    static std::string material(const std::vector<KeyFragment>& fragments);

    // 64-char lowercase hex SHA-256 of material(fragments(opts))
    static std::string compute_key(const BuilderOptions& opts);

    // JSON array form of the attributes list; throws nlohmann::json exceptions
    static std::string serialize_attributes(const std::vector<Attribute>& attrs);
};

} // namespace acb

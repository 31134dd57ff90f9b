#include <acb/cache_key.hpp>
#include <acb/log.hpp>
#include <acb/sha256.hpp>
#include <nlohmann/json.hpp>

namespace acb {

std::string KeyFragment::encode() const {
    if (state != State::Present) return "";
    return name + ":" + std::to_string(value.size()) + ":" + value + ";";
}

static KeyFragment string_fragment(const char* name, const std::string& value) {
    KeyFragment f;
    f.name = name;
    if (!value.empty()) {
        f.state = KeyFragment::State::Present;
        f.value = value;
    }
    return f;
}

std::string CacheKeyBuilder::serialize_attributes(const std::vector<Attribute>& attrs) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& attr : attrs) {
        if (auto bare = std::get_if<std::string>(&attr)) {
            arr.push_back(*bare);
        } else {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& [k, v] : std::get<AttributeMap>(attr)) {
                obj[k] = v;
            }
            arr.push_back(std::move(obj));
        }
    }
    // Compact form; invalid UTF-8 makes dump() throw type_error 316
    return arr.dump();
}

std::vector<KeyFragment> CacheKeyBuilder::fragments(const BuilderOptions& opts) {
    std::vector<KeyFragment> out;
    out.reserve(5);
    out.push_back(string_fragment("tn", opts.tag_name));
    out.push_back(string_fragment("tf", opts.theme_file));
    out.push_back(string_fragment("if", opts.index_file));
    out.push_back(string_fragment("at", opts.app_title));

    KeyFragment attrs;
    attrs.name = "a";
    if (opts.attributes.has_value()) {
        try {
            attrs.value = serialize_attributes(*opts.attributes);
            attrs.state = KeyFragment::State::Present;
        } catch (const nlohmann::json::exception& e) {
            log::debug("attributes left out of the cache key: %s", e.what());
            attrs.state = KeyFragment::State::Omitted;
        }
    }
    out.push_back(std::move(attrs));

    return out;
}

std::string CacheKeyBuilder::material(const std::vector<KeyFragment>& fragments) {
    std::string out;
    for (const auto& f : fragments) {
        out += f.encode();
    }
    return out;
}

std::string CacheKeyBuilder::compute_key(const BuilderOptions& opts) {
    return SHA256::hash_hex(material(fragments(opts)));
}

} // namespace acb

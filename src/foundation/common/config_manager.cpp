#include "bkg/foundation/config_manager.hpp"

#include <algorithm>

namespace bkg::foundation {

GuardResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return loadNode(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return GuardResult<void>::err(
            GuardError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::Exception& e) {
        return GuardResult<void>::err(
            GuardError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

GuardResult<void> ConfigManager::loadString(std::string_view yaml) {
    try {
        return loadNode(YAML::Load(std::string(yaml)));
    } catch (const YAML::Exception& e) {
        return GuardResult<void>::err(
            GuardError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

GuardResult<void> ConfigManager::loadNode(const YAML::Node& root) {
    if (root && !root.IsNull() && !root.IsMap()) {
        return GuardResult<void>::err(
            GuardError(ErrorCode::ConfigLoadFailed, "config root must be a mapping"));
    }
    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root && root.IsMap()) {
        flatten("", root);
    }
    return GuardResult<void>::ok();
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::childNames(std::string_view prefix) const {
    std::string lead = std::string(prefix) + ".";
    std::vector<std::string> names;

    std::lock_guard lock(mutex_);
    for (const auto& [key, node] : entries_) {
        if (key.size() <= lead.size() || key.compare(0, lead.size(), lead) != 0) {
            continue;
        }
        auto rest = key.substr(lead.size());
        auto child = rest.substr(0, rest.find('.'));
        if (std::find(names.begin(), names.end(), child) == names.end()) {
            names.push_back(std::move(child));
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        // Leaf node (scalar, sequence, null) stored under its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace bkg::foundation

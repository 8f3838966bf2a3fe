// EN: ConfigManager - YAML loading with flattened sections, ${VAR} substitution, FGL_ overrides and rule checks.
// FR: ConfigManager - chargement YAML en sections aplaties, substitution ${VAR}, surcharges FGL_ et règles.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <type_traits>

extern char** environ;

namespace FGL {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string joinList(const std::vector<std::string>& items) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) joined += ", ";
        joined += item;
    }
    return joined;
}

std::vector<std::string> splitList(const std::string& raw) {
    std::vector<std::string> items;
    std::istringstream stream(raw);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::optional<double> numericValue(const ConfigValue& value) {
    if (auto i = value.tryAs<int>()) return static_cast<double>(*i);
    if (auto d = value.tryAs<double>()) return *d;
    return std::nullopt;
}

bool hasKind(const ConfigValue& value, ConfigManager::ValueKind kind) {
    switch (kind) {
        case ConfigManager::ValueKind::BOOLEAN: return value.tryAs<bool>().has_value();
        case ConfigManager::ValueKind::INTEGER: return value.tryAs<int>().has_value();
        case ConfigManager::ValueKind::NUMBER:  return numericValue(value).has_value();
        case ConfigManager::ValueKind::TEXT:    return value.tryAs<std::string>().has_value();
        case ConfigManager::ValueKind::LIST:    return value.tryAs<std::vector<std::string>>().has_value();
    }
    return false;
}

const char* kindPhrase(ConfigManager::ValueKind kind) {
    switch (kind) {
        case ConfigManager::ValueKind::BOOLEAN: return "a boolean";
        case ConfigManager::ValueKind::INTEGER: return "an integer";
        case ConfigManager::ValueKind::NUMBER:  return "a number";
        case ConfigManager::ValueKind::TEXT:    return "a string";
        case ConfigManager::ValueKind::LIST:    return "a list";
    }
    return "a value";
}

} // namespace

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }
    if (auto b = tryAs<bool>()) return *b ? "true" : "false";
    if (auto i = tryAs<int>()) return std::to_string(*i);
    if (auto d = tryAs<double>()) {
        std::ostringstream out;
        out << *d;
        return out.str();
    }
    if (auto list = tryAs<std::vector<std::string>>()) return "[" + joinList(*list) + "]";
    return std::get<std::string>(*value_);
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return ConfigValue();
    }
    return it->second;
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(entry.first);
    }
    return names;
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

std::string ConfigManager::valueKindToString(ValueKind kind) {
    switch (kind) {
        case ValueKind::BOOLEAN: return "bool";
        case ValueKind::INTEGER: return "int";
        case ValueKind::NUMBER:  return "number";
        case ValueKind::TEXT:    return "string";
        case ValueKind::LIST:    return "list";
    }
    return "unknown";
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    if (!std::filesystem::is_regular_file(filename)) {
        LOG_ERROR("config", "Configuration file not found: " + filename);
        return false;
    }

    try {
        YAML::Node document = YAML::LoadFile(filename);
        std::lock_guard<std::mutex> lock(mutex_);
        replaceSections(document);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Cannot parse " + filename + ": " + e.what());
        return false;
    }

    LOG_INFO("config", "Configuration loaded from: " + filename);
    return true;
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node document = YAML::Load(yaml_content);
        std::lock_guard<std::mutex> lock(mutex_);
        replaceSections(document);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", std::string("Cannot parse inline configuration: ") + e.what());
        return false;
    }

    LOG_DEBUG("config", "Configuration loaded from string");
    return true;
}

void ConfigManager::replaceSections(const YAML::Node& root) {
    sections_.clear();
    if (!root.IsMap()) {
        return;
    }

    for (const auto& block : root) {
        ConfigSection& section = sections_[block.first.as<std::string>()];
        if (block.second.IsMap()) {
            flattenInto(section, "", block.second);
        } else {
            // EN: "name: scalar" at the top level lands under the key "value"
            // FR: "nom: scalaire" au premier niveau est rangé sous la clé "value"
            section.set("value", fromYaml(block.second));
        }
    }
}

void ConfigManager::flattenInto(ConfigSection& section, const std::string& prefix, const YAML::Node& node) const {
    for (const auto& child : node) {
        const std::string key = prefix.empty() ? child.first.as<std::string>()
                                               : prefix + "." + child.first.as<std::string>();
        if (child.second.IsMap()) {
            flattenInto(section, key, child.second);
        } else {
            section.set(key, fromYaml(child.second));
        }
    }
}

ConfigValue ConfigManager::fromYaml(const YAML::Node& node) const {
    if (node.IsSequence()) {
        std::vector<std::string> items;
        for (const auto& item : node) {
            items.push_back(substituteReferences(item.as<std::string>()));
        }
        return ConfigValue(items);
    }
    if (!node.IsScalar()) {
        return ConfigValue();
    }

    // EN: yaml-cpp tags quoted scalars with "!"; "8080" stays text
    // FR: yaml-cpp marque les scalaires entre guillemets par "!"; "8080" reste du texte
    if (node.Tag() == "!") {
        return ConfigValue(substituteReferences(node.Scalar()));
    }
    return fromText(node.Scalar());
}

ConfigValue ConfigManager::fromText(const std::string& raw) const {
    if (raw == "true") return ConfigValue(true);
    if (raw == "false") return ConfigValue(false);

    static const std::regex integer_pattern(R"(^[-+]?[0-9]+$)");
    static const std::regex decimal_pattern(R"(^[-+]?[0-9]*\.[0-9]+([eE][-+]?[0-9]+)?$)");

    try {
        if (std::regex_match(raw, integer_pattern)) {
            return ConfigValue(std::stoi(raw));
        }
        if (std::regex_match(raw, decimal_pattern)) {
            return ConfigValue(std::stod(raw));
        }
    } catch (const std::out_of_range&) {
        // EN: Too large for int: kept as text
        // FR: Trop grand pour un int : conservé en texte
    }
    return ConfigValue(substituteReferences(raw));
}

std::string ConfigManager::substituteReferences(const std::string& text) const {
    std::string result;
    size_t cursor = 0;

    while (cursor < text.size()) {
        size_t open = text.find("${", cursor);
        size_t close = open == std::string::npos ? std::string::npos : text.find('}', open + 2);
        if (close == std::string::npos) {
            result.append(text, cursor, std::string::npos);
            break;
        }

        result.append(text, cursor, open - cursor);
        const std::string name = text.substr(open + 2, close - open - 2);
        const char* resolved = name.empty() ? nullptr : std::getenv(name.c_str());
        if (resolved && *resolved) {
            result += resolved;
        } else {
            // EN: Unset references stay visible so validation and logs show them
            // FR: Les références non définies restent visibles pour la validation et les logs
            result.append(text, open, close - open + 1);
        }
        cursor = close + 1;
    }
    return result;
}

void ConfigManager::emit(YAML::Emitter& out, const ConfigValue& value) {
    if (!value.storage()) {
        out << YAML::Null;
        return;
    }
    std::visit([&out](const auto& held) {
        using Held = std::decay_t<decltype(held)>;
        if constexpr (std::is_same_v<Held, std::vector<std::string>>) {
            out << YAML::BeginSeq;
            for (const auto& item : held) out << item;
            out << YAML::EndSeq;
        } else if constexpr (std::is_same_v<Held, std::string>) {
            // EN: Quote text so that "8080" or "true" reload as strings
            // FR: Texte entre guillemets pour que "8080" ou "true" se rechargent en chaînes
            out << YAML::DoubleQuoted << held;
        } else {
            out << held;
        }
    }, *value.storage());
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    YAML::Emitter out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out << YAML::BeginMap;
        for (const auto& [name, section] : sections_) {
            out << YAML::Key << name << YAML::Value << YAML::BeginMap;
            for (const auto& [key, value] : section.entries()) {
                out << YAML::Key << key << YAML::Value;
                emit(out, value);
            }
            out << YAML::EndMap;
        }
        out << YAML::EndMap;
    }

    std::ofstream file(filename, std::ios::trunc);
    if (!file || !(file << out.c_str() << '\n')) {
        LOG_ERROR("config", "Failed to save configuration: cannot write " + filename);
        return false;
    }

    LOG_INFO("config", "Configuration saved to: " + filename);
    return true;
}

size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    size_t applied = 0;

    for (char** entry = environ; entry && *entry; ++entry) {
        const std::string assignment(*entry);
        const size_t equals = assignment.find('=');
        if (equals == std::string::npos || assignment.rfind(prefix, 0) != 0) {
            continue;
        }

        // EN: <PREFIX><SECTION>__<KEY>; variables without the separator are not overrides
        // FR: <PREFIXE><SECTION>__<CLE>; les variables sans séparateur ne sont pas des surcharges
        const std::string name = assignment.substr(prefix.size(), equals - prefix.size());
        const size_t separator = name.find("__");
        if (separator == std::string::npos || separator == 0 || separator + 2 >= name.size()) {
            continue;
        }

        const std::string section = lowercase(name.substr(0, separator));
        const std::string key = lowercase(name.substr(separator + 2));
        const std::string raw = assignment.substr(equals + 1);

        set(section, key, raw.find(',') != std::string::npos ? ConfigValue(splitList(raw)) : fromText(raw));
        ++applied;
        LOG_INFO("config", "Environment override applied: " + section + "." + key);
    }

    return applied;
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_.insert(rules_.end(), rules.begin(), rules.end());
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : rules_) {
        const size_t dot = rule.key.find('.');
        if (dot == std::string::npos) {
            errors.push_back("Configuration rule " + rule.key + " is not of the form section.key");
            continue;
        }

        ConfigValue value = lookup(rule.key.substr(0, dot), rule.key.substr(dot + 1));
        if (!value.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }

        if (auto violation = checkRule(rule, value)) {
            errors.push_back(*violation);
        }
    }

    return errors.empty();
}

std::optional<std::string> ConfigManager::checkRule(const ValidationRule& rule, const ConfigValue& value) const {
    const std::string subject = "Configuration " + rule.key;

    if (!hasKind(value, rule.kind)) {
        return subject + " must be " + kindPhrase(rule.kind);
    }

    if (auto number = numericValue(value)) {
        if (rule.min_value && *number < *rule.min_value) {
            return subject + " must be >= " + std::to_string(*rule.min_value);
        }
        if (rule.max_value && *number > *rule.max_value) {
            return subject + " must be <= " + std::to_string(*rule.max_value);
        }
    }

    if (!rule.allowed_values.empty() &&
        std::find(rule.allowed_values.begin(), rule.allowed_values.end(), value.toString()) ==
            rule.allowed_values.end()) {
        return subject + " must be one of: " + joinList(rule.allowed_values);
    }

    return std::nullopt;
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(section, key);
}

ConfigValue ConfigManager::lookup(const std::string& section, const std::string& key) const {
    auto it = sections_.find(section);
    return it == sections_.end() ? ConfigValue() : it->second.get(key);
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sections_.find(section);
    return it != sections_.end() && it->second.has(key);
}

void ConfigManager::remove(const std::string& section, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sections_.find(section);
    if (it != sections_.end()) {
        it->second.remove(key);
    }
}

ConfigSection ConfigManager::getSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sections_.find(section);
    return it == sections_.end() ? ConfigSection() : it->second;
}

void ConfigManager::setSection(const std::string& section, const ConfigSection& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section] = config;
}

std::vector<std::string> ConfigManager::getSectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(sections_.size());
    for (const auto& entry : sections_) {
        names.push_back(entry.first);
    }
    return names;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    rules_.clear();
}

std::string ConfigManager::dump() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    for (const auto& [name, section] : sections_) {
        out << "[" << name << "]\n";
        for (const auto& [key, value] : section.entries()) {
            out << "  " << key << " = " << value.toString() << "\n";
        }
        out << "\n";
    }
    return out.str();
}

} // namespace FGL

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace YAML { class Node; class Emitter; }

namespace FGL {

// EN: One configuration entry: a boolean, an integer, a number, a string or a list of strings.
// FR: Une entrée de configuration : booléen, entier, nombre, chaîne ou liste de chaînes.
class ConfigValue {
public:
    using Storage = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(Storage(value)) {}

    ConfigValue(const char* value) : value_(Storage(std::string(value))) {}

    // EN: Throws std::runtime_error when unset and std::bad_variant_access on a kind mismatch.
    // FR: Lance std::runtime_error si vide et std::bad_variant_access si le type ne correspond pas.
    template<typename T>
    T as() const {
        if (!value_) {
            throw std::runtime_error("ConfigValue is empty");
        }
        return std::get<T>(*value_);
    }

    template<typename T>
    std::optional<T> tryAs() const {
        if (value_) {
            if (const T* held = std::get_if<T>(&*value_)) {
                return *held;
            }
        }
        return std::nullopt;
    }

    template<typename T>
    T asOrDefault(const T& fallback) const {
        std::optional<T> held = tryAs<T>();
        return held ? *held : fallback;
    }

    bool isValid() const { return value_.has_value(); }
    const std::optional<Storage>& storage() const { return value_; }

    // EN: Lists render as "[a, b]"; an unset value renders as "<empty>".
    // FR: Les listes s'affichent "[a, b]"; une valeur vide s'affiche "<empty>".
    std::string toString() const;

private:
    std::optional<Storage> value_;
};

// EN: Keys of one top-level YAML block. Nested maps arrive flattened ("backoff.multiplier").
// FR: Clés d'un bloc YAML de premier niveau. Les maps imbriquées arrivent aplaties ("backoff.multiplier").
class ConfigSection {
public:
    void set(const std::string& key, const ConfigValue& value) { entries_[key] = value; }
    ConfigValue get(const std::string& key) const;
    bool has(const std::string& key) const { return entries_.count(key) > 0; }
    void remove(const std::string& key) { entries_.erase(key); }

    // EN: Sorted key list
    // FR: Liste triée des clés
    std::vector<std::string> keys() const;

    const std::map<std::string, ConfigValue>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::map<std::string, ConfigValue> entries_;
};

// EN: Process-wide Forgeline settings. Values come from forgeline.yaml, then FGL_<SECTION>__<KEY>
// environment overrides, and are checked against the registered rules before the CLI starts work.
// FR: Réglages Forgeline du processus. Les valeurs viennent de forgeline.yaml puis des surcharges
// FGL_<SECTION>__<CLE>, et sont vérifiées par les règles enregistrées avant que la CLI ne démarre.
class ConfigManager {
public:
    enum class ValueKind {
        BOOLEAN,
        INTEGER,
        NUMBER,
        TEXT,
        LIST
    };

    // EN: Constraint on one "section.key" entry
    // FR: Contrainte sur une entrée "section.clé"
    struct ValidationRule {
        std::string key;
        ValueKind kind = ValueKind::TEXT;
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    static ConfigManager& getInstance();

    // EN: Both loaders replace every section. They return false on a missing file or bad YAML.
    // FR: Les deux chargeurs remplacent toutes les sections. Retour false si fichier absent ou YAML invalide.
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& yaml_content);
    bool saveToFile(const std::string& filename) const;

    // EN: FGL_ENGINE__MAX_HISTORY=10 sets engine.max_history; comma separated values become lists.
    // Returns the number of overrides applied.
    // FR: FGL_ENGINE__MAX_HISTORY=10 fixe engine.max_history; les valeurs à virgules deviennent des listes.
    // Retourne le nombre de surcharges appliquées.
    size_t loadEnvironmentOverrides(const std::string& prefix = "FGL_");

    void addValidationRules(const std::vector<ValidationRule>& rules);

    // EN: Collects one message per violated rule, in registration order
    // FR: Collecte un message par règle violée, dans l'ordre d'enregistrement
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& section, const std::string& key) const;
    void remove(const std::string& section, const std::string& key);

    ConfigSection getSection(const std::string& section) const;
    void setSection(const std::string& section, const ConfigSection& config);
    std::vector<std::string> getSectionNames() const;

    void reset();
    std::string dump() const;

    static std::string valueKindToString(ValueKind kind);

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    void replaceSections(const YAML::Node& root);
    void flattenInto(ConfigSection& section, const std::string& prefix, const YAML::Node& node) const;
    ConfigValue lookup(const std::string& section, const std::string& key) const;

    std::optional<std::string> checkRule(const ValidationRule& rule, const ConfigValue& value) const;

    ConfigValue fromYaml(const YAML::Node& node) const;
    ConfigValue fromText(const std::string& raw) const;
    std::string substituteReferences(const std::string& text) const;
    static void emit(YAML::Emitter& out, const ConfigValue& value);

    mutable std::mutex mutex_;
    std::map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> rules_;
};

#define CONFIG_GET_SECTION(section, key) FGL::ConfigManager::getInstance().get(section, key)
#define CONFIG_SET_SECTION(section, key, value) FGL::ConfigManager::getInstance().set(section, key, FGL::ConfigValue(value))

} // namespace FGL

#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>

namespace FGL {

// EN: Set of live secret values masked as "***" in any text. Values are reference counted
// because two stages may resolve the same credential at the same time.
// FR: Ensemble des valeurs secrètes vivantes masquées par "***" dans tout texte. Les valeurs
// sont comptées par référence car deux étapes peuvent résoudre le même identifiant en même temps.
class SecretRedactor {
public:
    static constexpr const char* kMask = "***";

    void add(const std::string& value);
    void remove(const std::string& value);
    void clear();

    bool empty() const;
    size_t size() const;

    std::string apply(const std::string& text) const;

private:
    // EN: Longest first so that a secret containing another one is masked as a whole
    // FR: Les plus longues d'abord pour qu'un secret en contenant un autre soit masqué en entier
    struct LongestFirst {
        bool operator()(const std::string& a, const std::string& b) const {
            return a.size() != b.size() ? a.size() > b.size() : a < b;
        }
    };

    mutable std::mutex mutex_;
    std::map<std::string, size_t, LongestFirst> values_;
};

} // namespace FGL

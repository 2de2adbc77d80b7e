#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace spool::config
{

enum class OptionKind
{
    Boolean,
    Integer,
    String,
    Path
};

enum class OptionValueType
{
    None,
    Boolean,
    Integer,
    String
};

class OptionValue
{
public:
    OptionValue() = default;
    OptionValue(bool value);
    OptionValue(std::int64_t value);
    OptionValue(std::string value);
    OptionValue(const char *value);

    OptionValueType type() const noexcept;

    bool isNull() const noexcept;
    bool toBool(bool fallback = false) const noexcept;
    std::int64_t toInteger(std::int64_t fallback = 0) const noexcept;
    std::string toString(const std::string &fallback = std::string()) const;

    bool operator==(const OptionValue &other) const noexcept;
    bool operator!=(const OptionValue &other) const noexcept { return !(*this == other); }

private:
    using Storage = std::variant<std::monostate, bool, std::int64_t, std::string>;
    Storage value;
};

struct OptionDefinition
{
    std::string key;
    OptionKind kind = OptionKind::String;
    OptionValue defaultValue;
    std::string displayName;
    std::string description;
    // Integer options are clamped into [minimum, maximum] when set.
    std::optional<std::int64_t> minimum;
    std::optional<std::int64_t> maximum;
};

class OptionRegistry
{
public:
    explicit OptionRegistry(std::string appId);

    const std::string &appId() const noexcept { return id; }

    void registerOption(const OptionDefinition &definition);
    bool hasOption(const std::string &key) const noexcept;

    // Returns false for keys that were never registered.
    bool set(const std::string &key, const OptionValue &value);
    void reset(const std::string &key);

    OptionValue get(const std::string &key) const;
    bool getBool(const std::string &key, bool fallback = false) const;
    std::int64_t getInteger(const std::string &key, std::int64_t fallback = 0) const;
    std::string getString(const std::string &key, const std::string &fallback = std::string()) const;
    std::filesystem::path getPath(const std::string &key) const;

    // On failure the reason is stored in *error when given.
    bool loadFromFile(const std::filesystem::path &filePath, std::string *error = nullptr);
    bool saveToFile(const std::filesystem::path &filePath) const;

    bool loadDefaults(std::string *error = nullptr);
    bool saveDefaults() const;
    std::filesystem::path defaultOptionsPath() const;

    std::vector<OptionDefinition> listRegisteredOptions() const;
    const OptionDefinition *definition(const std::string &key) const;

    static std::filesystem::path configRoot();
    static std::filesystem::path expandUser(const std::string &path);

private:
    const OptionDefinition *findDefinition(const std::string &key) const;
    OptionValue normalizeValue(const OptionDefinition &definition, const OptionValue &value) const;

    std::string id;
    std::unordered_map<std::string, OptionDefinition> definitions;
    std::unordered_map<std::string, OptionValue> overrides;
};

} // namespace spool::config

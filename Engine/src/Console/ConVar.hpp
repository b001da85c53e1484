#pragma once

#include <cstdint>
#include <string>
#include <functional>
#include <variant>
#include <vector>
#include <unordered_map>
#include <optional>
#include <mutex>

namespace Spraynet {

// ConVar flags
namespace ConVarFlags
{
    constexpr uint32_t NONE     = 0;
    constexpr uint32_t ARCHIVE  = 1 << 0;   // Saved to config file
    constexpr uint32_t NOTIFY   = 1 << 1;   // Logged when changed
    constexpr uint32_t HIDDEN   = 1 << 2;   // Hidden from findMatching
}

using ConVarValue = std::variant<int, float, bool, std::string>;

class ConVarBase;

using ConVarCallback = std::function<void(ConVarBase* cvar, const ConVarValue& oldValue, const ConVarValue& newValue)>;

class ConVarBase
{
protected:
    std::string m_name;
    std::string m_description;
    uint32_t m_flags;
    ConVarValue m_defaultValue;
    ConVarValue m_currentValue;
    std::vector<ConVarCallback> m_callbacks;

    // Bounds for numeric types
    std::optional<float> m_minValue;
    std::optional<float> m_maxValue;

public:
    ConVarBase(const std::string& name, int defaultValue, uint32_t flags, const std::string& description);
    ConVarBase(const std::string& name, float defaultValue, uint32_t flags, const std::string& description);
    ConVarBase(const std::string& name, bool defaultValue, uint32_t flags, const std::string& description);
    ConVarBase(const std::string& name, const char* defaultValue, uint32_t flags, const std::string& description);
    ConVarBase(const std::string& name, ConVarValue defaultValue, uint32_t flags, const std::string& description);
    virtual ~ConVarBase() = default;

    const std::string& getName() const { return m_name; }
    const std::string& getDescription() const { return m_description; }
    uint32_t getFlags() const { return m_flags; }
    bool hasFlag(uint32_t flag) const { return (m_flags & flag) != 0; }

    int getInt() const;
    float getFloat() const;
    bool getBool() const;
    const std::string& getString() const;
    const ConVarValue& getValue() const { return m_currentValue; }

    // Setters clamp numeric values to the bounds and fire callbacks
    bool setInt(int value);
    bool setFloat(float value);
    bool setBool(bool value);
    bool setString(const std::string& value);
    bool setFromString(const std::string& valueStr);

    void reset();

    void setBounds(float min, float max);
    bool hasBounds() const { return m_minValue.has_value() && m_maxValue.has_value(); }

    void addChangeCallback(ConVarCallback callback);

    std::string getValueString() const;

protected:
    void assign(ConVarValue value);
    void clamp(ConVarValue& value) const;
};

// ConVar Registry (Singleton)
class ConVarRegistry
{
public:
    static ConVarRegistry& get();

    void registerConVar(ConVarBase* cvar);

    ConVarBase* find(const std::string& name);
    std::vector<ConVarBase*> findMatching(const std::string& prefix);
    std::vector<ConVarBase*> getAll();

    // Config file: one "name value" per line, // comments, quoted values allowed
    bool loadConfig(const std::string& filepath);
    bool saveArchiveCvars(const std::string& filepath);

private:
    ConVarRegistry() = default;
    std::unordered_map<std::string, ConVarBase*> m_cvars;
    mutable std::mutex m_mutex;
};

class ConVarRegistrar
{
public:
    ConVarRegistrar(ConVarBase* cvar)
    {
        ConVarRegistry::get().registerConVar(cvar);
    }
};

} // namespace Spraynet

#define CONVAR(name, defaultVal, flags, description) \
    ::Spraynet::ConVarBase g_cvar_##name(#name, defaultVal, flags, description); \
    static ::Spraynet::ConVarRegistrar g_cvar_registrar_##name(&g_cvar_##name)

#define CONVAR_BOUNDED(name, defaultVal, minVal, maxVal, flags, description) \
    ::Spraynet::ConVarBase g_cvar_##name(#name, defaultVal, flags, description); \
    static struct ConVarInit_##name { \
        ConVarInit_##name() { \
            g_cvar_##name.setBounds(static_cast<float>(minVal), static_cast<float>(maxVal)); \
            ::Spraynet::ConVarRegistry::get().registerConVar(&g_cvar_##name); \
        } \
    } g_cvar_init_##name

#define EXTERN_CONVAR(name) extern ::Spraynet::ConVarBase g_cvar_##name

#define CVAR_PTR(name) ::Spraynet::ConVarRegistry::get().find(#name)

#define CVAR_INT(name) (CVAR_PTR(name) ? CVAR_PTR(name)->getInt() : 0)
#define CVAR_FLOAT(name) (CVAR_PTR(name) ? CVAR_PTR(name)->getFloat() : 0.0f)
#define CVAR_BOOL(name) (CVAR_PTR(name) ? CVAR_PTR(name)->getBool() : false)
#define CVAR_STRING(name) (CVAR_PTR(name) ? CVAR_PTR(name)->getString() : std::string())

namespace Spraynet {

// Force registration of the default cvars (call at startup)
void InitializeDefaultCVars();

} // namespace Spraynet

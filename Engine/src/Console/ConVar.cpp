#include "ConVar.hpp"
#include "Utils/Log.hpp"
#include <algorithm>
#include <fstream>
#include <cctype>
#include <type_traits>

namespace Spraynet {

namespace
{
    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string trim(const std::string& value)
    {
        size_t start = value.find_first_not_of(" \t\r");
        if (start == std::string::npos)
        {
            return "";
        }
        size_t end = value.find_last_not_of(" \t\r");
        return value.substr(start, end - start + 1);
    }
}

ConVarBase::ConVarBase(const std::string& name, ConVarValue defaultValue, uint32_t flags, const std::string& description)
    : m_name(name)
    , m_description(description)
    , m_flags(flags)
    , m_defaultValue(defaultValue)
    , m_currentValue(std::move(defaultValue))
{
}

ConVarBase::ConVarBase(const std::string& name, int defaultValue, uint32_t flags, const std::string& description)
    : ConVarBase(name, ConVarValue(defaultValue), flags, description)
{
}

ConVarBase::ConVarBase(const std::string& name, float defaultValue, uint32_t flags, const std::string& description)
    : ConVarBase(name, ConVarValue(defaultValue), flags, description)
{
}

ConVarBase::ConVarBase(const std::string& name, bool defaultValue, uint32_t flags, const std::string& description)
    : ConVarBase(name, ConVarValue(defaultValue), flags, description)
{
}

ConVarBase::ConVarBase(const std::string& name, const char* defaultValue, uint32_t flags, const std::string& description)
    : ConVarBase(name, ConVarValue(std::string(defaultValue)), flags, description)
{
}

int ConVarBase::getInt() const
{
    return std::visit([](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>)
        {
            try
            {
                return std::stoi(v);
            }
            catch (const std::exception&)
            {
                return 0;
            }
        }
        else
        {
            return static_cast<int>(v);
        }
    }, m_currentValue);
}

float ConVarBase::getFloat() const
{
    return std::visit([](const auto& v) -> float {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>)
        {
            try
            {
                return std::stof(v);
            }
            catch (const std::exception&)
            {
                return 0.0f;
            }
        }
        else
        {
            return static_cast<float>(v);
        }
    }, m_currentValue);
}

bool ConVarBase::getBool() const
{
    return std::visit([](const auto& v) -> bool {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>)
        {
            return !v.empty() && v != "0" && toLower(v) != "false";
        }
        else
        {
            return v != T{};
        }
    }, m_currentValue);
}

const std::string& ConVarBase::getString() const
{
    static const std::string s_empty;
    if (const auto* str = std::get_if<std::string>(&m_currentValue))
    {
        return *str;
    }
    return s_empty;
}

bool ConVarBase::setInt(int value)
{
    assign(value);
    return true;
}

bool ConVarBase::setFloat(float value)
{
    assign(value);
    return true;
}

bool ConVarBase::setBool(bool value)
{
    assign(value);
    return true;
}

bool ConVarBase::setString(const std::string& value)
{
    assign(value);
    return true;
}

bool ConVarBase::setFromString(const std::string& valueStr)
{
    // Parse according to the type of the default value
    try
    {
        if (std::holds_alternative<int>(m_defaultValue))
        {
            assign(std::stoi(valueStr));
        }
        else if (std::holds_alternative<float>(m_defaultValue))
        {
            assign(std::stof(valueStr));
        }
        else if (std::holds_alternative<bool>(m_defaultValue))
        {
            std::string lower = toLower(valueStr);
            assign(lower == "1" || lower == "true" || lower == "yes" || lower == "on");
        }
        else
        {
            assign(valueStr);
        }
    }
    catch (const std::exception&)
    {
        LOG_APP_WARN("ConVar {}: Invalid value '{}'", m_name, valueStr);
        return false;
    }
    return true;
}

void ConVarBase::reset()
{
    assign(m_defaultValue);
}

void ConVarBase::setBounds(float min, float max)
{
    m_minValue = min;
    m_maxValue = max;
    clamp(m_currentValue);
}

void ConVarBase::addChangeCallback(ConVarCallback callback)
{
    m_callbacks.push_back(std::move(callback));
}

std::string ConVarBase::getValueString() const
{
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>)
        {
            return v;
        }
        else if constexpr (std::is_same_v<T, bool>)
        {
            return v ? "1" : "0";
        }
        else
        {
            return std::to_string(v);
        }
    }, m_currentValue);
}

void ConVarBase::assign(ConVarValue value)
{
    clamp(value);

    ConVarValue oldValue = m_currentValue;
    m_currentValue = std::move(value);

    if (hasFlag(ConVarFlags::NOTIFY))
    {
        LOG_APP_INFO("ConVar {} changed to {}", m_name, getValueString());
    }

    for (auto& callback : m_callbacks)
    {
        callback(this, oldValue, m_currentValue);
    }
}

void ConVarBase::clamp(ConVarValue& value) const
{
    if (!hasBounds())
    {
        return;
    }

    if (auto* i = std::get_if<int>(&value))
    {
        *i = std::clamp(*i, static_cast<int>(m_minValue.value()), static_cast<int>(m_maxValue.value()));
    }
    else if (auto* f = std::get_if<float>(&value))
    {
        *f = std::clamp(*f, m_minValue.value(), m_maxValue.value());
    }
}

// ConVarRegistry implementation
ConVarRegistry& ConVarRegistry::get()
{
    static ConVarRegistry instance;
    return instance;
}

void ConVarRegistry::registerConVar(ConVarBase* cvar)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cvars.emplace(cvar->getName(), cvar);  // Duplicates keep the first registration
}

ConVarBase* ConVarRegistry::find(const std::string& name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_cvars.find(name);
    return (it != m_cvars.end()) ? it->second : nullptr;
}

std::vector<ConVarBase*> ConVarRegistry::findMatching(const std::string& prefix)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ConVarBase*> result;
    const std::string lowerPrefix = toLower(prefix);

    for (auto& [name, cvar] : m_cvars)
    {
        if (!cvar->hasFlag(ConVarFlags::HIDDEN) && toLower(name).rfind(lowerPrefix, 0) == 0)
        {
            result.push_back(cvar);
        }
    }

    std::sort(result.begin(), result.end(), [](ConVarBase* a, ConVarBase* b) {
        return a->getName() < b->getName();
    });
    return result;
}

std::vector<ConVarBase*> ConVarRegistry::getAll()
{
    return findMatching("");
}

bool ConVarRegistry::loadConfig(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        LOG_APP_DEBUG("Config file not found: {}", filepath);
        return false;
    }

    LOG_APP_INFO("Loading config: {}", filepath);

    std::string line;
    int lineNum = 0;
    while (std::getline(file, line))
    {
        lineNum++;

        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed.rfind("//", 0) == 0)
        {
            continue;
        }

        size_t spacePos = trimmed.find_first_of(" \t");
        if (spacePos == std::string::npos)
        {
            LOG_APP_WARN("{}:{}: Missing value for '{}'", filepath, lineNum, trimmed);
            continue;
        }

        std::string name = trimmed.substr(0, spacePos);
        std::string value = trim(trimmed.substr(spacePos + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
        {
            value = value.substr(1, value.size() - 2);
        }

        if (ConVarBase* cvar = find(name))
        {
            if (!cvar->setFromString(value))
            {
                LOG_APP_WARN("{}:{}: Bad value '{}' for '{}'", filepath, lineNum, value, name);
            }
        }
        else
        {
            LOG_APP_WARN("{}:{}: Unknown cvar '{}'", filepath, lineNum, name);
        }
    }
    return true;
}

bool ConVarRegistry::saveArchiveCvars(const std::string& filepath)
{
    std::ofstream file(filepath);
    if (!file.is_open())
    {
        LOG_APP_ERROR("Could not write config file: {}", filepath);
        return false;
    }

    file << "// Auto-generated config file\n\n";

    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& [name, cvar] : m_cvars)
    {
        if (!cvar->hasFlag(ConVarFlags::ARCHIVE))
        {
            continue;
        }

        const std::string value = cvar->getValueString();
        if (value.empty() || value.find(' ') != std::string::npos)
        {
            file << name << " \"" << value << "\"\n";
        }
        else
        {
            file << name << " " << value << "\n";
        }
    }

    LOG_APP_INFO("Config saved to {}", filepath);
    return true;
}

} // namespace Spraynet

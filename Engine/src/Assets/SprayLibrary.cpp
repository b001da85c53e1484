#include "SprayLibrary.hpp"
#include "Utils/Log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace Spraynet::Assets {

const std::array<const char*, 3> SprayLibrary::SUPPORTED_EXTENSIONS = { "png", "jpg", "jpeg" };

namespace {

bool readFile(const fs::path& path, std::vector<uint8_t>& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return false;
    }

    out = std::move(bytes);
    return true;
}

} // namespace

std::string SprayFile::getShortName(size_t length) const {
    return name.size() > length ? name.substr(0, length) + "..." : name;
}

bool SprayLibrary::isSupportedFile(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    if (ext.size() < 2) {
        return false;
    }

    ext = ext.substr(1);  // remove dot
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return std::any_of(SUPPORTED_EXTENSIONS.begin(), SUPPORTED_EXTENSIONS.end(),
        [&ext](const char* supported) { return ext == supported; });
}

size_t SprayLibrary::loadFromDirectory(const std::string& directory) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        LOG_APP_WARN("Spray directory '{}' does not exist", directory);
        m_files.clear();
        return 0;
    }

    std::vector<fs::path> candidates;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && isSupportedFile(it->path().string())) {
            candidates.push_back(it->path());
        }
    }
    if (ec) {
        LOG_APP_ERROR("Failed to enumerate spray directory '{}': {}", directory, ec.message());
    }

    std::sort(candidates.begin(), candidates.end());
    if (candidates.size() > MAX_FILE_SPRAYS) {
        candidates.resize(MAX_FILE_SPRAYS);
    }

    std::vector<SprayFile> files;
    for (const fs::path& path : candidates) {
        std::vector<uint8_t> bytes;
        if (!readFile(path, bytes)) {
            LOG_APP_ERROR("Could not read spray file '{}'", path.string());
            continue;
        }

        SprayFile file;
        file.name = path.filename().string();
        file.data = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
        files.push_back(std::move(file));
    }

    m_files = std::move(files);

    if (!m_current_name.empty() && getCurrent() == nullptr) {
        LOG_APP_WARN("Selected spray '{}' is no longer available", m_current_name);
        m_current_name.clear();
    }

    std::string names;
    for (const SprayFile& file : m_files) {
        names += names.empty() ? file.name : ", " + file.name;
    }
    LOG_APP_DEBUG("Loaded {} file sprays: {}", m_files.size(), names);

    return m_files.size();
}

bool SprayLibrary::select(const std::string& name) {
    auto it = std::find_if(m_files.begin(), m_files.end(),
        [&name](const SprayFile& file) { return file.name == name; });
    if (it == m_files.end()) {
        m_current_name.clear();
        return false;
    }

    m_current_name = name;
    return true;
}

const SprayFile* SprayLibrary::getCurrent() const {
    if (m_current_name.empty()) {
        return nullptr;
    }

    auto it = std::find_if(m_files.begin(), m_files.end(),
        [this](const SprayFile& file) { return file.name == m_current_name; });
    return it != m_files.end() ? &*it : nullptr;
}

} // namespace Spraynet::Assets

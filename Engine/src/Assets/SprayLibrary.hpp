#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Spraynet::Assets {

// An image file from the local spray folder, kept as raw bytes
struct SprayFile {
    static constexpr size_t SHORT_NAME_LENGTH = 8;

    std::string name;
    std::shared_ptr<const std::vector<uint8_t>> data;

    size_t size() const { return data ? data->size() : 0; }

    // "longfilename.png" -> "longfile..."
    std::string getShortName(size_t length = SHORT_NAME_LENGTH) const;
};

// Enumerates the spray folder and tracks the locally selected spray
class SprayLibrary {
public:
    static constexpr size_t MAX_FILE_SPRAYS = 5;
    static const std::array<const char*, 3> SUPPORTED_EXTENSIONS;

    // Replaces the list with up to MAX_FILE_SPRAYS supported files (sorted by name).
    // Unreadable files are logged and skipped. The selection is kept if the file is still present.
    size_t loadFromDirectory(const std::string& directory);

    const std::vector<SprayFile>& getFiles() const { return m_files; }

    bool select(const std::string& name);
    const SprayFile* getCurrent() const;

    static bool isSupportedFile(const std::string& path);

private:
    std::vector<SprayFile> m_files;
    std::string m_current_name;
};

} // namespace Spraynet::Assets

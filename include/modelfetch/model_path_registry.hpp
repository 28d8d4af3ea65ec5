#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace modelfetch {

inline constexpr const char kFolderEntryPrefix[] = "__folder__path__";

/**
 * Host-side registry mapping a model category ("checkpoints", "loras", ...)
 * to the directories that hold it.
 */
class ModelPathRegistry {
public:
    virtual ~ModelPathRegistry() = default;

    // std::nullopt when the category is unknown.
    [[nodiscard]] virtual std::optional<std::vector<std::string>>
    resolveCategoryDirectories(const std::string& category) const = 0;

    [[nodiscard]] virtual bool isModelDirectory(const std::string& directory) const = 0;
    [[nodiscard]] virtual std::vector<std::string> categories() const = 0;
    [[nodiscard]] virtual std::vector<std::string> listFiles(const std::string& category) const = 0;
    [[nodiscard]] virtual std::vector<std::string> supportedExtensions() const = 0;
};

// Directories of `category` that count as model directories, in order.
[[nodiscard]] std::vector<std::string> modelDirectories(const ModelPathRegistry& registry,
                                                        const std::string& category);

// listFiles() with "__folder__path__<category>" prepended whenever the
// category has a model directory, even if the listing itself is empty.
[[nodiscard]] std::vector<std::string> listWithFolderEntry(const ModelPathRegistry& registry,
                                                           const std::string& category);

// Sorted names of categories with at least one model directory.
[[nodiscard]] std::vector<std::string> folderNames(const ModelPathRegistry& registry);

/**
 * Registry backed by an explicit category table, usually filled from the
 * [paths] section of the config file. A directory is a model directory when
 * its path contains "/models/". Legacy category names ("unet", "clip") are
 * mapped to their current name before any lookup.
 */
class FolderPathRegistry final : public ModelPathRegistry {
public:
    void setCategory(const std::string& category, std::vector<std::string> directories);
    void setSupportedExtensions(std::vector<std::string> extensions);
    void setAlias(const std::string& legacy, const std::string& current);

    // The current name for `category`; unchanged when it has no alias.
    [[nodiscard]] std::string mapLegacy(const std::string& category) const;

    [[nodiscard]] std::optional<std::vector<std::string>>
    resolveCategoryDirectories(const std::string& category) const override;
    [[nodiscard]] bool isModelDirectory(const std::string& directory) const override;
    [[nodiscard]] std::vector<std::string> categories() const override;
    [[nodiscard]] std::vector<std::string> listFiles(const std::string& category) const override;
    [[nodiscard]] std::vector<std::string> supportedExtensions() const override;

private:
    [[nodiscard]] bool hasSupportedExtension(const std::string& filename) const;

    std::map<std::string, std::vector<std::string>> categories_;
    std::map<std::string, std::string> aliases_;
    std::vector<std::string> extensions_;
};

} // namespace modelfetch

#include "modelfetch/model_path_registry.hpp"
#include "modelfetch/logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>
#include <set>
#include <system_error>
#include <utility>

namespace modelfetch {

namespace fs = std::filesystem;

std::vector<std::string> modelDirectories(const ModelPathRegistry& registry, const std::string& category) {
    std::vector<std::string> result;
    const auto directories = registry.resolveCategoryDirectories(category);
    if (!directories) {
        return result;
    }
    std::copy_if(directories->begin(), directories->end(), std::back_inserter(result),
                 [&registry](const std::string& dir) { return registry.isModelDirectory(dir); });
    return result;
}

std::vector<std::string> listWithFolderEntry(const ModelPathRegistry& registry, const std::string& category) {
    std::vector<std::string> listing = registry.listFiles(category);
    if (!modelDirectories(registry, category).empty()) {
        listing.insert(listing.begin(), kFolderEntryPrefix + category);
    }
    return listing;
}

std::vector<std::string> folderNames(const ModelPathRegistry& registry) {
    std::vector<std::string> names;
    for (const auto& category : registry.categories()) {
        if (!modelDirectories(registry, category).empty()) {
            names.push_back(category);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

void FolderPathRegistry::setCategory(const std::string& category, std::vector<std::string> directories) {
    categories_[category] = std::move(directories);
}

void FolderPathRegistry::setSupportedExtensions(std::vector<std::string> extensions) {
    for (auto& ext : extensions) {
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }
    extensions_ = std::move(extensions);
}

void FolderPathRegistry::setAlias(const std::string& legacy, const std::string& current) {
    aliases_[legacy] = current;
}

std::string FolderPathRegistry::mapLegacy(const std::string& category) const {
    const auto it = aliases_.find(category);
    return it == aliases_.end() ? category : it->second;
}

std::optional<std::vector<std::string>>
FolderPathRegistry::resolveCategoryDirectories(const std::string& category) const {
    const auto it = categories_.find(mapLegacy(category));
    if (it == categories_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool FolderPathRegistry::isModelDirectory(const std::string& directory) const {
    return directory.find("/models/") != std::string::npos;
}

std::vector<std::string> FolderPathRegistry::categories() const {
    std::vector<std::string> names;
    names.reserve(categories_.size());
    for (const auto& entry : categories_) {
        names.push_back(entry.first);
    }
    return names;
}

std::vector<std::string> FolderPathRegistry::listFiles(const std::string& category) const {
    std::set<std::string> files;
    const auto it = categories_.find(mapLegacy(category));
    if (it == categories_.end()) {
        return {};
    }

    for (const auto& directory : it->second) {
        std::error_code ec;
        if (!fs::is_directory(directory, ec)) {
            continue;
        }
        fs::recursive_directory_iterator walker(directory, fs::directory_options::follow_directory_symlink, ec);
        for (; !ec && walker != fs::recursive_directory_iterator(); walker.increment(ec)) {
            std::error_code entry_ec;
            if (!walker->is_regular_file(entry_ec) || !hasSupportedExtension(walker->path().filename().string())) {
                continue;
            }
            files.insert(fs::relative(walker->path(), directory, entry_ec).generic_string());
        }
        if (ec) {
            detail::log(spdlog::level::warn, "Cannot list {}: {}", directory, ec.message());
        }
    }
    return {files.begin(), files.end()};
}

std::vector<std::string> FolderPathRegistry::supportedExtensions() const { return extensions_; }

bool FolderPathRegistry::hasSupportedExtension(const std::string& filename) const {
    if (extensions_.empty()) {
        return true;
    }
    std::string ext = fs::path(filename).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(extensions_.begin(), extensions_.end(), ext) != extensions_.end();
}

} // namespace modelfetch

#include "docsync/store/table.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

namespace docsync::store {
namespace fs = std::filesystem;

Result<std::string> insert_folder(FolderTable& table, const std::string& folder_name) {
    Folder folder{make_uuid_v4(), folder_name};
    auto result = table.insert_entity(folder);
    if (result.is_error()) {
        return Err<std::string>(result.error());
    }
    return Ok(std::move(folder.folder_id));
}

Result<std::string> add_file(ResourceTable& table, const std::string& name, Bytes blob) {
    Resource resource{make_uuid_v4(), name, std::move(blob)};
    auto result = table.insert_entity(resource);
    if (result.is_error()) {
        return Err<std::string>(result.error());
    }
    return Ok(std::move(resource.id));
}

Result<std::size_t> load_images(ResourceTable& table, const fs::path& images_dir) {
    std::error_code ec;
    if (!fs::is_directory(images_dir, ec)) {
        return Err<std::size_t>(ErrorCode::Io, "Images directory does not exist: " + images_dir.string());
    }

    // Sorted so repeated runs insert in the same order
    std::vector<fs::path> files;
    for (fs::directory_iterator it(images_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name.empty() || name.front() == '.') {
            continue;
        }
        if (it->is_regular_file(ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return Err<std::size_t>(ErrorCode::Io, "Failed to read directory " + images_dir.string() + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());

    std::size_t added = 0;
    for (const auto& path : files) {
        std::ifstream input(path, std::ios::binary);
        if (!input) {
            return Err<std::size_t>(ErrorCode::Io, "Failed to read file: " + path.string());
        }
        Bytes content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());

        const auto file_name = path.filename().string();
        spdlog::info("[{}] adding file {} ({} bytes)", table.dataset(), file_name, content.size());
        auto result = add_file(table, file_name, std::move(content));
        if (result.is_error()) {
            return Err<std::size_t>(ErrorCode::Io,
                                    "Failed to add " + path.string() + ": " + result.error().describe());
        }
        ++added;
    }
    return Ok(added);
}

} // namespace docsync::store
